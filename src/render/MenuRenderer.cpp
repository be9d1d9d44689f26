#include "render/MenuRenderer.hpp"
#include <ftxui/screen/screen.hpp>
#include <ftxui/screen/string.hpp>
#include <ftxui/screen/color.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

using namespace ftxui;

namespace {

struct ColorMapping {
    Style style;
    Color color;
};

// In bit order: the lowest set bit wins when several colours are set
const ColorMapping kForeground[] = {
    {Style::Black,        Color::Black},
    {Style::Red,          Color::Red},
    {Style::Green,        Color::Green},
    {Style::Yellow,       Color::Yellow},
    {Style::Blue,         Color::Blue},
    {Style::Purple,       Color::Magenta},
    {Style::LightBlue,    Color::Cyan},
    {Style::GrayBright,   Color::GrayDark},
    {Style::RedBright,    Color::RedLight},
    {Style::GreenBright,  Color::GreenLight},
    {Style::YellowBright, Color::YellowLight},
    {Style::BlueBright,   Color::BlueLight},
    {Style::PurpleBright, Color::MagentaLight},
    {Style::Turquoise,    Color::CyanLight},
    {Style::WhiteBright,  Color::White},
};

const ColorMapping kBackground[] = {
    {Style::BgGray,      Color::GrayDark},
    {Style::BgRed,       Color::RedLight},
    {Style::BgGreen,     Color::GreenLight},
    {Style::BgYellow,    Color::YellowLight},
    {Style::BgCyan,      Color::Cyan},
    {Style::BgPurple,    Color::MagentaLight},
    {Style::BgTurquoise, Color::CyanLight},
    {Style::BgWhite,     Color::White},
};

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
    return lines;
}

} // namespace

std::string MenuRenderer::formatLine(size_t index, const std::string& label) {
    std::ostringstream out;
    out << std::setw(2) << index << ": " << label;
    return out.str();
}

Decorator MenuRenderer::decorate(Style style) {
    Decorator d = nothing;
    auto add = [&d](Decorator next) { d = d | next; };

    if (has(style, Style::Bold))             add(bold);
    if (has(style, Style::Dimmed))           add(dim);
    if (has(style, Style::Italic))           add(italic);
    if (has(style, Style::Underscore))       add(underlined);
    if (has(style, Style::DoubleUnderscore)) add(underlinedDouble);
    if (has(style, Style::Flashing))         add(blink);
    if (has(style, Style::Inverted))         add(inverted);
    if (has(style, Style::Strikethrough))    add(strikethrough);
    // Overline has no ftxui decorator

    for (auto& m : kForeground) {
        if (has(style, m.style)) {
            add(color(m.color));
            break;
        }
    }
    for (auto& m : kBackground) {
        if (has(style, m.style)) {
            add(bgcolor(m.color));
            break;
        }
    }
    return d;
}

std::string MenuRenderer::renderLines(const std::string& header,
                                      const MenuPage* page,
                                      int width) const
{
    Elements lines;
    int widest = 0;
    auto addLine = [&](const std::string& content, Decorator style) {
        widest = std::max(widest, string_width(content));
        lines.push_back(text(content) | style);
    };

    for (auto& l : splitLines(header))
        addLine(l, nothing);

    if (page) {
        size_t index = 1;
        for (auto& el : page->elements())
            addLine(formatLine(index++, el->label()),
                    colors_ ? decorate(el->style()) : nothing);
    }

    if (lines.empty()) return {};

    // Never clip: one row per line, and at least as wide as the widest
    // line. Longer lines are left to wrap at the terminal.
    int rows = static_cast<int>(lines.size());
    auto doc = vbox(std::move(lines));
    auto screen = Screen::Create(Dimension::Fixed(std::max({width, widest, 1})),
                                 Dimension::Fixed(rows));
    Render(screen, doc);
    return screen.ToString();
}
