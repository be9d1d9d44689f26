#include "menu/Style.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <utility>

namespace {

struct NamedStyle {
    const char* name;
    Style       style;
};

// Base bits first, in bit order, so styleToString() lists them in a
// stable order. Composites and aliases follow.
const NamedStyle kStyleNames[] = {
    {"bold",              Style::Bold},
    {"dimmed",            Style::Dimmed},
    {"italic",            Style::Italic},
    {"underscore",        Style::Underscore},
    {"double_underscore", Style::DoubleUnderscore},
    {"overline",          Style::Overline},
    {"flashing",          Style::Flashing},
    {"inverted",          Style::Inverted},
    {"strikethrough",     Style::Strikethrough},
    {"black",             Style::Black},
    {"red",               Style::Red},
    {"green",             Style::Green},
    {"yellow",            Style::Yellow},
    {"blue",              Style::Blue},
    {"purple",            Style::Purple},
    {"lightblue",         Style::LightBlue},
    {"gray_bright",       Style::GrayBright},
    {"red_bright",        Style::RedBright},
    {"green_bright",      Style::GreenBright},
    {"yellow_bright",     Style::YellowBright},
    {"blue_bright",       Style::BlueBright},
    {"purple_bright",     Style::PurpleBright},
    {"turquoise",         Style::Turquoise},
    {"white_bright",      Style::WhiteBright},
    {"bg_gray",           Style::BgGray},
    {"bg_red",            Style::BgRed},
    {"bg_green",          Style::BgGreen},
    {"bg_yellow",         Style::BgYellow},
    {"bg_cyan",           Style::BgCyan},
    {"bg_purple",         Style::BgPurple},
    {"bg_turquoise",      Style::BgTurquoise},
    {"bg_white",          Style::BgWhite},

    {"regular",              Style::Regular},
    {"underscore_intersect", Style::UnderscoreIntersect},
    {"selected",             Style::Selected},
    {"dim",                  Style::Dimmed},
    {"underline",            Style::Underscore},
    {"blink",                Style::Flashing},
    {"light_blue",           Style::LightBlue},
};

constexpr size_t kBaseStyleCount = 32;

std::string normalise(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == ' ') c = '_';
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

std::optional<Style> styleFromString(const std::string& name) {
    auto key = normalise(name);
    for (auto& entry : kStyleNames) {
        if (key == entry.name) return entry.style;
    }
    return std::nullopt;
}

Style styleFromNames(const std::vector<std::string>& names) {
    Style result = Style::Regular;
    for (auto& n : names) {
        auto s = styleFromString(n);
        if (!s) {
            spdlog::warn("Unknown style name '{}' ignored", n);
            continue;
        }
        result |= *s;
    }
    return result;
}

std::string styleToString(Style style) {
    if (style == Style::Regular) return "regular";

    std::string out;
    for (size_t i = 0; i < kBaseStyleCount; i++) {
        if (!has(style, kStyleNames[i].style)) continue;
        if (!out.empty()) out += '|';
        out += kStyleNames[i].name;
    }
    return out;
}
