#pragma once
#include "menu/MenuPage.hpp"
#include "menu/Style.hpp"
#include <ftxui/dom/elements.hpp>
#include <cstddef>
#include <string>

// Turns a header and a page into one styled text block using ftxui.
// The result carries the terminal escape sequences for each line's style.
class MenuRenderer {
public:
    explicit MenuRenderer(bool colors = true)
        : colors_(colors) {}

    void setColors(bool colors) { colors_ = colors; }
    bool colors() const { return colors_; }

    // Header lines (split on '\n') followed by one numbered line per
    // element. `page` may be null, giving a header-only frame. The frame
    // is never clipped: it has one row per line and is at least `width`
    // columns wide, wider if a line needs it.
    std::string renderLines(const std::string& header,
                            const MenuPage* page,
                            int width) const;

    // " 1: Banana"
    static std::string formatLine(size_t index, const std::string& label);

    // Maps Style bits onto ftxui decorators. Unknown bits are ignored.
    static ftxui::Decorator decorate(Style style);

private:
    bool colors_;
};
