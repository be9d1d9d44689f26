#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Visual attributes for a menu line. Every base member owns one bit, so
// styles compose with | and are tested with has(). Any value is accepted;
// bits the renderer does not know about are ignored.
enum class Style : uint32_t {
    Regular          = 0,

    // Text attributes
    Bold             = 1u << 0,
    Dimmed           = 1u << 1,
    Italic           = 1u << 2,
    Underscore       = 1u << 3,
    DoubleUnderscore = 1u << 4,
    Overline         = 1u << 5,
    Flashing         = 1u << 6,
    Inverted         = 1u << 7,
    Strikethrough    = 1u << 8,

    // Foreground colours
    Black            = 1u << 9,
    Red              = 1u << 10,
    Green            = 1u << 11,
    Yellow           = 1u << 12,
    Blue             = 1u << 13,
    Purple           = 1u << 14,
    LightBlue        = 1u << 15,
    GrayBright       = 1u << 16,
    RedBright        = 1u << 17,
    GreenBright      = 1u << 18,
    YellowBright     = 1u << 19,
    BlueBright       = 1u << 20,
    PurpleBright     = 1u << 21,
    Turquoise        = 1u << 22,
    WhiteBright      = 1u << 23,

    // Background colours
    BgGray           = 1u << 24,
    BgRed            = 1u << 25,
    BgGreen          = 1u << 26,
    BgYellow         = 1u << 27,
    BgCyan           = 1u << 28,
    BgPurple         = 1u << 29,
    BgTurquoise      = 1u << 30,
    BgWhite          = 1u << 31,

    // Composites
    UnderscoreIntersect = Underscore | Overline,
    Selected            = Bold | Inverted,
};

constexpr uint32_t kStyleForegroundMask = 0x00FFFE00u;  // Black..WhiteBright
constexpr uint32_t kStyleBackgroundMask = 0xFF000000u;  // BgGray..BgWhite

constexpr Style operator|(Style a, Style b) {
    return static_cast<Style>(static_cast<uint32_t>(a) |
                              static_cast<uint32_t>(b));
}

constexpr Style operator&(Style a, Style b) {
    return static_cast<Style>(static_cast<uint32_t>(a) &
                              static_cast<uint32_t>(b));
}

inline Style& operator|=(Style& a, Style b) {
    a = a | b;
    return a;
}

// True if any bit of `attribute` is set in `style`
constexpr bool has(Style style, Style attribute) {
    return (static_cast<uint32_t>(style) &
            static_cast<uint32_t>(attribute)) != 0;
}

// True if every bit of `attributes` is set in `style`
constexpr bool hasAll(Style style, Style attributes) {
    return (static_cast<uint32_t>(style) &
            static_cast<uint32_t>(attributes)) ==
           static_cast<uint32_t>(attributes);
}

// Case-insensitive lookup of a style constant by name ("bold", "bg_white",
// "underscore_intersect", ...). Hyphens and underscores are interchangeable.
std::optional<Style> styleFromString(const std::string& name);

// Combine a list of names. Unknown names are logged and skipped.
Style styleFromNames(const std::vector<std::string>& names);

// "bold|red" style listing of the base bits, "regular" for 0
std::string styleToString(Style style);
