#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Keys that move between pages. Entries are raw key tokens as returned by
// ITerminal::readKey(); "left", "right", "up", "down" name the arrow keys
// when read from JSON.
struct KeyBindings {
    std::vector<std::string> prev = {"a", "\x1b[D"};
    std::vector<std::string> next = {"d", "\x1b[C"};

    bool isPrev(const std::string& key) const;
    bool isNext(const std::string& key) const;

    // "left" -> "\x1b[D", anything else is taken literally
    static std::string keyFromName(const std::string& name);
};

// Presentation and loop options of a MenuUI
struct MenuConfig {
    std::string name = "Untitled UI";

    // Header fields, each shown independently
    bool showName            = true;
    bool showCurrentPage     = true;
    bool showCurrentPageName = true;

    // Replaces the generated header verbatim when set
    std::optional<std::string> header;

    // Pause after a dispatched command so its output stays visible
    bool stop = false;

    // Apply element styles when rendering
    bool colors = true;

    std::string prompt = ">>> ";

    KeyBindings keys;

    // Reads the top-level options of a menu definition. Missing fields
    // keep their defaults; fields of the wrong type throw
    // nlohmann::json::type_error.
    static MenuConfig fromJson(const nlohmann::json& j);

    nlohmann::json toJson() const;

    // NO_COLOR disables styling
    void applyEnvironment();
};
