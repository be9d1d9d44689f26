#include "menu/MenuConfig.hpp"
#include "terminal/ITerminal.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>

namespace {

std::vector<std::string> readKeys(const nlohmann::json& j) {
    std::vector<std::string> keys;
    if (j.is_string()) {
        keys.push_back(KeyBindings::keyFromName(j.get<std::string>()));
        return keys;
    }
    for (auto& k : j)
        keys.push_back(KeyBindings::keyFromName(k.get<std::string>()));
    return keys;
}

} // namespace

bool KeyBindings::isPrev(const std::string& key) const {
    return std::find(prev.begin(), prev.end(), key) != prev.end();
}

bool KeyBindings::isNext(const std::string& key) const {
    return std::find(next.begin(), next.end(), key) != next.end();
}

std::string KeyBindings::keyFromName(const std::string& name) {
    if (name == "left")  return ITerminal::kKeyLeft;
    if (name == "right") return ITerminal::kKeyRight;
    if (name == "up")    return ITerminal::kKeyUp;
    if (name == "down")  return ITerminal::kKeyDown;
    return name;
}

MenuConfig MenuConfig::fromJson(const nlohmann::json& j) {
    MenuConfig c;
    c.name                = j.value("name", c.name);
    c.showName            = j.value("show_name", c.showName);
    c.showCurrentPage     = j.value("show_current_page", c.showCurrentPage);
    c.showCurrentPageName = j.value("show_current_page_name",
                                    c.showCurrentPageName);
    c.stop                = j.value("stop", c.stop);
    c.colors              = j.value("colors", c.colors);
    c.prompt              = j.value("prompt", c.prompt);

    if (j.contains("header") && !j["header"].is_null())
        c.header = j["header"].get<std::string>();

    if (j.contains("keys")) {
        auto& k = j["keys"];
        if (k.contains("prev")) c.keys.prev = readKeys(k["prev"]);
        if (k.contains("next")) c.keys.next = readKeys(k["next"]);
        if (c.keys.prev.empty() || c.keys.next.empty())
            spdlog::warn("Menu '{}' has no key bound for one navigation "
                         "direction", c.name);
    }
    return c;
}

nlohmann::json MenuConfig::toJson() const {
    nlohmann::json j = {
        {"name",                   name},
        {"show_name",              showName},
        {"show_current_page",      showCurrentPage},
        {"show_current_page_name", showCurrentPageName},
        {"stop",                   stop},
        {"colors",                 colors},
        {"prompt",                 prompt},
        {"keys", {{"prev", keys.prev}, {"next", keys.next}}},
    };
    if (header) j["header"] = *header;
    return j;
}

void MenuConfig::applyEnvironment() {
    const char* noColor = std::getenv("NO_COLOR");
    if (noColor && *noColor) {
        colors = false;
        spdlog::debug("NO_COLOR set, styles disabled");
    }
}
