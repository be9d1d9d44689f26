#pragma once
#include "Command.hpp"
#include "MenuConfig.hpp"
#include "MenuUI.hpp"
#include "terminal/ITerminal.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Raised for unreadable or malformed menu definitions
class MenuLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Named commands that menu definition files can refer to
class CommandRegistry {
public:
    void add(const std::string& name, Command::Generic fn) {
        commands_[name] = Command(std::move(fn), name);
    }

    // Typed, fixed-arity function; see Command::of()
    template <typename F>
    void addTyped(const std::string& name, F&& fn) {
        commands_[name] = Command::of(std::forward<F>(fn), name);
    }

    const Command* find(const std::string& name) const {
        auto it = commands_.find(name);
        return (it != commands_.end()) ? &it->second : nullptr;
    }

    bool contains(const std::string& name) const {
        return commands_.count(name) > 0;
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (auto& [k, _] : commands_) out.push_back(k);
        return out;
    }

    size_t size() const { return commands_.size(); }

private:
    std::map<std::string, Command> commands_;
};

// Builds a MenuUI from a JSON menu definition:
//
//   { "name": "Shop", "stop": true, ...MenuConfig fields...,
//     "pages": [ { "name": "Fruits",
//                  "elements": [ { "label": "Banana",
//                                  "style": ["yellow", "bold"],
//                                  "command": "say",
//                                  "params": ["ripe", 3] } ] } ] }
//
// Besides the registry's commands, every menu can use the navigation
// commands "next_page", "prev_page" and "goto_page" (page name or
// 0-based index).
class MenuLoader {
public:
    explicit MenuLoader(const CommandRegistry& registry)
        : registry_(registry) {}

    std::unique_ptr<MenuUI> load(const nlohmann::json& definition,
                                 ITerminal& terminal) const;

    std::unique_ptr<MenuUI> loadFile(const std::string& path,
                                     ITerminal& terminal) const;

    // Adds the definition's pages to an existing UI
    void populate(MenuUI& ui, const nlohmann::json& definition) const;

    // A string, a list of names, or a raw integer bit set
    static Style parseStyle(const nlohmann::json& j);

private:
    // Registry command, or a navigation command bound to `ui`
    Command resolve(MenuUI& ui, const std::string& name) const;

    const CommandRegistry& registry_;
};
