#include "menu/MenuLoader.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <fstream>
#include <limits>

namespace {

Command navigationCommand(MenuUI& ui, const std::string& name) {
    MenuUI* target = &ui;
    if (name == "next_page")
        return Command::of([target] { target->nextPage(); }, name);
    if (name == "prev_page")
        return Command::of([target] { target->prevPage(); }, name);
    if (name == "goto_page") {
        return Command::of([target](const nlohmann::json& where) {
            if (where.is_number_unsigned() || where.is_number_integer()) {
                target->setCurrentPage(where.get<size_t>());
                return;
            }
            auto wanted = where.get<std::string>();
            for (size_t i = 0; i < target->pageCount(); i++) {
                if (target->page(i).name() == wanted) {
                    target->setCurrentPage(i);
                    return;
                }
            }
            throw CommandError("goto_page: no page named '" + wanted + "'");
        }, name);
    }
    return {};
}

} // namespace

Style MenuLoader::parseStyle(const nlohmann::json& j) {
    if (j.is_null())
        return Style::Regular;
    if (j.is_number_unsigned() || j.is_number_integer()) {
        if (!j.is_number_unsigned() && j.get<int64_t>() < 0)
            throw MenuLoadError("style bits must not be negative, got " + j.dump());
        auto bits = j.get<uint64_t>();
        if (bits > std::numeric_limits<uint32_t>::max())
            throw MenuLoadError("style bits out of range, got " + j.dump());
        return static_cast<Style>(static_cast<uint32_t>(bits));
    }
    if (j.is_string())
        return styleFromNames({j.get<std::string>()});
    if (j.is_array())
        return styleFromNames(j.get<std::vector<std::string>>());
    throw MenuLoadError("style must be a name, a list of names or an integer");
}

Command MenuLoader::resolve(MenuUI& ui, const std::string& name) const {
    if (auto* cmd = registry_.find(name))
        return *cmd;
    return navigationCommand(ui, name);
}

void MenuLoader::populate(MenuUI& ui, const nlohmann::json& definition) const {
    if (!definition.contains("pages"))
        return;
    if (!definition["pages"].is_array())
        throw MenuLoadError("'pages' must be an array");

    size_t pageNo = 0;
    for (auto& pj : definition["pages"]) {
        pageNo++;
        std::string where = "page " + std::to_string(pageNo);
        try {
            auto& page = ui.addPage(pj.value("name", "Untitled page"));
            where = "page '" + page.name() + "'";

            if (!pj.contains("elements")) continue;

            size_t elementNo = 0;
            for (auto& ej : pj["elements"]) {
                elementNo++;
                std::string at = where + " element " + std::to_string(elementNo);
                std::string label = ej.value("label", "");

                Style style = Style::Regular;
                try {
                    style = parseStyle(ej.value("style", nlohmann::json()));
                } catch (const MenuLoadError& e) {
                    throw MenuLoadError(at + ": " + e.what());
                }

                Command command;
                if (ej.contains("command") && !ej["command"].is_null()) {
                    auto name = ej["command"].get<std::string>();
                    command = resolve(ui, name);
                    if (!command)
                        throw MenuLoadError(at + ": unknown command '" +
                                            name + "'");
                }

                Params params = Params::fromJson(
                    ej.value("params", nlohmann::json()));
                page.addElement(std::move(label), style,
                                std::move(command), std::move(params));
            }
        } catch (const nlohmann::json::exception& e) {
            throw MenuLoadError(where + ": " + e.what());
        }
    }
}

std::unique_ptr<MenuUI> MenuLoader::load(const nlohmann::json& definition,
                                         ITerminal& terminal) const
{
    if (!definition.is_object())
        throw MenuLoadError("menu definition must be a JSON object");

    MenuConfig config;
    try {
        config = MenuConfig::fromJson(definition);
    } catch (const nlohmann::json::exception& e) {
        throw MenuLoadError(std::string("menu options: ") + e.what());
    }
    config.applyEnvironment();

    auto ui = std::make_unique<MenuUI>(terminal, std::move(config));
    populate(*ui, definition);

    spdlog::info("Loaded menu '{}' ({} pages)", ui->name(), ui->pageCount());
    return ui;
}

std::unique_ptr<MenuUI> MenuLoader::loadFile(const std::string& path,
                                             ITerminal& terminal) const
{
    std::ifstream f(path);
    if (!f.is_open())
        throw MenuLoadError("cannot open menu file: " + path);

    nlohmann::json definition;
    try {
        f >> definition;
    } catch (const nlohmann::json::parse_error& e) {
        throw MenuLoadError(path + ": " + e.what());
    }
    return load(definition, terminal);
}
