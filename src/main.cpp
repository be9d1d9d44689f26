#include "menu/MenuLoader.hpp"
#include "menu/MenuUI.hpp"
#include "terminal/PosixTerminal.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <csignal>
#include <signal.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static MenuUI* g_ui = nullptr;

static void signalHandler(int) {
    if (g_ui) g_ui->requestStop();
}

static bool isTuikitVariable(const std::string& key) {
    return key == "NO_COLOR" || key.rfind("TUIKIT_", 0) == 0;
}

static std::string trimmed(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

// Reads KEY=value lines for TUIKIT_* and NO_COLOR into the environment.
// Variables already set win. Returns the keys that were applied.
static std::vector<std::string> loadDotEnv(const std::string& path) {
    std::vector<std::string> applied;
    std::ifstream file(path);
    if (!file.is_open()) return applied;

    std::string line;
    while (std::getline(file, line)) {
        line = trimmed(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trimmed(line.substr(0, eq));
        std::string val = trimmed(line.substr(eq + 1));
        if (!isTuikitVariable(key) || std::getenv(key.c_str())) continue;
        if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') &&
            val.back() == val.front())
            val = val.substr(1, val.size() - 2);

        setenv(key.c_str(), val.c_str(), 0);
        applied.push_back(key);
    }
    return applied;
}

static void setupLogging() {
    // The menu owns stdout, so console logging goes to stderr and only
    // for warnings and above
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(spdlog::level::warn);
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "tuikit.log", 1048576 * 5, 3);  // 5MB, 3 files

    auto logger = std::make_shared<spdlog::logger>(
        "tuikit", spdlog::sinks_init_list{consoleSink, fileSink});
    spdlog::set_default_logger(logger);

    const char* env = std::getenv("TUIKIT_LOG_LEVEL");
    std::string logLevel = env ? env : "info";
    if (logLevel == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (logLevel == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (logLevel == "error") spdlog::set_level(spdlog::level::err);
    else                          spdlog::set_level(spdlog::level::info);
}

static CommandRegistry demoCommands() {
    CommandRegistry commands;
    commands.addTyped("hello", [] { std::cout << "hello" << std::endl; });

    // Prints every argument on its own line, however many there are
    commands.add("say", [](const std::vector<ArgValue>& what) {
        for (auto& w : what)
            std::cout << (w.is_string() ? w.get<std::string>() : w.dump())
                      << std::endl;
    });

    commands.addTyped("add", [](double a, double b) {
        std::cout << a << " + " << b << " = " << a + b << std::endl;
    });

    commands.addTyped("describe", [](const std::string& item) {
        std::cout << "You picked " << item << std::endl;
    });
    return commands;
}

// Two-page shop used when no menu file is available
static void buildDefaultMenu(MenuUI& ui, const CommandRegistry& commands) {
    const Command* describe = commands.find("describe");

    auto& fruits = ui.addPage("Fruits");
    fruits.addElement("Banana", Style::Yellow, *describe, Params::single("a banana"));
    fruits.addElement("Apple", Style::Red | Style::Bold, *describe, Params::single("an apple"));
    fruits.addElement("Orange", Style::YellowBright, *describe, Params::single("an orange"));

    ui.addPage("Groceries");
    ui.addElement("Bread", Style::Regular, *describe, Params::single("bread"));
    ui.addElement("Milk", Style::WhiteBright | Style::Italic);
    ui.addElement("Total", Style::UnderscoreIntersect,
                  *commands.find("add"), Params::of(2.5, 1.25));
}

int main(int argc, char* argv[]) {
    auto fromDotEnv = loadDotEnv(".env");
    setupLogging();
    for (auto& key : fromDotEnv)
        spdlog::debug("{} taken from .env", key);

    std::string menuPath = "config/menu.json";
    if (argc > 1) menuPath = argv[1];

    auto commands = demoCommands();
    MenuLoader loader(commands);
    PosixTerminal terminal;

    std::unique_ptr<MenuUI> ui;
    try {
        if (std::filesystem::exists(menuPath)) {
            ui = loader.loadFile(menuPath, terminal);
        } else {
            spdlog::warn("Menu file {} not found, using built-in demo",
                         menuPath);
            MenuConfig config;
            config.name = "Shop";
            config.stop = true;
            config.applyEnvironment();
            ui = std::make_unique<MenuUI>(terminal, config);
            buildDefaultMenu(*ui, commands);
        }
    } catch (const std::exception& e) {
        spdlog::error("Cannot load menu: {}", e.what());
        return 1;
    }

    // No SA_RESTART: a signal interrupts the blocking key read so the
    // loop can return and the terminal mode is restored
    g_ui = ui.get();
    struct sigaction sa {};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT,  &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    try {
        ui->loop(ui->config().stop);
    } catch (const std::exception& e) {
        spdlog::error("Menu command failed: {}", e.what());
        g_ui = nullptr;
        return 1;
    }

    g_ui = nullptr;
    spdlog::info("tuikit demo exited cleanly");
    return 0;
}
