#include "menu/MenuUI.hpp"
#include "render/MenuRenderer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool isLineEnd(const std::string& key) {
    return key == "\r" || key == "\n";
}

bool isErase(const std::string& key) {
    return key == "\x08" || key == "\x7f";
}

// Runs one of the loop's own terminal reads; false once input is closed.
// TerminalClosed raised anywhere else is left to the caller.
template <typename Read>
bool readUnlessClosed(const std::string& menu, Read&& read) {
    try {
        read();
        return true;
    } catch (const TerminalClosed& e) {
        spdlog::info("Menu '{}' input closed: {}", menu, e.what());
        return false;
    }
}

// Clears the stop flag however loop() exits
class StopFlagReset {
public:
    explicit StopFlagReset(std::atomic<bool>& flag) : flag_(flag) {}
    ~StopFlagReset() { flag_ = false; }

    StopFlagReset(const StopFlagReset&) = delete;
    StopFlagReset& operator=(const StopFlagReset&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

MenuUI::MenuUI(ITerminal& terminal, std::string name)
    : terminal_(terminal)
{
    config_.name = std::move(name);
}

MenuUI::MenuUI(ITerminal& terminal, MenuConfig config)
    : terminal_(terminal), config_(std::move(config)) {}

MenuUI::~MenuUI() = default;

MenuPage& MenuUI::addPage(std::string name) {
    pages_.push_back(std::make_unique<MenuPage>(std::move(name)));
    lastAddedPage_ = pages_.size() - 1;
    if (pages_.size() == 1)
        currentPage_ = 0;

    spdlog::debug("Menu '{}': added page {} '{}'", config_.name,
                  pages_.size(), pages_.back()->name());
    return *pages_.back();
}

MenuElement& MenuUI::addElement(std::string label, Style style,
                                Command command, Params params)
{
    if (!lastAddedPage_)
        addPage();
    return pages_[*lastAddedPage_]->addElement(
        std::move(label), style, std::move(command), std::move(params));
}

MenuPage& MenuUI::page(size_t index) {
    if (index >= pages_.size())
        throw std::out_of_range("menu '" + config_.name + "' has no page " +
                                std::to_string(index) + " (count " +
                                std::to_string(pages_.size()) + ")");
    return *pages_[index];
}

const MenuPage& MenuUI::page(size_t index) const {
    return const_cast<MenuUI*>(this)->page(index);
}

MenuPage& MenuUI::currentPage() {
    return page(currentPage_);
}

const MenuPage& MenuUI::currentPage() const {
    return page(currentPage_);
}

void MenuUI::nextPage() {
    if (pages_.size() < 2) return;
    currentPage_ = (currentPage_ + 1) % pages_.size();
    spdlog::debug("Menu '{}': page {}/{} '{}'", config_.name,
                  currentPage_ + 1, pages_.size(), currentPage().name());
}

void MenuUI::prevPage() {
    if (pages_.size() < 2) return;
    currentPage_ = (currentPage_ + pages_.size() - 1) % pages_.size();
    spdlog::debug("Menu '{}': page {}/{} '{}'", config_.name,
                  currentPage_ + 1, pages_.size(), currentPage().name());
}

void MenuUI::setCurrentPage(size_t index) {
    page(index);  // bounds check
    currentPage_ = index;
}

bool MenuUI::setCurrentPage(const MenuPage& target) {
    for (size_t i = 0; i < pages_.size(); i++) {
        if (pages_[i].get() == &target) {
            currentPage_ = i;
            return true;
        }
    }
    return false;
}

std::string MenuUI::buildHeader() const {
    if (config_.header) return *config_.header;

    std::string out;
    if (config_.showCurrentPageName && !pages_.empty())
        out += "P: " + currentPage().name() + "\n";

    std::string info;
    if (config_.showName)
        info = config_.name;
    if (config_.showCurrentPage) {
        if (!info.empty()) info += ' ';
        size_t shown = pages_.empty() ? 0 : currentPage_ + 1;
        info += std::to_string(shown) + "/" + std::to_string(pages_.size());
    }
    if (!info.empty())
        out += info + "\n";
    return out;
}

void MenuUI::render() const {
    const MenuPage* current = pages_.empty() ? nullptr
                                             : pages_[currentPage_].get();
    writeFrame(current);
}

void MenuUI::render(const MenuPage& page) const {
    writeFrame(&page);
}

void MenuUI::writeFrame(const MenuPage* page) const {
    MenuRenderer renderer(config_.colors);
    auto frame = renderer.renderLines(buildHeader(), page,
                                      terminal_.columns());
    if (!frame.empty()) frame += "\n";
    terminal_.write(frame + config_.prompt);
}

size_t MenuUI::currentElementCount() const {
    return pages_.empty() ? 0 : pages_[currentPage_]->elementCount();
}

std::optional<size_t> MenuUI::parseSelection(const std::string& token) const {
    auto t = trim(token);
    if (t.empty() || !std::all_of(t.begin(), t.end(),
            [](unsigned char c) { return std::isdigit(c); }))
        return std::nullopt;

    size_t value = 0;
    auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
    if (ec != std::errc() || ptr != t.data() + t.size())
        return std::nullopt;

    if (value < 1 || value > currentElementCount())
        return std::nullopt;
    return value;
}

std::optional<std::string> MenuUI::readToken() {
    std::string key = terminal_.readKey();

    if (config_.keys.isPrev(key)) {
        prevPage();
        return std::nullopt;
    }
    if (config_.keys.isNext(key)) {
        nextPage();
        return std::nullopt;
    }
    if (isLineEnd(key) || isErase(key))
        return std::nullopt;
    if (key.size() > 1 && key.front() == '\x1b') {
        spdlog::debug("Ignoring unbound key sequence");
        return std::nullopt;
    }

    // Echo the first character, then read the rest of the line
    terminal_.write(key);
    return key + terminal_.readLine();
}

MenuUI::Selection MenuUI::dispatch(const std::string& token) {
    auto index = parseSelection(token);
    if (!index) {
        spdlog::debug("Menu '{}': ignoring input '{}'", config_.name, token);
        return {};
    }

    auto& element = pages_[currentPage_]->element(*index);
    if (!element.hasCommand())
        return {index, false};

    spdlog::info("Menu '{}': dispatching '{}' ({}) on page '{}'",
                 config_.name, element.label(),
                 element.command().name().empty() ? "anonymous"
                                                  : element.command().name(),
                 pages_[currentPage_]->name());
    element.invoke();
    return {index, true};
}

MenuUI::Selection MenuUI::readSelection() {
    auto token = readToken();
    return token ? dispatch(*token) : Selection{};
}

std::optional<size_t> MenuUI::askInput() {
    return readSelection().index;
}

void MenuUI::loop(bool stop) {
    if (pages_.empty())
        addPage();

    spdlog::info("Menu '{}' running on {} terminal ({} pages)",
                 config_.name, terminal_.backendName(), pages_.size());

    StopFlagReset reset(stopRequested_);
    while (!stopRequested_) {
        render();

        std::optional<std::string> token;
        if (!readUnlessClosed(config_.name, [&] { token = readToken(); }))
            break;

        // Not guarded: TerminalClosed from a command reaches the caller
        auto selection = token ? dispatch(*token) : Selection{};

        if (stop && selection.dispatched &&
            !readUnlessClosed(config_.name, [&] { terminal_.readLine(); }))
            break;

        terminal_.clearScreen();
    }
}
