#pragma once
#include "MenuConfig.hpp"
#include "MenuPage.hpp"
#include "terminal/ITerminal.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Top-level menu: an ordered list of pages, the current-page cursor and
// the render / read / dispatch loop. Pages are owned by the UI, elements
// by their page; references returned by addPage()/addElement() stay valid
// for the lifetime of the UI.
class MenuUI {
public:
    explicit MenuUI(ITerminal& terminal, std::string name = "Untitled UI");
    MenuUI(ITerminal& terminal, MenuConfig config);
    ~MenuUI();

    MenuUI(const MenuUI&) = delete;
    MenuUI& operator=(const MenuUI&) = delete;

    // ── Model ─────────────────────────────────────────────────────
    // The first page added becomes the current page
    MenuPage& addPage(std::string name = "Untitled page");

    // Appends to the most recently added page, creating one if needed
    MenuElement& addElement(std::string label,
                            Style style = Style::Regular,
                            Command command = {},
                            Params params = {});

    size_t pageCount() const { return pages_.size(); }

    // 0-based. Throws std::out_of_range.
    MenuPage& page(size_t index);
    const MenuPage& page(size_t index) const;

    // Throws std::out_of_range when the UI has no pages
    MenuPage& currentPage();
    const MenuPage& currentPage() const;

    size_t currentPageIndex() const { return currentPage_; }

    // ── Navigation ────────────────────────────────────────────────
    // Wrap around at either end; no-op with fewer than two pages
    void nextPage();
    void prevPage();

    // 0-based jump. Throws std::out_of_range.
    void setCurrentPage(size_t index);

    // Jumps to a page owned by this UI; false if it is not one of ours
    bool setCurrentPage(const MenuPage& page);

    // ── Header ────────────────────────────────────────────────────
    const std::string& name() const { return config_.name; }
    void setName(std::string name) { config_.name = std::move(name); }

    const std::optional<std::string>& header() const { return config_.header; }
    void setHeader(std::string header) { config_.header = std::move(header); }
    void clearHeader() { config_.header.reset(); }

    bool showName() const { return config_.showName; }
    bool showCurrentPage() const { return config_.showCurrentPage; }
    bool showCurrentPageName() const { return config_.showCurrentPageName; }
    void setShowName(bool v) { config_.showName = v; }
    void setShowCurrentPage(bool v) { config_.showCurrentPage = v; }
    void setShowCurrentPageName(bool v) { config_.showCurrentPageName = v; }

    // Header override if set, otherwise:
    //   P: <current page name>
    //   <ui name> <index+1>/<page count>
    std::string buildHeader() const;

    // ── Interaction ───────────────────────────────────────────────
    // Header, numbered elements of the current page, then the prompt
    void render() const;
    void render(const MenuPage& page) const;

    // Reads one input token. Navigation keys move the page cursor and
    // return nothing; an in-range number dispatches that element's
    // command and returns its 1-based index; anything else is ignored.
    std::optional<size_t> askInput();

    // render / askInput / clear until requestStop() or end of input.
    // With `stop`, waits for Enter after each dispatched command.
    void loop(bool stop = false);

    // Safe to call from a signal handler
    void requestStop() { stopRequested_ = true; }
    bool stopRequested() const { return stopRequested_; }

    const MenuConfig& config() const { return config_; }
    MenuConfig& config() { return config_; }

private:
    struct Selection {
        std::optional<size_t> index;
        bool dispatched = false;
    };

    // Terminal half of readSelection(): nullopt when the key was consumed
    // by navigation or ignored, otherwise the typed selection text
    std::optional<std::string> readToken();
    Selection dispatch(const std::string& token);
    Selection readSelection();
    void writeFrame(const MenuPage* page) const;
    std::optional<size_t> parseSelection(const std::string& token) const;
    size_t currentElementCount() const;

    ITerminal& terminal_;
    MenuConfig config_;

    std::vector<std::unique_ptr<MenuPage>> pages_;
    size_t currentPage_ = 0;
    std::optional<size_t> lastAddedPage_;

    std::atomic<bool> stopRequested_{false};
};
