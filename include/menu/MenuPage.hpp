#pragma once
#include "MenuElement.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// A named, ordered list of elements. Element positions are 1-based at the
// public interface: element(1) is the first one added.
class MenuPage {
public:
    explicit MenuPage(std::string name = "Untitled page");

    MenuPage(const MenuPage&) = delete;
    MenuPage& operator=(const MenuPage&) = delete;

    const std::string& name() const { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    // Appends an element and returns it for further tweaking. The reference
    // stays valid for the lifetime of the page.
    MenuElement& addElement(std::string label,
                            Style style = Style::Regular,
                            Command command = {},
                            Params params = {});

    size_t elementCount() const { return elements_.size(); }
    bool empty() const { return elements_.empty(); }

    // 1-based. Throws std::out_of_range outside [1, elementCount()].
    MenuElement& element(size_t index);
    const MenuElement& element(size_t index) const;

    // Elements in insertion order
    const std::vector<std::unique_ptr<MenuElement>>& elements() const {
        return elements_;
    }

private:
    std::string name_;
    std::vector<std::unique_ptr<MenuElement>> elements_;
};
