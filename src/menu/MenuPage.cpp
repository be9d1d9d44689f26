#include "menu/MenuPage.hpp"
#include <stdexcept>

MenuPage::MenuPage(std::string name)
    : name_(std::move(name)) {}

MenuElement& MenuPage::addElement(std::string label, Style style,
                                  Command command, Params params)
{
    elements_.push_back(std::make_unique<MenuElement>(
        std::move(label), style, std::move(command), std::move(params)));
    return *elements_.back();
}

MenuElement& MenuPage::element(size_t index) {
    if (index < 1 || index > elements_.size())
        throw std::out_of_range("page '" + name_ + "' has no element " +
                                std::to_string(index) + " (count " +
                                std::to_string(elements_.size()) + ")");
    return *elements_[index - 1];
}

const MenuElement& MenuPage::element(size_t index) const {
    return const_cast<MenuPage*>(this)->element(index);
}
