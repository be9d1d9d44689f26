#include <gtest/gtest.h>
#include "menu/MenuPage.hpp"
#include <stdexcept>
#include <string>

TEST(MenuPageTest, DefaultName) {
    MenuPage page;
    EXPECT_EQ(page.name(), "Untitled page");
    EXPECT_EQ(page.elementCount(), 0u);
    EXPECT_TRUE(page.empty());
}

TEST(MenuPageTest, ElementsAreOneBasedInInsertionOrder) {
    MenuPage page("Fruits");
    const char* labels[] = {"Banana", "Apple", "Orange", "Kiwi"};
    for (auto l : labels)
        page.addElement(l);

    ASSERT_EQ(page.elementCount(), 4u);
    for (size_t i = 1; i <= 4; i++)
        EXPECT_EQ(page.element(i).label(), labels[i - 1]);
}

TEST(MenuPageTest, OutOfRangeIndicesThrow) {
    MenuPage page;
    EXPECT_THROW(page.element(1), std::out_of_range);

    page.addElement("a");
    page.addElement("b");
    EXPECT_THROW(page.element(0), std::out_of_range);
    EXPECT_THROW(page.element(3), std::out_of_range);
    EXPECT_NO_THROW(page.element(2));
}

TEST(MenuPageTest, ReturnedElementCanBeRestyled) {
    MenuPage page;
    auto& first = page.addElement("first");
    for (int i = 0; i < 50; i++)
        page.addElement("filler " + std::to_string(i));

    // Still valid after the page grew
    first.setStyle(Style::Selected);
    EXPECT_EQ(page.element(1).style(), Style::Selected);
}

TEST(MenuPageTest, EmptyAndDuplicateLabelsAllowed) {
    MenuPage page;
    page.addElement("");
    page.addElement("same");
    page.addElement("same");
    EXPECT_EQ(page.elementCount(), 3u);
    EXPECT_EQ(page.element(1).label(), "");
}

TEST(MenuPageTest, ElementInvokeRunsBoundCommand) {
    MenuPage page;
    int sum = 0;
    auto& el = page.addElement("add", Style::Regular,
                               Command::of([&](int a, int b) { sum = a + b; }),
                               Params::of(2, 3));
    EXPECT_TRUE(el.hasCommand());
    el.invoke();
    EXPECT_EQ(sum, 5);

    el.unbind();
    EXPECT_FALSE(el.hasCommand());
    EXPECT_NO_THROW(el.invoke());
}
