#include <gtest/gtest.h>
#include "menu/MenuConfig.hpp"
#include "terminal/ITerminal.hpp"
#include <cstdlib>

TEST(MenuConfigTest, Defaults) {
    MenuConfig c;
    EXPECT_EQ(c.name, "Untitled UI");
    EXPECT_TRUE(c.showName);
    EXPECT_TRUE(c.showCurrentPage);
    EXPECT_TRUE(c.showCurrentPageName);
    EXPECT_FALSE(c.header.has_value());
    EXPECT_FALSE(c.stop);
    EXPECT_TRUE(c.colors);
    EXPECT_TRUE(c.keys.isPrev("a"));
    EXPECT_TRUE(c.keys.isNext("d"));
    EXPECT_TRUE(c.keys.isPrev(ITerminal::kKeyLeft));
    EXPECT_TRUE(c.keys.isNext(ITerminal::kKeyRight));
    EXPECT_FALSE(c.keys.isNext("a"));
}

TEST(MenuConfigTest, ReadsAllFields) {
    auto j = nlohmann::json::parse(R"({
        "name": "Shop",
        "show_name": false,
        "show_current_page": false,
        "show_current_page_name": false,
        "header": "custom",
        "stop": true,
        "colors": false,
        "prompt": "? ",
        "keys": { "prev": ["h", "left"], "next": "l" }
    })");

    auto c = MenuConfig::fromJson(j);
    EXPECT_EQ(c.name, "Shop");
    EXPECT_FALSE(c.showName);
    EXPECT_FALSE(c.showCurrentPage);
    EXPECT_FALSE(c.showCurrentPageName);
    ASSERT_TRUE(c.header.has_value());
    EXPECT_EQ(*c.header, "custom");
    EXPECT_TRUE(c.stop);
    EXPECT_FALSE(c.colors);
    EXPECT_EQ(c.prompt, "? ");
    EXPECT_TRUE(c.keys.isPrev("h"));
    EXPECT_TRUE(c.keys.isPrev(ITerminal::kKeyLeft));
    EXPECT_FALSE(c.keys.isPrev("a"));
    EXPECT_TRUE(c.keys.isNext("l"));
    EXPECT_FALSE(c.keys.isNext("d"));
}

TEST(MenuConfigTest, MissingFieldsKeepDefaults) {
    auto c = MenuConfig::fromJson({{"name", "Only name"}});
    EXPECT_EQ(c.name, "Only name");
    EXPECT_TRUE(c.showName);
    EXPECT_TRUE(c.keys.isNext("d"));
}

TEST(MenuConfigTest, NullHeaderMeansNoOverride) {
    auto c = MenuConfig::fromJson({{"header", nullptr}});
    EXPECT_FALSE(c.header.has_value());
}

TEST(MenuConfigTest, WrongTypeThrows) {
    EXPECT_THROW(MenuConfig::fromJson({{"stop", "yes"}}),
                 nlohmann::json::type_error);
}

TEST(MenuConfigTest, ToJsonReadsBack) {
    MenuConfig c;
    c.name = "Round";
    c.header = "hdr";
    c.keys.next = {"n"};

    auto back = MenuConfig::fromJson(c.toJson());
    EXPECT_EQ(back.name, "Round");
    EXPECT_EQ(back.header, c.header);
    EXPECT_EQ(back.keys.next, c.keys.next);
    EXPECT_EQ(back.keys.prev, c.keys.prev);
}

TEST(MenuConfigTest, NoColorEnvironmentDisablesColours) {
    setenv("NO_COLOR", "1", 1);
    MenuConfig c;
    c.applyEnvironment();
    EXPECT_FALSE(c.colors);
    unsetenv("NO_COLOR");

    MenuConfig d;
    d.applyEnvironment();
    EXPECT_TRUE(d.colors);
}

TEST(KeyBindingsTest, NamedKeys) {
    EXPECT_EQ(KeyBindings::keyFromName("left"), ITerminal::kKeyLeft);
    EXPECT_EQ(KeyBindings::keyFromName("down"), ITerminal::kKeyDown);
    EXPECT_EQ(KeyBindings::keyFromName("q"), "q");
}
