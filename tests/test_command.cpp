#include <gtest/gtest.h>
#include "menu/Command.hpp"
#include <stdexcept>
#include <string>
#include <vector>

TEST(ParamsTest, DefaultIsNone) {
    Params p;
    EXPECT_EQ(p.kind(), Params::Kind::None);
    EXPECT_TRUE(p.empty());
    EXPECT_TRUE(p.values().empty());
}

TEST(ParamsTest, SingleHoldsOneValue) {
    auto p = Params::single(42);
    EXPECT_EQ(p.kind(), Params::Kind::Single);
    ASSERT_EQ(p.size(), 1u);
    EXPECT_EQ(p.values()[0].get<int>(), 42);
}

TEST(ParamsTest, OfBuildsSequenceInOrder) {
    auto p = Params::of(2, "three", 4.5);
    EXPECT_EQ(p.kind(), Params::Kind::Sequence);
    ASSERT_EQ(p.size(), 3u);
    EXPECT_EQ(p.values()[0].get<int>(), 2);
    EXPECT_EQ(p.values()[1].get<std::string>(), "three");
    EXPECT_DOUBLE_EQ(p.values()[2].get<double>(), 4.5);
}

TEST(ParamsTest, FromJsonPicksKind) {
    EXPECT_EQ(Params::fromJson(nullptr).kind(), Params::Kind::None);
    EXPECT_EQ(Params::fromJson("x").kind(), Params::Kind::Single);
    EXPECT_EQ(Params::fromJson(nlohmann::json::array({1, 2})).kind(),
              Params::Kind::Sequence);
    EXPECT_EQ(Params::fromJson({{"k", 1}}).kind(), Params::Kind::Single);
}

TEST(ParamsTest, ToJsonMirrorsFromJson) {
    auto j = nlohmann::json::array({1, "two"});
    EXPECT_EQ(Params::fromJson(j).toJson(), j);
    EXPECT_TRUE(Params::none().toJson().is_null());
}

TEST(CommandTest, TwoArgumentsArrivePositionally) {
    std::vector<std::pair<int, int>> calls;
    auto cmd = Command::of([&](int a, int b) { calls.push_back({a, b}); });

    cmd.invoke(Params::of(2, 3));

    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].first, 2);
    EXPECT_EQ(calls[0].second, 3);
}

TEST(CommandTest, NoArgumentCommandIgnoresSingleValue) {
    int calls = 0;
    auto cmd = Command::of([&] { calls++; });

    cmd.invoke(Params::none());
    cmd.invoke(Params::single("ignored"));
    EXPECT_EQ(calls, 2);
}

TEST(CommandTest, NoArgumentCommandRejectsSequence) {
    auto cmd = Command::of([] {});
    EXPECT_THROW(cmd.invoke(Params::of(1, 2)), CommandError);
    EXPECT_NO_THROW(cmd.invoke(Params::sequence({})));
}

TEST(CommandTest, OneArgumentCommandReceivesWholeSequence) {
    std::vector<int> got;
    auto cmd = Command::of([&](const std::vector<int>& v) { got = v; });

    cmd.invoke(Params::of(1, 2, 3));
    EXPECT_EQ(got, (std::vector<int>{1, 2, 3}));
}

TEST(CommandTest, OneArgumentCommandNeedsPayload) {
    auto cmd = Command::of([](int) {}, "needs_one");
    try {
        cmd.invoke(Params::none());
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_NE(std::string(e.what()).find("needs_one"), std::string::npos);
    }
}

TEST(CommandTest, WrongArgumentCountThrows) {
    auto cmd = Command::of([](int, int) {});
    EXPECT_THROW(cmd.invoke(Params::of(1)), CommandError);
    EXPECT_THROW(cmd.invoke(Params::of(1, 2, 3)), CommandError);
    EXPECT_THROW(cmd.invoke(Params::single(1)), CommandError);
}

TEST(CommandTest, WrongArgumentTypeThrows) {
    bool called = false;
    auto cmd = Command::of([&](int, int) { called = true; });
    EXPECT_THROW(cmd.invoke(Params::of("two", "three")), CommandError);
    EXPECT_FALSE(called);
}

TEST(CommandTest, FunctionExceptionsPropagateUnchanged) {
    auto cmd = Command::of([] { throw std::logic_error("boom"); });
    EXPECT_THROW(cmd.invoke(Params::none()), std::logic_error);
}

TEST(CommandTest, FreeFunctionsCanBeBound) {
    static int total = 0;
    struct Local {
        static void add(int a, int b) { total = a + b; }
    };
    auto cmd = Command::of(&Local::add);
    cmd.invoke(Params::of(20, 22));
    EXPECT_EQ(total, 42);
}

TEST(CommandTest, GenericCommandSeesRawValues) {
    std::vector<ArgValue> seen;
    Command cmd([&](const std::vector<ArgValue>& v) { seen = v; }, "say");

    cmd.invoke(Params::of(1, 2, 3, 4, 5));
    EXPECT_EQ(seen.size(), 5u);

    cmd.invoke(Params::single("one"));
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].get<std::string>(), "one");

    cmd.invoke(Params::none());
    EXPECT_TRUE(seen.empty());
    EXPECT_EQ(cmd.name(), "say");
}

TEST(CommandTest, EmptyCommandIsFalseAndThrowsOnInvoke) {
    Command cmd;
    EXPECT_FALSE(cmd);
    EXPECT_THROW(cmd.invoke(Params::none()), CommandError);
}
