#include "sea/Registry.hpp"
#include "sea/Store.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace sea;

namespace {

Value J(const char* text) { return json::fromString(text); }

std::shared_ptr<Store> makeStore(Registry& reg) {
    StoreOptions opts;
    opts.state = [] {
        return json::fromString(R"({"user":{"name":"a","age":1},"items":[{"id":1}],"theme":"light"})");
    };
    return reg.createStore("observed", std::move(opts));
}

} // namespace

TEST(ObserveTest, FiresOnlyForWatchedPaths) {
    auto reg = Registry::create();
    auto s = makeStore(*reg);

    std::vector<std::vector<std::string>> calls;
    s->observe({"user.name"}, [&](const std::vector<std::string>& changed) { calls.push_back(changed); });

    s->patch(J(R"({"user":{"age":2}})"));
    s->setState(J(R"({"theme":"dark"})"));
    EXPECT_TRUE(calls.empty());

    s->patch(J(R"({"user":{"name":"b"}})"));
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], std::vector<std::string>{"user.name"});
}

TEST(ObserveTest, ReportsEveryChangedPathOnce) {
    auto reg = Registry::create();
    auto s = makeStore(*reg);

    std::vector<std::string> last;
    int calls = 0;
    s->observe({"user.name", "items[0].id", "theme"}, [&](const std::vector<std::string>& changed) {
        ++calls;
        last = changed;
    });

    s->patch([](Draft& d) {
        d.set("items[0].id", Value(2));
        d.set("theme", json::string("dark"));
    });

    EXPECT_EQ(calls, 1);
    std::vector<std::string> expected{"items.0.id", "theme"};
    EXPECT_EQ(last, expected);
}

TEST(ObserveTest, AppearingAndDisappearingPathsCount) {
    auto reg = Registry::create();
    auto s = makeStore(*reg);

    int calls = 0;
    s->observe({"settings.lang"}, [&](const std::vector<std::string>&) { ++calls; });

    s->setState(J(R"({"settings":{"lang":"en"}})"));
    EXPECT_EQ(calls, 1);

    s->reset();
    EXPECT_EQ(calls, 2);
}

TEST(ObserveTest, UnsubscribeStopsCallbacks) {
    auto reg = Registry::create();
    auto s = makeStore(*reg);

    int calls = 0;
    auto unsub = s->observe({"theme"}, [&](const std::vector<std::string>&) { ++calls; });
    unsub();

    s->setState(J(R"({"theme":"dark"})"));
    EXPECT_EQ(calls, 0);
}
