#include "sea/Registry.hpp"
#include "sea/Store.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sea;

namespace {

Value J(const char* text) { return json::fromString(text); }

// Copyable digest of an ActionEvent.
struct Seen {
    std::string store;
    std::string name;
    std::string args;
    std::optional<std::string> result;
    bool failed = false;
    std::string error;
    bool async = false;
    bool ordered = false;
};

Seen digest(const ActionEvent& ev) {
    Seen s;
    s.store = ev.storeId;
    s.name = ev.name;
    s.args = json::stringify(ev.args);
    if (ev.result) s.result = json::stringify(*ev.result);
    s.failed = ev.failed();
    s.error = ev.errorMessage;
    s.async = ev.async;
    s.ordered = ev.endTime >= ev.startTime && ev.durationMs() >= 0.0;
    return s;
}

std::shared_ptr<Store> counterStore(Registry& reg, const std::string& id = "counter") {
    StoreOptions opts;
    opts.state = [] { return json::fromString(R"({"count":0})"); };
    opts.getters["doubled"] = [](GetterContext& g) { return Value(g.get("count").GetInt() * 2); };
    opts.actions["increment"] = [](ActionContext& ctx, const Value&) {
        ctx.set("count", Value(ctx.get("count").GetInt() + 1));
        return Value(ctx.get("count").GetInt());
    };
    opts.actions["add"] = [](ActionContext& ctx, const Value& args) {
        const int by = args.Size() > 0 ? args[0].GetInt() : 1;
        ctx.patch(json::fromString("{\"count\":" + std::to_string(ctx.get("count").GetInt() + by) + "}"));
        return Value(ctx.get("count").GetInt());
    };
    opts.actions["incrementTwice"] = [](ActionContext& ctx, const Value&) {
        ctx.call("increment");
        return ctx.call("increment");
    };
    opts.actions["fail"] = [](ActionContext&, const Value&) -> Value {
        throw std::runtime_error("bad input");
    };
    opts.actions["echo"] = [](ActionContext&, const Value& args) { return json::clone(args); };
    opts.asyncActions["later"] = [](ActionContext&, const Value&, ActionCompletion done) {
        done.resolve(Value());
    };
    return reg.createStore(id, std::move(opts));
}

} // namespace

TEST(ActionDispatchTest, CounterScenario) {
    auto reg = Registry::create();
    auto s = counterStore(*reg);

    std::vector<Seen> events;
    s->onAction([&](const ActionEvent& ev) { events.push_back(digest(ev)); });

    s->dispatch("increment");
    s->dispatch("increment");
    s->dispatch("increment");

    EXPECT_EQ(s->get("count").GetInt(), 3);
    ASSERT_EQ(events.size(), 3u);
    for (auto& e : events) {
        EXPECT_EQ(e.name, "increment");
        EXPECT_EQ(e.store, "counter");
    }
}

TEST(ActionDispatchTest, SuccessEventCarriesResultAndNoError) {
    auto reg = Registry::create();
    auto s = counterStore(*reg);

    std::vector<Seen> events;
    reg->onAction([&](const ActionEvent& ev) { events.push_back(digest(ev)); });

    Value r = s->dispatch("add", J("[5]"));
    EXPECT_EQ(r.GetInt(), 5);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_FALSE(events[0].failed);
    ASSERT_TRUE(events[0].result.has_value());
    EXPECT_EQ(*events[0].result, "5");
    EXPECT_EQ(events[0].args, "[5]");
    EXPECT_FALSE(events[0].async);
    EXPECT_TRUE(events[0].ordered);
}

TEST(ActionDispatchTest, FailureEventCarriesErrorAndRethrows) {
    auto reg = Registry::create();
    auto s = counterStore(*reg);

    std::vector<Seen> events;
    reg->onAction([&](const ActionEvent& ev) { events.push_back(digest(ev)); });

    EXPECT_THROW(s->dispatch("fail"), std::runtime_error);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].failed);
    EXPECT_FALSE(events[0].result.has_value());
    EXPECT_EQ(events[0].error, "bad input");
    EXPECT_TRUE(events[0].ordered);
    EXPECT_EQ(s->metrics().actionErrors, 1u);
    EXPECT_EQ(s->metrics().actions, 1u);
}

TEST(ActionDispatchTest, ScalarArgumentsAreWrapped) {
    auto reg = Registry::create();
    auto s = counterStore(*reg);

    EXPECT_EQ(json::stringify(s->dispatch("echo", Value(7))), "[7]");
    EXPECT_EQ(json::stringify(s->dispatch("echo")), "[]");
    EXPECT_EQ(json::stringify(s->dispatch("echo", J(R"([1,"x"])"))), R"([1,"x"])");
}

TEST(ActionDispatchTest, ThrowingListenerDoesNotReachCaller) {
    auto reg = Registry::create();
    auto s = counterStore(*reg);

    int after = 0;
    reg->onAction([](const ActionEvent&) { throw std::runtime_error("listener"); });
    reg->onAction([&](const ActionEvent&) { ++after; });

    EXPECT_NO_THROW(s->dispatch("increment"));
    EXPECT_EQ(after, 1);
    EXPECT_EQ(s->metrics().listenerErrors, 1u);
}

TEST(ActionDispatchTest, NonStandardListenerThrowKeepsActionOutcome) {
    auto reg = Registry::create();
    auto s = counterStore(*reg);

    int after = 0;
    reg->onAction([](const ActionEvent&) { throw 42; });
    reg->onAction([&](const ActionEvent&) { ++after; });

    EXPECT_EQ(s->dispatch("increment").GetInt(), 1);
    EXPECT_THROW(s->dispatch("fail"), std::runtime_error);
    EXPECT_EQ(after, 2);
    EXPECT_EQ(s->metrics().listenerErrors, 2u);
}

TEST(ActionDispatchTest, SiblingCallsEmitTheirOwnEvents) {
    auto reg = Registry::create();
    auto s = counterStore(*reg);

    std::vector<std::string> names;
    s->onAction([&](const ActionEvent& ev) { names.push_back(ev.name); });

    EXPECT_EQ(s->dispatch("incrementTwice").GetInt(), 2);
    std::vector<std::string> expected{"increment", "increment", "incrementTwice"};
    EXPECT_EQ(names, expected);
}

TEST(ActionDispatchTest, ActionWritesInvalidateGetters) {
    auto reg = Registry::create();
    auto s = counterStore(*reg);

    EXPECT_EQ(s->getter("doubled").GetInt(), 0);
    s->dispatch("increment");
    EXPECT_EQ(s->getter("doubled").GetInt(), 2);
    EXPECT_EQ(s->version(), 1u);
}

TEST(ActionDispatchTest, StoreListenersOnlySeeTheirStore) {
    auto reg = Registry::create();
    auto a = counterStore(*reg, "a");
    auto b = counterStore(*reg, "b");

    int seenA = 0, seenAll = 0;
    auto unsub = a->onAction([&](const ActionEvent&) { ++seenA; });
    reg->onAction([&](const ActionEvent&) { ++seenAll; });

    a->dispatch("increment");
    b->dispatch("increment");
    EXPECT_EQ(seenA, 1);
    EXPECT_EQ(seenAll, 2);

    unsub();
    a->dispatch("increment");
    EXPECT_EQ(seenA, 1);
}

TEST(ActionDispatchTest, SyncActionsDoNotTouchLoadingFlag) {
    auto reg = Registry::create();
    auto s = counterStore(*reg);
    s->dispatch("increment");
    EXPECT_FALSE(s->has("incrementLoading"));
}

TEST(ActionDispatchTest, DispatchErrors) {
    auto reg = Registry::create();
    auto s = counterStore(*reg);

    EXPECT_THROW(s->dispatch("missing"), std::out_of_range);
    EXPECT_THROW(s->dispatch("later"), std::invalid_argument);
    EXPECT_THROW(s->dispatchAsync("increment", json::array()), std::invalid_argument);
    EXPECT_EQ(s->metrics().actions, 0u);
}

TEST(ActionDispatchTest, PluginDefinedActionsDispatch) {
    auto reg = Registry::create();
    auto s = counterStore(*reg);

    s->defineAction("reset", [](ActionContext& ctx, const Value&) {
        ctx.reset();
        return Value(true);
    });
    s->dispatch("increment");
    EXPECT_TRUE(s->dispatch("reset").GetBool());
    EXPECT_EQ(s->get("count").GetInt(), 0);
    EXPECT_EQ(s->kindOf("reset"), MemberKind::Action);
}
