#include "sea/GetterCache.hpp"
#include "sea/Registry.hpp"
#include "sea/Store.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

using namespace sea;

namespace {

Value J(const char* text) { return json::fromString(text); }

} // namespace

TEST(GetterCacheTest, DoubleCountRecomputesOnlyOnRelevantChange) {
    auto reg = Registry::create();
    int calls = 0;

    StoreOptions opts;
    opts.state = [] { return json::fromString(R"({"count":5})"); };
    opts.getters["doubleCount"] = [&calls](GetterContext& g) {
        ++calls;
        return Value(g.get("count").GetInt() * 2);
    };
    auto s = reg->createStore("counter", std::move(opts));

    EXPECT_EQ(s->getter("doubleCount").GetInt(), 10);
    EXPECT_EQ(calls, 1);

    s->setState(J(R"({"other":1})"));
    EXPECT_EQ(s->getter("doubleCount").GetInt(), 10);
    EXPECT_EQ(calls, 1);

    s->setState(J(R"({"count":6})"));
    EXPECT_EQ(s->getter("doubleCount").GetInt(), 12);
    EXPECT_EQ(s->getter("doubleCount").GetInt(), 12);
    EXPECT_EQ(calls, 2);

    auto m = s->metrics();
    EXPECT_EQ(m.getterRecomputes, 2u);
    EXPECT_GE(m.getterHits, 2u);
}

TEST(GetterCacheTest, DisjointPathsDoNotInvalidateEachOther) {
    auto reg = Registry::create();
    int nameCalls = 0;
    int ageCalls = 0;

    StoreOptions opts;
    opts.state = [] { return json::fromString(R"({"user":{"name":"a","age":1},"flag":false})"); };
    opts.getters["upperName"] = [&nameCalls](GetterContext& g) {
        ++nameCalls;
        return json::clone(g.get("user.name"));
    };
    opts.getters["nextAge"] = [&ageCalls](GetterContext& g) {
        ++ageCalls;
        return Value(g.get("user.age").GetInt() + 1);
    };
    auto s = reg->createStore("people", std::move(opts));

    s->getter("upperName");
    s->getter("nextAge");

    s->patch(J(R"({"user":{"age":2}})"));
    s->setState(J(R"({"flag":true})"));

    EXPECT_STREQ(s->getter("upperName").GetString(), "a");
    EXPECT_EQ(s->getter("nextAge").GetInt(), 3);
    EXPECT_EQ(nameCalls, 1);
    EXPECT_EQ(ageCalls, 2);
}

TEST(GetterCacheTest, OuterGetterFollowsInnerGetterDependencies) {
    auto reg = Registry::create();
    int outerCalls = 0;

    StoreOptions opts;
    opts.state = [] { return json::fromString(R"({"price":10,"qty":2,"label":"x"})"); };
    opts.getters["subtotal"] = [](GetterContext& g) {
        return Value(g.get("price").GetInt() * g.get("qty").GetInt());
    };
    opts.getters["withTax"] = [&outerCalls](GetterContext& g) {
        ++outerCalls;
        return Value(g.getter("subtotal").GetInt() + 1);
    };
    auto s = reg->createStore("cart", std::move(opts));

    EXPECT_EQ(s->getter("withTax").GetInt(), 21);

    s->setState(J(R"({"label":"y"})"));
    EXPECT_EQ(s->getter("withTax").GetInt(), 21);
    EXPECT_EQ(outerCalls, 1);

    s->setState(J(R"({"qty":3})"));
    EXPECT_EQ(s->getter("withTax").GetInt(), 31);
    EXPECT_EQ(outerCalls, 2);

    const CacheEntry* e = s->cacheEntry("withTax");
    ASSERT_NE(e, nullptr);
    EXPECT_TRUE(e->trackedPaths.count("price"));
    EXPECT_TRUE(e->trackedPaths.count("qty"));
}

TEST(GetterCacheTest, DeepReadsRecordEveryPrefix) {
    PathSet paths;
    PathSet reads;
    Value state = J(R"({"a":{"b":{"c":1}}})");
    Tracer t(state, paths, &reads);

    EXPECT_EQ(t.get("a.b.c").GetInt(), 1);
    EXPECT_TRUE(paths.count("a"));
    EXPECT_TRUE(paths.count("a.b"));
    EXPECT_TRUE(paths.count("a.b.c"));
    EXPECT_EQ(reads.size(), 1u);
    EXPECT_TRUE(reads.count("a.b.c"));

    Tracer scoped = t.at("a.b");
    EXPECT_EQ(scoped.scope(), "a.b");
    EXPECT_FALSE(scoped.has("d"));
    EXPECT_TRUE(paths.count("a.b.d"));
    EXPECT_TRUE(reads.count("a.b.d"));
}

TEST(GetterCacheTest, ConditionalReadsAreTrackedFresh) {
    auto reg = Registry::create();
    int calls = 0;

    StoreOptions opts;
    opts.state = [] { return json::fromString(R"({"useA":true,"a":1,"b":2})"); };
    opts.getters["pick"] = [&calls](GetterContext& g) {
        ++calls;
        return Value(g.get("useA").GetBool() ? g.get("a").GetInt() : g.get("b").GetInt());
    };
    auto s = reg->createStore("cond", std::move(opts));

    EXPECT_EQ(s->getter("pick").GetInt(), 1);
    s->setState(J(R"({"useA":false})"));
    EXPECT_EQ(s->getter("pick").GetInt(), 2);
    EXPECT_EQ(calls, 2);

    // "a" is no longer a dependency
    s->setState(J(R"({"a":100})"));
    EXPECT_EQ(s->getter("pick").GetInt(), 2);
    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(s->cacheEntry("pick")->trackedPaths.count("a"));
}

TEST(GetterCacheTest, AbsentPathBecomingPresentInvalidates) {
    auto reg = Registry::create();
    StoreOptions opts;
    opts.getters["hasUser"] = [](GetterContext& g) { return Value(g.has("user.id")); };
    auto s = reg->createStore("presence", std::move(opts));

    EXPECT_FALSE(s->getter("hasUser").GetBool());
    s->setState(J(R"({"user":{"id":1}})"));
    EXPECT_TRUE(s->getter("hasUser").GetBool());
}

TEST(GetterCacheTest, CircularGettersThrow) {
    GetterCache cache;
    cache.define("a", [](GetterContext& g) { return g.getter("b"); });
    cache.define("b", [](GetterContext& g) { return g.getter("a"); });

    Value state = json::object();
    EXPECT_THROW(cache.read("a", state, 0), std::logic_error);
    EXPECT_EQ(cache.entry("a"), nullptr);

    // nothing left marked as computing
    cache.define("b", [](GetterContext&) { return Value(7); });
    EXPECT_EQ(cache.read("a", state, 0).GetInt(), 7);
}

TEST(GetterCacheTest, UnknownGetterThrowsOutOfRange) {
    GetterCache cache;
    Value state = json::object();
    EXPECT_THROW(cache.read("nope", state, 0), std::out_of_range);
    EXPECT_FALSE(cache.contains("nope"));
}

TEST(GetterCacheTest, ThrowingGetterLeavesNoEntry) {
    auto reg = Registry::create();
    bool fail = true;
    StoreOptions opts;
    opts.state = [] { return json::fromString(R"({"n":1})"); };
    opts.getters["fragile"] = [&fail](GetterContext& g) {
        if (fail) throw std::runtime_error("not yet");
        return json::clone(g.get("n"));
    };
    auto s = reg->createStore("fragile", std::move(opts));

    EXPECT_THROW(s->getter("fragile"), std::runtime_error);
    EXPECT_EQ(s->cacheEntry("fragile"), nullptr);

    fail = false;
    EXPECT_EQ(s->getter("fragile").GetInt(), 1);
}

TEST(GetterCacheTest, UnrelatedCommitRestampsVersion) {
    GetterCache cache;
    cache.define("n", [](GetterContext& g) { return json::clone(g.get("n")); });

    Value state = J(R"({"n":1,"m":1})");
    cache.read("n", state, 1);
    EXPECT_EQ(cache.entry("n")->version, 1u);

    state["m"].SetInt(2);
    cache.read("n", state, 2);
    EXPECT_EQ(cache.entry("n")->version, 2u);
    EXPECT_EQ(cache.invalidate({"m"}, state, 3), 0u);

    state["n"].SetInt(5);
    EXPECT_EQ(cache.invalidate({"n"}, state, 4), 1u);
    EXPECT_EQ(cache.entry("n"), nullptr);
}
