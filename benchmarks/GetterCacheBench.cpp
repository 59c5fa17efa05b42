#include <benchmark/benchmark.h>
#include "sea/Registry.hpp"
#include <string>

using namespace sea;

namespace {

std::shared_ptr<Store> makeProfileStore(Registry& reg, const std::string& id) {
    StoreOptions opts;
    opts.state = [] { return json::fromString(R"({"user":{"name":"ada","age":36},"count":0})"); };
    opts.getters["greeting"] = [](GetterContext& g) {
        return json::string("hello " + std::string(g.get("user.name").GetString()));
    };
    opts.getters["age"] = [](GetterContext& g) { return Value(g.get("user.age").GetInt()); };
    return reg.createStore(id, std::move(opts));
}

} // namespace

static void BM_GetterCachedHit(benchmark::State& state) {
    auto reg = Registry::create();
    auto store = makeProfileStore(*reg, "hit");
    store->getter("greeting");
    for (auto _ : state) {
        benchmark::DoNotOptimize(store->getter("greeting"));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_GetterCachedHit);

// Unrelated commits bump the version; the snapshot check keeps the entry.
static void BM_GetterAfterUnrelatedCommit(benchmark::State& state) {
    auto reg = Registry::create();
    auto store = makeProfileStore(*reg, "unrelated");
    store->getter("greeting");
    int i = 0;
    for (auto _ : state) {
        store->patch([&i](Draft& d) { d.set("count", Value(++i)); });
        benchmark::DoNotOptimize(store->getter("greeting"));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_GetterAfterUnrelatedCommit);

static void BM_GetterRecompute(benchmark::State& state) {
    auto reg = Registry::create();
    auto store = makeProfileStore(*reg, "recompute");
    int i = 0;
    for (auto _ : state) {
        store->patch([&i](Draft& d) { d.set("user.age", Value(++i)); });
        benchmark::DoNotOptimize(store->getter("age"));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_GetterRecompute);

BENCHMARK_MAIN();
