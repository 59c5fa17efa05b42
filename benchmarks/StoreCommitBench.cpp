#include <benchmark/benchmark.h>
#include "sea/Registry.hpp"
#include <cstdint>
#include <string>
#include <vector>

using namespace sea;

namespace {

std::shared_ptr<Store> makeWideStore(Registry& reg, const std::string& id, int keys) {
    StoreOptions opts;
    opts.state = [keys] {
        Value s = json::object();
        for (int k = 0; k < keys; ++k) json::setMember(s, "field_" + std::to_string(k), Value(k));
        return s;
    };
    return reg.createStore(id, std::move(opts));
}

} // namespace

static void BM_StoreSetState(benchmark::State& state) {
    auto reg = Registry::create();
    auto store = makeWideStore(*reg, "set", static_cast<int>(state.range(0)));
    int i = 0;
    for (auto _ : state) {
        Value partial = json::object();
        json::setMember(partial, "field_0", Value(++i));
        store->setState(partial);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_StoreSetState)->Arg(4)->Arg(64)->Arg(512);

static void BM_StorePatchDraft(benchmark::State& state) {
    auto reg = Registry::create();
    auto store = makeWideStore(*reg, "draft", 64);
    int i = 0;
    for (auto _ : state) {
        store->patch([&i](Draft& d) { d.set("field_1", Value(++i)); });
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_StorePatchDraft);

static void BM_StoreNotifySubscribers(benchmark::State& state) {
    auto reg = Registry::create();
    auto store = makeWideStore(*reg, "notify", 8);
    int64_t seen = 0;
    std::vector<Store::Unsubscribe> subs;
    for (int k = 0; k < state.range(0); ++k) {
        subs.push_back(store->subscribe([&seen](const Value&, const Value&) { ++seen; }));
    }
    int i = 0;
    for (auto _ : state) {
        store->patch([&i](Draft& d) { d.set("field_2", Value(++i)); });
    }
    benchmark::DoNotOptimize(seen);
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_StoreNotifySubscribers)->Arg(1)->Arg(16)->Arg(128);

// Ten commits inside a batch produce one notification pass.
static void BM_StoreBatchedCommits(benchmark::State& state) {
    auto reg = Registry::create();
    auto store = makeWideStore(*reg, "batch", 16);
    auto unsub = store->subscribe([](const Value&, const Value&) {});
    int i = 0;
    for (auto _ : state) {
        reg->batch([&] {
            for (int k = 0; k < 10; ++k) {
                store->patch([&i](Draft& d) { d.set("field_3", Value(++i)); });
            }
        });
    }
    unsub();
    state.SetItemsProcessed(state.iterations() * 10);
}

BENCHMARK(BM_StoreBatchedCommits);

BENCHMARK_MAIN();
