#include "balancer/round_robin.hpp"
#include "pool/server_pool.hpp"
#include "report/summary.hpp"
#include <benchmark/benchmark.h>
#include <memory>
#include <vector>

using namespace game_lb;

static void BM_Selector_SelectNext(benchmark::State &state) {
  auto selector =
      RoundRobinSelector::create(static_cast<std::size_t>(state.range(0)))
          .value();
  for (auto _ : state) {
    benchmark::DoNotOptimize(selector->select_next());
  }
}

// Through the abstract interface, as the dispatcher calls it
static void BM_Selector_Virtual(benchmark::State &state) {
  std::unique_ptr<ServerSelector> selector =
      RoundRobinSelector::create(3).value();
  for (auto _ : state) {
    benchmark::DoNotOptimize(selector->select_next());
  }
}

static void BM_Pool_Snapshot(benchmark::State &state) {
  auto pool =
      ServerPool::create(static_cast<std::size_t>(state.range(0))).value();
  for (auto _ : state) {
    auto snap = pool.snapshot();
    benchmark::DoNotOptimize(snap);
  }
}

static void BM_Report_Summarize(benchmark::State &state) {
  auto pool = ServerPool::create(3).value();
  std::vector<MetricsRecord> records;
  const auto now = MetricsRecord::Clock::now();
  for (std::int64_t i = 0; i < state.range(0); ++i) {
    records.push_back({.timestamp = now,
                       .start_time = now,
                       .player_id = static_cast<std::uint64_t>(i + 1),
                       .server_id = static_cast<std::size_t>(i % 3),
                       .response_time = static_cast<double>(i % 97)});
  }
  for (auto _ : state) {
    auto rep = report::summarize(pool.snapshot(), records);
    benchmark::DoNotOptimize(rep);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_Selector_SelectNext)->RangeMultiplier(4)->Range(1, 256);
BENCHMARK(BM_Selector_Virtual);
BENCHMARK(BM_Pool_Snapshot)->RangeMultiplier(4)->Range(1, 256);
BENCHMARK(BM_Report_Summarize)->Range(64, 16384);

BENCHMARK_MAIN();
