#include "balancer/round_robin.hpp"
#include "metrics/metrics_sink.hpp"
#include "pool/server_pool.hpp"
#include "sim/delay_distribution.hpp"
#include "sim/request_dispatcher.hpp"
#include "sim/simulation.hpp"
#include <benchmark/benchmark.h>

using namespace game_lb;
using namespace game_lb::sim;

// Full dispatch path with zero delay: select, sample, record, count
static void BM_Dispatch_ZeroDelay(benchmark::State &state) {
  auto pool = ServerPool::create(3).value();
  auto selector = RoundRobinSelector::create(3).value();
  FixedDelay delay{0.0};
  MetricsSink sink;
  RequestDispatcher dispatcher{*selector, pool, delay, sink, 1.0};

  std::uint64_t player = 0;
  for (auto _ : state) {
    auto rec = dispatcher.dispatch(++player);
    if (!rec) {
      state.SkipWithError("dispatch failed");
      break;
    }
  }
}

// End-to-end run through the thread pool, by concurrency limit
static void BM_Dispatch_FullRun(benchmark::State &state) {
  const auto players = std::size_t{2000};
  for (auto _ : state) {
    auto sim = Simulation::create(
                   {.server_count = 3,
                    .num_players = players,
                    .concurrency_limit =
                        static_cast<std::size_t>(state.range(0)),
                    .processing_time_min = 0.0,
                    .processing_time_max = 0.0})
                   .value();
    auto summary = sim.run();
    if (!summary || !summary->all_succeeded()) {
      state.SkipWithError("run failed");
      break;
    }
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<std::int64_t>(players));
}

BENCHMARK(BM_Dispatch_ZeroDelay);
BENCHMARK(BM_Dispatch_FullRun)->RangeMultiplier(4)->Range(1, 256);

BENCHMARK_MAIN();
