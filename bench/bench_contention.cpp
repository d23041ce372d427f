#include "balancer/round_robin.hpp"
#include "metrics/metrics_sink.hpp"
#include "pool/server_pool.hpp"
#include <benchmark/benchmark.h>
#include <thread>

using namespace game_lb;

// Multithreaded selector benchmark to measure cursor contention
static void BM_Contention_Select(benchmark::State &state) {
  static auto selector = RoundRobinSelector::create(8).value();

  for (auto _ : state) {
    benchmark::DoNotOptimize(selector->select_next());
  }
}

// Per-server slot locks: threads spread across servers
static void BM_Contention_RecordCompletion(benchmark::State &state) {
  static auto pool = ServerPool::create(8).value();
  std::size_t idx = static_cast<std::size_t>(state.thread_index()) % 8;

  for (auto _ : state) {
    auto ok = pool.record_completion(idx, 1.0);
    if (!ok) {
      state.SkipWithError("record_completion failed");
      break;
    }
  }
}

// Single sink mutex, no log stream
static void BM_Contention_SinkAppend(benchmark::State &state) {
  static MetricsSink sink;
  const auto now = MetricsRecord::Clock::now();
  const MetricsRecord record{.timestamp = now,
                             .start_time = now,
                             .player_id = 1,
                             .server_id = 0,
                             .response_time = 1.0};

  for (auto _ : state) {
    auto ok = sink.append(record);
    if (!ok) {
      state.SkipWithError("append failed");
      break;
    }
  }
}

// Register for various thread counts
BENCHMARK(BM_Contention_Select)
    ->ThreadRange(1, std::thread::hardware_concurrency());
BENCHMARK(BM_Contention_RecordCompletion)
    ->ThreadRange(1, std::thread::hardware_concurrency());
// Fixed iteration count: the sink keeps every record
BENCHMARK(BM_Contention_SinkAppend)
    ->Iterations(100000)
    ->ThreadRange(1, std::thread::hardware_concurrency());

BENCHMARK_MAIN();
