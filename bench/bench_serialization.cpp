#include "metrics/metrics_sink.hpp"
#include "report/csv_exporter.hpp"
#include "report/summary.hpp"
#include "serialization/json_serializer.hpp"
#include <benchmark/benchmark.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <vector>

using namespace game_lb;

namespace {

auto make_records(std::size_t n) -> std::vector<MetricsRecord> {
  std::vector<MetricsRecord> records;
  records.reserve(n);
  const auto now = MetricsRecord::Clock::now();
  for (std::size_t i = 0; i < n; ++i) {
    records.push_back({.timestamp = now,
                       .start_time = now,
                       .player_id = i + 1,
                       .server_id = i % 3,
                       .response_time = 1.0 + static_cast<double>(i % 200) /
                                                  100.0});
  }
  return records;
}

} // namespace

static void BM_Serialization_LogLine(benchmark::State &state) {
  const auto record = make_records(1).front();
  for (auto _ : state) {
    std::string s = MetricsSink::format_line(record);
    benchmark::DoNotOptimize(s);
  }
}

static void BM_Serialization_SingleRecordJson(benchmark::State &state) {
  const auto record = make_records(1).front();
  for (auto _ : state) {
    nlohmann::json j = record;
    std::string s = j.dump();
    benchmark::DoNotOptimize(s);
  }
}

static void BM_Serialization_Csv(benchmark::State &state) {
  const auto records = make_records(static_cast<std::size_t>(state.range(0)));
  for (auto _ : state) {
    std::ostringstream out;
    auto ok = report::write_csv(out, records);
    benchmark::DoNotOptimize(ok);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void BM_Serialization_RunDocument(benchmark::State &state) {
  const auto records = make_records(static_cast<std::size_t>(state.range(0)));
  auto pool = ServerPool::create(3).value();
  for (const auto &r : records) {
    if (!pool.record_completion(r.server_id, r.response_time)) {
      state.SkipWithError("record_completion failed");
      return;
    }
  }
  const auto rep = report::summarize(pool.snapshot(), records, 1.0);
  sim::RunSummary summary;
  summary.requested = summary.issued = summary.succeeded = records.size();

  for (auto _ : state) {
    std::string s = report::run_to_json(summary, rep, records).dump();
    benchmark::DoNotOptimize(s);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_Serialization_LogLine);
BENCHMARK(BM_Serialization_SingleRecordJson);
BENCHMARK(BM_Serialization_Csv)->Range(64, 8192);
BENCHMARK(BM_Serialization_RunDocument)->Range(64, 8192);

BENCHMARK_MAIN();
