#pragma once
/// @file summary.hpp
/// @brief Aggregate statistics over a finished run: per-server load,
///        overall averages and response-time percentiles.

#include "metrics/metrics_record.hpp"
#include "pool/server_pool.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace game_lb::report {

/// @brief One server's share of the run.
struct ServerReport {
  ServerStats stats;
  std::vector<std::uint64_t> players; ///< Player ids in completion order.
};

/// @brief Snapshot of aggregate request metrics.
struct RunReport {
  std::vector<ServerReport> servers;

  std::size_t total_requests = 0; ///< Records in the sink.
  double total_response_time = 0.0;
  double elapsed_seconds = 0.0;   ///< Wall time of the run.

  // Response time (simulated seconds).
  double min_response_time = 0.0;
  double max_response_time = 0.0;
  double avg_response_time = 0.0;
  double p50_response_time = 0.0;
  double p95_response_time = 0.0;
  double p99_response_time = 0.0;

  /// @brief Completed requests per wall-clock second.
  [[nodiscard]] auto throughput_rps() const -> double {
    return (elapsed_seconds > 0.0)
               ? static_cast<double>(total_requests) / elapsed_seconds
               : 0.0;
  }

  /// @brief Largest minus smallest requests_served across servers.
  [[nodiscard]] auto load_spread() const -> std::uint64_t;
};

/// @brief Build the report from pool counters and drained records.
/// @param elapsed_seconds Wall time of the run, for throughput.
[[nodiscard]] auto summarize(const std::vector<ServerStats> &servers,
                             const std::vector<MetricsRecord> &records,
                             double elapsed_seconds = 0.0) -> RunReport;

} // namespace game_lb::report
