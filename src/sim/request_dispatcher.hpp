#pragma once
/// @file request_dispatcher.hpp
/// @brief Runs one player request through selection, simulated processing
///        and metrics recording.

#include "balancer/round_robin.hpp"
#include "metrics/metrics_record.hpp"
#include "metrics/metrics_sink.hpp"
#include "pool/server_pool.hpp"
#include "sim/delay_distribution.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <system_error>

namespace game_lb::sim {

/// @brief A routed request that still has to wait out its processing time.
struct PendingDispatch {
  std::uint64_t player_id = 0;
  std::size_t server_id = 0;
  double processing_time = 0.0; ///< Simulated seconds.
  MetricsRecord::Clock::time_point start_time;
};

/// @brief Stateless apart from the shared collaborators it references; one
///        instance serves every worker thread.
///
/// A dispatch has two halves. begin() selects the server and samples the
/// processing time; commit() appends the record and then updates the pool
/// counters. The wait in between happens outside every lock and is either a
/// blocking sleep (dispatch()) or a timer owned by the caller
/// (SimulationDriver). A dispatch either commits both its sink record and its
/// pool counters or neither: the index and the sample are validated in
/// begin(), and the pool update (which can no longer fail) follows a
/// successful append.
class RequestDispatcher {
public:
  /// @param time_scale Real seconds waited per simulated second.
  RequestDispatcher(ServerSelector &selector, ServerPool &pool,
                    DelayDistribution &delay, MetricsSink &sink,
                    double time_scale = 1.0) noexcept;

  /// @brief Select a server and sample the processing time.
  /// @return errc::invalid_server_index or errc::invalid_delay_sample on a
  ///         misbehaving selector or distribution; nothing is recorded.
  auto begin(std::uint64_t player_id)
      -> std::expected<PendingDispatch, std::error_code>;

  /// @brief Real time to wait for @p pending (processing time * time_scale).
  [[nodiscard]] auto real_delay(const PendingDispatch &pending) const
      -> std::chrono::nanoseconds;

  /// @brief Append the record for @p pending, then count it on its server.
  /// @return The appended record or a sink error from MetricsSink::append.
  auto commit(const PendingDispatch &pending)
      -> std::expected<MetricsRecord, std::error_code>;

  /// @brief begin(), a blocking wait of real_delay(), then commit().
  auto dispatch(std::uint64_t player_id)
      -> std::expected<MetricsRecord, std::error_code>;

  [[nodiscard]] auto time_scale() const noexcept -> double {
    return time_scale_;
  }

private:
  ServerSelector &selector_;
  ServerPool &pool_;
  DelayDistribution &delay_;
  MetricsSink &sink_;
  double time_scale_;
};

} // namespace game_lb::sim
