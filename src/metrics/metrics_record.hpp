#pragma once
/// @file metrics_record.hpp
/// @brief The observable outcome of one completed dispatch.

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace game_lb {

/// @brief Immutable once appended to a MetricsSink.
///
/// `server_id` is the 0-based pool index. Human-facing output (the dispatch
/// log, CSV, report) names the server by its 1-based display name from
/// ServerPool::server_name(), so index 0 appears as "Game_Server_1".
struct MetricsRecord {
  using Clock = std::chrono::system_clock;

  Clock::time_point timestamp;  ///< Completion time.
  Clock::time_point start_time; ///< When the dispatch began.
  std::uint64_t player_id = 0;
  std::size_t server_id = 0;    ///< Pool index of the serving server.
  double response_time = 0.0;   ///< Simulated seconds.
};

} // namespace game_lb
