/// @file request_dispatcher.cpp
/// @brief Implementation of RequestDispatcher.

#include "sim/request_dispatcher.hpp"
#include "common/error.hpp"

#include <cmath>
#include <thread>

namespace game_lb::sim {

RequestDispatcher::RequestDispatcher(ServerSelector &selector,
                                     ServerPool &pool,
                                     DelayDistribution &delay,
                                     MetricsSink &sink,
                                     double time_scale) noexcept
    : selector_{selector}, pool_{pool}, delay_{delay}, sink_{sink},
      time_scale_{time_scale} {}

auto RequestDispatcher::begin(std::uint64_t player_id)
    -> std::expected<PendingDispatch, std::error_code> {
  const auto start = MetricsRecord::Clock::now();

  // 1. Select.
  const auto server = selector_.select_next();
  if (!pool_.contains(server)) {
    return std::unexpected(make_error_code(errc::invalid_server_index));
  }

  // 2. Sample the processing time.
  const auto processing = delay_.sample();
  if (!std::isfinite(processing) || processing < 0.0) {
    return std::unexpected(make_error_code(errc::invalid_delay_sample));
  }

  return PendingDispatch{
      .player_id = player_id,
      .server_id = server,
      .processing_time = processing,
      .start_time = start,
  };
}

auto RequestDispatcher::real_delay(const PendingDispatch &pending) const
    -> std::chrono::nanoseconds {
  const auto real =
      std::chrono::duration<double>(pending.processing_time * time_scale_);
  if (real.count() <= 0.0) {
    return std::chrono::nanoseconds::zero();
  }
  return std::chrono::duration_cast<std::chrono::nanoseconds>(real);
}

auto RequestDispatcher::commit(const PendingDispatch &pending)
    -> std::expected<MetricsRecord, std::error_code> {
  // Sink first, then counters.
  const MetricsRecord record{
      .timestamp = MetricsRecord::Clock::now(),
      .start_time = pending.start_time,
      .player_id = pending.player_id,
      .server_id = pending.server_id,
      .response_time = pending.processing_time,
  };

  if (auto appended = sink_.append(record); !appended) {
    return std::unexpected(appended.error());
  }
  if (auto counted =
          pool_.record_completion(pending.server_id, pending.processing_time);
      !counted) {
    return std::unexpected(counted.error());
  }
  return record;
}

auto RequestDispatcher::dispatch(std::uint64_t player_id)
    -> std::expected<MetricsRecord, std::error_code> {
  auto pending = begin(player_id);
  if (!pending) {
    return std::unexpected(pending.error());
  }

  // Simulate processing, outside every lock.
  if (const auto delay = real_delay(*pending); delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }

  return commit(*pending);
}

} // namespace game_lb::sim
