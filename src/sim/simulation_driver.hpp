#pragma once
/// @file simulation_driver.hpp
/// @brief Issues N player requests with bounded concurrency and waits for
///        them to finish.

#include "metrics/metrics_sink.hpp"
#include "sim/request_dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <system_error>
#include <vector>

namespace game_lb::sim {

/// @brief Driver lifecycle. Completed is terminal.
enum class RunState : std::uint8_t {
  Idle,      ///< Constructed, run() not called yet.
  Running,   ///< Issuing dispatches.
  Draining,  ///< Nothing more will be issued; waiting for in-flight work.
  Completed, ///< Every issued dispatch produced a record or an error.
};

[[nodiscard]] constexpr auto to_string(RunState s) -> const char * {
  switch (s) {
  case RunState::Idle:
    return "Idle";
  case RunState::Running:
    return "Running";
  case RunState::Draining:
    return "Draining";
  case RunState::Completed:
    return "Completed";
  }
  return "Unknown";
}

/// @brief A request that was issued but did not complete.
struct DispatchFailure {
  std::uint64_t player_id = 0;
  std::error_code error;
};

/// @brief Outcome of one run.
struct RunSummary {
  std::size_t requested = 0;  ///< num_players passed to run().
  std::size_t issued = 0;     ///< Handed to a worker.
  std::size_t succeeded = 0;  ///< Produced a MetricsRecord.
  std::size_t failed = 0;     ///< Issued but ended in an error.
  std::size_t not_issued = 0; ///< Skipped after a timeout or sink error.
  std::chrono::duration<double> wall_time{};
  bool timed_out = false;
  std::error_code run_error; ///< First sink error; stops issuing.
  std::vector<DispatchFailure> failures;
  std::size_t callback_failures = 0; ///< Progress callbacks that threw.
  RunState state = RunState::Idle;

  /// @brief True when every requested player was served.
  [[nodiscard]] auto all_succeeded() const -> bool {
    return succeeded == requested && !run_error;
  }
};

/// @brief Per-completion callback (for live progress reporting).
/// Arguments: player_id, completed so far, total requested, was_successful.
/// Runs on a worker thread while the dispatch still holds its in-flight
/// slot. Exceptions it throws are logged and counted, never propagated.
using ProgressCallback =
    std::function<void(std::uint64_t, std::size_t, std::size_t, bool)>;

struct DriverOptions {
  /// Real-time budget for issuing requests. Unset means unlimited.
  std::optional<std::chrono::duration<double>> timeout;
  /// Real pause between consecutive issues. Never extends past the timeout.
  std::chrono::duration<double> arrival_interval{0.0};
  /// Worker threads; 0 means std::thread::hardware_concurrency(). Never more
  /// than the concurrency limit.
  std::size_t worker_threads = 0;
};

/// @brief Runs a simulation on a Boost.Asio thread pool.
///
/// Player ids are 1..num_players. At most `concurrency_limit` dispatches are
/// in flight at once. The processing wait is a steady_timer on the pool, so
/// the in-flight limit does not depend on the number of worker threads. When the timeout elapses or the sink reports an error,
/// no further requests are issued but those already in flight finish. Failed
/// requests are never retried. The sink is flushed before run() returns.
class SimulationDriver {
public:
  SimulationDriver(RequestDispatcher &dispatcher, MetricsSink &sink,
                   DriverOptions opts = {}) noexcept;

  SimulationDriver(const SimulationDriver &) = delete;
  SimulationDriver &operator=(const SimulationDriver &) = delete;

  /// @brief Dispatch @p num_players requests.
  /// @param concurrency_limit Maximum in-flight dispatches; values above
  ///        num_players are clamped.
  /// @return The summary, errc::invalid_concurrency for a zero limit,
  ///         std::errc::operation_not_permitted if the driver already ran, or
  ///         std::errc::resource_unavailable_try_again if the worker threads
  ///         could not be started (the driver stays Idle).
  auto run(std::size_t num_players, std::size_t concurrency_limit,
           ProgressCallback on_progress = nullptr)
      -> std::expected<RunSummary, std::error_code>;

  /// @brief run() with concurrency_limit = num_players.
  auto run(std::size_t num_players) -> std::expected<RunSummary, std::error_code>;

  [[nodiscard]] auto state() const noexcept -> RunState;

private:
  RequestDispatcher &dispatcher_;
  MetricsSink &sink_;
  DriverOptions opts_;
  std::atomic<RunState> state_{RunState::Idle};
};

} // namespace game_lb::sim
