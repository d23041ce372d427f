/// @file simulation_driver.cpp
/// @brief SimulationDriver: bounded-concurrency issuing on a Boost.Asio
///        thread pool.

#include "sim/simulation_driver.hpp"
#include "common/error.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/system/system_error.hpp>

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <new>
#include <thread>
#include <utility>

namespace game_lb::sim {

namespace net = boost::asio;

namespace {

/// Shared between the issuing thread and the workers of one run.
struct InFlight {
  std::mutex mutex;
  std::condition_variable cv;
  std::size_t in_flight = 0;
  std::size_t completed = 0;
  bool abort = false;
};

/// Gives the in-flight slot back however the completion path exits.
struct SlotRelease {
  InFlight &shared;

  ~SlotRelease() {
    {
      std::lock_guard lock(shared.mutex);
      --shared.in_flight;
    }
    shared.cv.notify_all();
  }
};

/// Runs one half of a dispatch, turning an exception into an error code
/// attributed to @p player.
template <typename Step>
auto guarded(std::uint64_t player, Step &&step) -> decltype(step()) {
  try {
    return step();
  } catch (const std::bad_alloc &) {
    std::cerr << "[Driver] player " << player << ": out of memory\n";
    return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
  } catch (const std::exception &e) {
    std::cerr << "[Driver] player " << player << ": " << e.what() << '\n';
    return std::unexpected(make_error_code(errc::dispatch_exception));
  }
}

auto worker_count(std::size_t requested, std::size_t limit) -> std::size_t {
  auto n = requested;
  if (n == 0) {
    n = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  }
  return std::min(n, limit);
}

} // namespace

SimulationDriver::SimulationDriver(RequestDispatcher &dispatcher,
                                   MetricsSink &sink,
                                   DriverOptions opts) noexcept
    : dispatcher_{dispatcher}, sink_{sink}, opts_{std::move(opts)} {}

auto SimulationDriver::state() const noexcept -> RunState {
  return state_.load(std::memory_order_acquire);
}

auto SimulationDriver::run(std::size_t num_players)
    -> std::expected<RunSummary, std::error_code> {
  return run(num_players, std::max<std::size_t>(1, num_players));
}

auto SimulationDriver::run(std::size_t num_players,
                           std::size_t concurrency_limit,
                           ProgressCallback on_progress)
    -> std::expected<RunSummary, std::error_code> {
  if (concurrency_limit == 0) {
    return std::unexpected(make_error_code(errc::invalid_concurrency));
  }
  auto expected_state = RunState::Idle;
  if (!state_.compare_exchange_strong(expected_state, RunState::Running)) {
    return std::unexpected(
        std::make_error_code(std::errc::operation_not_permitted));
  }

  using Clock = std::chrono::steady_clock;
  const auto t0 = Clock::now();
  std::optional<Clock::time_point> deadline;
  if (opts_.timeout) {
    deadline = t0 + std::chrono::duration_cast<Clock::duration>(*opts_.timeout);
  }

  const auto limit =
      std::max<std::size_t>(1, std::min(concurrency_limit, num_players));
  const auto threads = worker_count(opts_.worker_threads, limit);

  std::unique_ptr<net::thread_pool> workers;
  try {
    workers = std::make_unique<net::thread_pool>(threads);
  } catch (const boost::system::system_error &e) {
    std::cerr << "[Driver] could not start " << threads
              << " worker thread(s): " << e.what() << '\n';
    state_.store(RunState::Idle, std::memory_order_release);
    return std::unexpected(
        std::make_error_code(std::errc::resource_unavailable_try_again));
  }

  RunSummary summary;
  summary.requested = num_players;
  InFlight shared;

  // Completion path of every issued dispatch: record the outcome, report
  // progress, then release the slot.
  auto finish = [&](std::uint64_t player,
                    const std::expected<MetricsRecord, std::error_code>
                        &result) {
    SlotRelease release{shared};
    std::size_t completed = 0;
    {
      std::lock_guard lock(shared.mutex);
      if (result) {
        ++summary.succeeded;
      } else {
        ++summary.failed;
        summary.failures.push_back({player, result.error()});
        if (is_sink_error(result.error()) && !summary.run_error) {
          summary.run_error = result.error();
          shared.abort = true;
        }
      }
      completed = ++shared.completed;
    }

    if (on_progress) {
      try {
        on_progress(player, completed, num_players, result.has_value());
      } catch (const std::exception &e) {
        std::cerr << "[Driver] progress callback failed for player "
                  << player << ": " << e.what() << '\n';
        std::lock_guard lock(shared.mutex);
        ++summary.callback_failures;
      }
    }
  };

  // ─── Running: issue ────────────────────────────────────────────────

  for (std::uint64_t player = 1; player <= num_players; ++player) {
    {
      std::unique_lock lock(shared.mutex);
      auto has_room = [&] { return shared.in_flight < limit || shared.abort; };
      if (deadline) {
        if (!shared.cv.wait_until(lock, *deadline, has_room) ||
            Clock::now() >= *deadline) {
          summary.timed_out = true;
          break;
        }
      } else {
        shared.cv.wait(lock, has_room);
      }
      if (shared.abort) {
        break;
      }
      ++shared.in_flight;
    }
    ++summary.issued;

    net::post(*workers, [this, player, &workers, &finish] {
      auto pending =
          guarded(player, [&] { return dispatcher_.begin(player); });
      if (!pending) {
        finish(player, std::unexpected(pending.error()));
        return;
      }

      // The processing wait holds no thread.
      try {
        auto timer = std::make_shared<net::steady_timer>(
            *workers, dispatcher_.real_delay(*pending));
        timer->async_wait([this, player, timer, p = *pending,
                           &finish](const boost::system::error_code &ec) {
          if (ec) {
            finish(player, std::unexpected(std::make_error_code(
                               std::errc::operation_canceled)));
            return;
          }
          finish(player, guarded(player, [&] { return dispatcher_.commit(p); }));
        });
      } catch (const std::exception &e) {
        std::cerr << "[Driver] player " << player
                  << ": could not schedule processing: " << e.what() << '\n';
        finish(player, std::unexpected(make_error_code(errc::dispatch_exception)));
      }
    });

    if (opts_.arrival_interval.count() > 0.0 && player < num_players) {
      auto until = Clock::now() + std::chrono::duration_cast<Clock::duration>(
                                      opts_.arrival_interval);
      if (deadline) {
        until = std::min(until, *deadline);
      }
      std::unique_lock lock(shared.mutex);
      shared.cv.wait_until(lock, until, [&] { return shared.abort; });
    }
  }

  // ─── Draining: wait for in-flight work ─────────────────────────────

  state_.store(RunState::Draining, std::memory_order_release);
  {
    std::unique_lock lock(shared.mutex);
    shared.cv.wait(lock, [&] { return shared.in_flight == 0; });
  }
  workers->join();

  summary.not_issued = num_players - summary.issued;
  if (summary.timed_out) {
    std::cerr << "[Driver] timeout reached, " << summary.not_issued
              << " request(s) not issued\n";
  }
  if (summary.run_error) {
    std::cerr << "[Driver] run aborted: " << summary.run_error.message()
              << '\n';
  }

  if (auto flushed = sink_.flush(); !flushed && !summary.run_error) {
    summary.run_error = flushed.error();
  }

  summary.wall_time = Clock::now() - t0;
  state_.store(RunState::Completed, std::memory_order_release);
  summary.state = RunState::Completed;
  return summary;
}

} // namespace game_lb::sim
