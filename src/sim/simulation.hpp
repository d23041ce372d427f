#pragma once
/// @file simulation.hpp
/// @brief Single-entry-point façade for a load-balancer simulation run.
///
/// Wraps the full pipeline (ServerPool → RoundRobinSelector →
/// DelayDistribution → MetricsSink → RequestDispatcher → SimulationDriver)
/// into one object built from a SimConfig.
///
/// Usage:
/// @code
///   auto sim = game_lb::sim::Simulation::create({.server_count = 3,
///                                                .num_players = 9});
///   auto summary = sim->run();
///   auto records = sim->sink().drain();
/// @endcode

#include "balancer/round_robin.hpp"
#include "common/config.hpp"
#include "metrics/metrics_sink.hpp"
#include "pool/server_pool.hpp"
#include "report/summary.hpp"
#include "sim/delay_distribution.hpp"
#include "sim/request_dispatcher.hpp"
#include "sim/simulation_driver.hpp"

#include <expected>
#include <memory>
#include <ostream>
#include <system_error>

namespace game_lb::sim {

/// @brief Owns every component of one simulation.
///
/// Move-only. Components live behind unique_ptr so the references held by
/// the dispatcher and driver stay valid when the Simulation moves.
class Simulation {
public:
  /// @brief Validate @p cfg and build the pipeline with the delay
  ///        distribution described by cfg.processing_time_min/max.
  /// @param log Dispatch log stream when cfg.log_path is empty (may be null).
  /// @return The simulation, or a configuration / sink-open error.
  [[nodiscard]] static auto create(SimConfig cfg, std::ostream *log = nullptr)
      -> std::expected<Simulation, std::error_code>;

  /// @brief Same as create() with an injected delay distribution.
  [[nodiscard]] static auto create(SimConfig cfg,
                                   std::unique_ptr<DelayDistribution> delay,
                                   std::ostream *log = nullptr)
      -> std::expected<Simulation, std::error_code>;

  Simulation(Simulation &&) noexcept = default;
  Simulation &operator=(Simulation &&) noexcept = default;
  Simulation(const Simulation &) = delete;
  Simulation &operator=(const Simulation &) = delete;

  /// @brief Run all players, close the sink, then write the CSV and JSON
  ///        exports configured in SimConfig.
  ///
  /// Export failures are reported through RunSummary::run_error.
  auto run(ProgressCallback on_progress = nullptr)
      -> std::expected<RunSummary, std::error_code>;

  /// @brief Report over the pool counters and the sink's records.
  [[nodiscard]] auto build_report(double elapsed_seconds = 0.0) const
      -> report::RunReport;

  [[nodiscard]] auto config() const noexcept -> const SimConfig & {
    return cfg_;
  }
  [[nodiscard]] auto pool() const noexcept -> const ServerPool & {
    return *pool_;
  }
  [[nodiscard]] auto sink() const noexcept -> const MetricsSink & {
    return *sink_;
  }
  [[nodiscard]] auto state() const noexcept -> RunState {
    return driver_->state();
  }

private:
  Simulation() = default;

  void write_exports(RunSummary &summary) const;

  SimConfig cfg_;
  std::unique_ptr<ServerPool> pool_;
  std::unique_ptr<RoundRobinSelector> selector_;
  std::unique_ptr<DelayDistribution> delay_;
  std::unique_ptr<MetricsSink> sink_;
  std::unique_ptr<RequestDispatcher> dispatcher_;
  std::unique_ptr<SimulationDriver> driver_;
};

} // namespace game_lb::sim
