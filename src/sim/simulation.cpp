/// @file simulation.cpp
/// @brief Implementation of the Simulation façade.

#include "sim/simulation.hpp"
#include "common/error.hpp"
#include "report/csv_exporter.hpp"
#include "serialization/json_serializer.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace game_lb::sim {

auto Simulation::create(SimConfig cfg, std::ostream *log)
    -> std::expected<Simulation, std::error_code> {
  if (auto ok = validate(cfg); !ok) {
    return std::unexpected(ok.error());
  }
  auto delay =
      make_delay_distribution(cfg.processing_time_min, cfg.processing_time_max);
  if (!delay) {
    return std::unexpected(delay.error());
  }
  return create(std::move(cfg), std::move(*delay), log);
}

auto Simulation::create(SimConfig cfg,
                        std::unique_ptr<DelayDistribution> delay,
                        std::ostream *log)
    -> std::expected<Simulation, std::error_code> {
  if (auto ok = validate(cfg); !ok) {
    return std::unexpected(ok.error());
  }

  Simulation s;
  s.cfg_ = std::move(cfg);

  // 1. Server pool and selector (both reject server_count == 0).
  auto pool = ServerPool::create(s.cfg_.server_count);
  if (!pool) {
    return std::unexpected(pool.error());
  }
  s.pool_ = std::make_unique<ServerPool>(std::move(*pool));

  auto selector = RoundRobinSelector::create(s.cfg_.server_count);
  if (!selector) {
    return std::unexpected(selector.error());
  }
  s.selector_ = std::move(*selector);

  // 2. Delay source.
  if (!delay) {
    return std::unexpected(make_error_code(errc::invalid_delay_range));
  }
  s.delay_ = std::move(delay);

  // 3. Sink: owned log file if configured, caller's stream otherwise.
  const MetricsSink::Timeout append_timeout{s.cfg_.append_timeout_ms};
  if (!s.cfg_.log_path.empty()) {
    auto sink = MetricsSink::open(s.cfg_.log_path, append_timeout);
    if (!sink) {
      return std::unexpected(sink.error());
    }
    s.sink_ = std::move(*sink);
  } else {
    s.sink_ = std::make_unique<MetricsSink>(log, append_timeout);
  }

  // 4. Dispatcher and driver.
  s.dispatcher_ = std::make_unique<RequestDispatcher>(
      *s.selector_, *s.pool_, *s.delay_, *s.sink_, s.cfg_.time_scale);

  DriverOptions opts;
  if (s.cfg_.timeout_seconds) {
    opts.timeout = std::chrono::duration<double>(*s.cfg_.timeout_seconds);
  }
  opts.arrival_interval = std::chrono::duration<double>(
      s.cfg_.arrival_interval_seconds * s.cfg_.time_scale);
  s.driver_ = std::make_unique<SimulationDriver>(*s.dispatcher_, *s.sink_,
                                                 std::move(opts));

  return s;
}

auto Simulation::run(ProgressCallback on_progress)
    -> std::expected<RunSummary, std::error_code> {
  auto summary = driver_->run(cfg_.num_players, cfg_.effective_concurrency(),
                              std::move(on_progress));
  if (!summary) {
    return summary;
  }

  // Teardown: the sink is closed once the run has drained.
  if (auto closed = sink_->close(); !closed && !summary->run_error) {
    summary->run_error = closed.error();
  }

  write_exports(*summary);
  return summary;
}

void Simulation::write_exports(RunSummary &summary) const {
  if (cfg_.csv_path.empty() && cfg_.json_path.empty()) {
    return;
  }
  const auto records = sink_->drain();

  if (!cfg_.csv_path.empty()) {
    if (auto ok = report::export_csv(cfg_.csv_path, records); !ok) {
      std::cerr << "[Simulation] CSV export to " << cfg_.csv_path
                << " failed: " << ok.error().message() << '\n';
      if (!summary.run_error) {
        summary.run_error = ok.error();
      }
    }
  }

  if (!cfg_.json_path.empty()) {
    const auto rep = build_report(summary.wall_time.count());
    if (auto ok = report::export_json(cfg_.json_path, summary, rep, records);
        !ok) {
      std::cerr << "[Simulation] JSON export to " << cfg_.json_path
                << " failed: " << ok.error().message() << '\n';
      if (!summary.run_error) {
        summary.run_error = ok.error();
      }
    }
  }
}

auto Simulation::build_report(double elapsed_seconds) const
    -> report::RunReport {
  return report::summarize(pool_->snapshot(), sink_->drain(), elapsed_seconds);
}

} // namespace game_lb::sim
