/// @file sim_main.cpp
/// @brief Entry point for the load-balancer simulation.
///
/// Loads the configuration (JSON file and/or flags), runs the simulation,
/// and prints a per-server and latency report.

#include "common/config.hpp"
#include "common/error.hpp"
#include "common/time_format.hpp"
#include "sim/simulation.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace game_lb;
using namespace game_lb::sim;

// ─── CLI argument parsing ───────────────────────────────────────────────

struct CliArgs {
  std::optional<std::string> config_path;
  std::optional<std::size_t> servers;
  std::optional<std::size_t> players;
  std::optional<std::size_t> concurrency;
  std::optional<double> min_time;
  std::optional<double> max_time;
  std::optional<double> time_scale;
  std::optional<double> timeout;
  std::optional<double> interval;
  std::optional<std::string> log_path;
  std::optional<std::string> csv_path;
  std::optional<std::string> json_path;
  bool show_progress = true;
  bool log_to_stdout = false;
};

void print_usage(const char *prog) {
  std::cout
      << "Usage: " << prog << " [options]\n\n"
      << "Options:\n"
      << "  --config <file>      JSON configuration file\n"
      << "  --servers <N>        Game servers in the pool (default: 3)\n"
      << "  --players <N>        Player requests to simulate (default: 20)\n"
      << "  --concurrency <N>    Max in-flight requests (default: players)\n"
      << "  --min <S>            Min processing time, seconds (default: 1)\n"
      << "  --max <S>            Max processing time, seconds (default: 3)\n"
      << "  --time-scale <X>     Real seconds per simulated second "
         "(default: 1)\n"
      << "  --timeout <S>        Stop issuing after S real seconds\n"
      << "  --interval <S>       Pause between requests, seconds "
         "(default: 0)\n"
      << "  --log <file>         Append dispatch log lines to file\n"
      << "  --log-stdout         Print dispatch log lines to stdout\n"
      << "  --csv <file>         Write per-request metrics CSV\n"
      << "  --json <file>        Write full run report as JSON\n"
      << "  --no-progress        Disable progress output\n"
      << "  --help               Show this help\n";
}

auto parse_args(int argc, char *argv[]) -> CliArgs {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--servers" && i + 1 < argc) {
      args.servers = std::stoull(argv[++i]);
    } else if (arg == "--players" && i + 1 < argc) {
      args.players = std::stoull(argv[++i]);
    } else if (arg == "--concurrency" && i + 1 < argc) {
      args.concurrency = std::stoull(argv[++i]);
    } else if (arg == "--min" && i + 1 < argc) {
      args.min_time = std::stod(argv[++i]);
    } else if (arg == "--max" && i + 1 < argc) {
      args.max_time = std::stod(argv[++i]);
    } else if (arg == "--time-scale" && i + 1 < argc) {
      args.time_scale = std::stod(argv[++i]);
    } else if (arg == "--timeout" && i + 1 < argc) {
      args.timeout = std::stod(argv[++i]);
    } else if (arg == "--interval" && i + 1 < argc) {
      args.interval = std::stod(argv[++i]);
    } else if (arg == "--log" && i + 1 < argc) {
      args.log_path = argv[++i];
    } else if (arg == "--log-stdout") {
      args.log_to_stdout = true;
    } else if (arg == "--csv" && i + 1 < argc) {
      args.csv_path = argv[++i];
    } else if (arg == "--json" && i + 1 < argc) {
      args.json_path = argv[++i];
    } else if (arg == "--no-progress") {
      args.show_progress = false;
    } else {
      std::cerr << "Unknown option: " << arg << "\n\n";
      print_usage(argv[0]);
      std::exit(1);
    }
  }
  return args;
}

/// Flags override values from the config file.
void apply_overrides(const CliArgs &args, SimConfig &cfg) {
  if (args.servers)
    cfg.server_count = *args.servers;
  if (args.players)
    cfg.num_players = *args.players;
  if (args.concurrency)
    cfg.concurrency_limit = *args.concurrency;
  if (args.min_time)
    cfg.processing_time_min = *args.min_time;
  if (args.max_time)
    cfg.processing_time_max = *args.max_time;
  if (args.time_scale)
    cfg.time_scale = *args.time_scale;
  if (args.timeout)
    cfg.timeout_seconds = *args.timeout;
  if (args.interval)
    cfg.arrival_interval_seconds = *args.interval;
  if (args.log_path)
    cfg.log_path = *args.log_path;
  if (args.csv_path)
    cfg.csv_path = *args.csv_path;
  if (args.json_path)
    cfg.json_path = *args.json_path;
}

// ─── Report formatting ─────────────────────────────────────────────────

void print_separator() { std::cout << std::string(60, '=') << '\n'; }

auto join_players(const std::vector<std::uint64_t> &players) -> std::string {
  std::ostringstream out;
  for (std::size_t i = 0; i < players.size(); ++i) {
    if (i > 0)
      out << ", ";
    out << "Player_" << players[i];
  }
  return out.str();
}

void print_report(const RunSummary &s, const report::RunReport &r) {
  std::cout << '\n';
  print_separator();
  std::cout << "  LOAD BALANCER SIMULATION RESULTS\n";
  print_separator();

  std::cout << "\n  Requests\n"
            << "    Requested:   " << s.requested << '\n'
            << "    Succeeded:   " << s.succeeded << '\n'
            << "    Failed:      " << s.failed << '\n'
            << "    Not issued:  " << s.not_issued << '\n'
            << "    State:       " << to_string(s.state) << '\n';
  for (const auto &f : s.failures) {
    std::cout << "    Player_" << f.player_id << ": " << f.error.message()
              << '\n';
  }
  if (s.run_error) {
    std::cout << "    Run error:   " << s.run_error.message() << '\n';
  }

  std::cout << std::fixed << std::setprecision(3);
  std::cout << "\n  Throughput\n"
            << "    Duration:    " << s.wall_time.count() << " s\n"
            << "    Rate:        " << std::setprecision(1)
            << r.throughput_rps() << " req/s\n";

  std::cout << std::setprecision(3) << "\n  Servers\n";
  for (const auto &srv : r.servers) {
    std::cout << "    " << srv.stats.name << '\n'
              << "      Players Handled:       " << srv.stats.requests_served
              << '\n'
              << "      Average Response Time: "
              << srv.stats.avg_response_time() << " s\n"
              << "      Player List:           " << join_players(srv.players)
              << '\n';
  }
  std::cout << "    Load spread: " << r.load_spread() << " request(s)\n";

  std::cout << "\n  Response Time\n"
            << "    Min:         " << r.min_response_time << " s\n"
            << "    Avg:         " << r.avg_response_time << " s\n"
            << "    P50:         " << r.p50_response_time << " s\n"
            << "    P95:         " << r.p95_response_time << " s\n"
            << "    P99:         " << r.p99_response_time << " s\n"
            << "    Max:         " << r.max_response_time << " s\n";

  print_separator();
  std::cout << std::endl;
}

} // namespace

// ─── Main ───────────────────────────────────────────────────────────────

int main(int argc, char *argv[]) {
  auto args = parse_args(argc, argv);

  // 1. Build the configuration.
  SimConfig cfg;
  if (args.config_path) {
    auto loaded = load_config(*args.config_path);
    if (!loaded) {
      std::cerr << "ERROR: Failed to load " << *args.config_path << ": "
                << loaded.error().message() << '\n';
      return 1;
    }
    cfg = std::move(*loaded);
  }
  apply_overrides(args, cfg);

  std::cout << "\n  Load Balancer Simulation\n"
            << "  Servers:     " << cfg.server_count << '\n'
            << "  Players:     " << cfg.num_players << '\n'
            << "  Concurrency: " << cfg.effective_concurrency() << '\n'
            << "  Processing:  " << format_seconds(cfg.processing_time_min)
            << " - " << format_seconds(cfg.processing_time_max) << " s\n";
  if (cfg.time_scale != 1.0) {
    std::cout << "  Time scale:  x" << cfg.time_scale << '\n';
  }
  std::cout << '\n';

  // 2. Create the simulation.
  auto sim_result =
      Simulation::create(cfg, args.log_to_stdout ? &std::cout : nullptr);
  if (!sim_result.has_value()) {
    std::cerr << "ERROR: Failed to create simulation: "
              << sim_result.error().message() << '\n';
    return 1;
  }
  auto sim = std::move(*sim_result);

  // 3. Run it.
  std::mutex progress_mutex;
  const bool show_progress = args.show_progress && !args.log_to_stdout;
  auto summary = sim.run([&](std::uint64_t, std::size_t completed,
                             std::size_t total, bool) {
    if (!show_progress)
      return;
    std::lock_guard lock(progress_mutex);
    auto pct = static_cast<int>(100.0 * static_cast<double>(completed) /
                                static_cast<double>(total));
    std::cout << "\r  Progress: " << pct << "% (" << completed << "/" << total
              << ")" << std::flush;
  });
  if (show_progress) {
    std::cout << '\n';
  }
  if (!summary) {
    std::cerr << "ERROR: Simulation did not run: "
              << summary.error().message() << '\n';
    return 1;
  }

  // 4. Print results.
  print_report(*summary, sim.build_report(summary->wall_time.count()));

  if (!cfg.log_path.empty())
    std::cout << "  Text log:    " << cfg.log_path << '\n';
  if (!cfg.csv_path.empty())
    std::cout << "  CSV metrics: " << cfg.csv_path << '\n';
  if (!cfg.json_path.empty())
    std::cout << "  JSON report: " << cfg.json_path << '\n';

  return summary->all_succeeded() ? 0 : 2;
}
