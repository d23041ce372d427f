/// @file summary.cpp
/// @brief Run report computation.

#include "report/summary.hpp"

#include <algorithm>

namespace game_lb::report {

auto RunReport::load_spread() const -> std::uint64_t {
  if (servers.empty()) {
    return 0;
  }
  auto [lo, hi] = std::minmax_element(
      servers.begin(), servers.end(), [](const auto &a, const auto &b) {
        return a.stats.requests_served < b.stats.requests_served;
      });
  return hi->stats.requests_served - lo->stats.requests_served;
}

auto summarize(const std::vector<ServerStats> &servers,
               const std::vector<MetricsRecord> &records,
               double elapsed_seconds) -> RunReport {
  RunReport r;
  r.elapsed_seconds = elapsed_seconds;
  r.total_requests = records.size();

  r.servers.reserve(servers.size());
  for (const auto &s : servers) {
    r.servers.push_back({.stats = s, .players = {}});
  }
  for (const auto &rec : records) {
    if (rec.server_id < r.servers.size()) {
      r.servers[rec.server_id].players.push_back(rec.player_id);
    }
  }

  if (records.empty()) {
    return r;
  }

  // Sort a copy for percentile computation.
  std::vector<double> sorted;
  sorted.reserve(records.size());
  for (const auto &rec : records) {
    sorted.push_back(rec.response_time);
  }
  std::sort(sorted.begin(), sorted.end());

  r.min_response_time = sorted.front();
  r.max_response_time = sorted.back();

  for (auto v : sorted)
    r.total_response_time += v;
  r.avg_response_time =
      r.total_response_time / static_cast<double>(sorted.size());

  auto pct = [&](double p) -> double {
    auto idx =
        static_cast<std::size_t>(p * static_cast<double>(sorted.size() - 1));
    return sorted[idx];
  };

  r.p50_response_time = pct(0.50);
  r.p95_response_time = pct(0.95);
  r.p99_response_time = pct(0.99);

  return r;
}

} // namespace game_lb::report
