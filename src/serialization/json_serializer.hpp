#pragma once
/// @file json_serializer.hpp
/// @brief nlohmann/json serialization for records, server stats and run
///        summaries.

#include "common/error.hpp"
#include "metrics/metrics_record.hpp"
#include "pool/server_pool.hpp"
#include "report/summary.hpp"
#include "sim/simulation_driver.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace game_lb {

namespace detail {

inline auto to_epoch_us(std::chrono::system_clock::time_point tp)
    -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             tp.time_since_epoch())
      .count();
}

} // namespace detail

inline void to_json(nlohmann::json &j, const MetricsRecord &r) {
  j = nlohmann::json{
      {"player_id", r.player_id},
      {"server_id", r.server_id},
      {"server", ServerPool::server_name(r.server_id)},
      {"start_us", detail::to_epoch_us(r.start_time)},
      {"timestamp_us", detail::to_epoch_us(r.timestamp)},
      {"response_time", r.response_time},
  };
}

inline void to_json(nlohmann::json &j, const ServerStats &s) {
  j = nlohmann::json{
      {"server_id", s.server_id},
      {"name", s.name},
      {"requests_served", s.requests_served},
      {"total_response_time", s.total_response_time},
      {"avg_response_time", s.avg_response_time()},
  };
}

namespace sim {

inline void to_json(nlohmann::json &j, const DispatchFailure &f) {
  j = nlohmann::json{
      {"player_id", f.player_id},
      {"error", f.error.message()},
  };
}

inline void to_json(nlohmann::json &j, const RunSummary &s) {
  j = nlohmann::json{
      {"state", to_string(s.state)},
      {"requested", s.requested},
      {"issued", s.issued},
      {"succeeded", s.succeeded},
      {"failed", s.failed},
      {"not_issued", s.not_issued},
      {"wall_time_seconds", s.wall_time.count()},
      {"timed_out", s.timed_out},
      {"run_error", s.run_error ? s.run_error.message() : std::string{}},
      {"failures", s.failures},
      {"callback_failures", s.callback_failures},
  };
}

} // namespace sim

namespace report {

inline void to_json(nlohmann::json &j, const ServerReport &s) {
  j = nlohmann::json(s.stats);
  j["players"] = s.players;
}

inline void to_json(nlohmann::json &j, const RunReport &r) {
  j = nlohmann::json{
      {"servers", r.servers},
      {"total_requests", r.total_requests},
      {"total_response_time", r.total_response_time},
      {"elapsed_seconds", r.elapsed_seconds},
      {"throughput_rps", r.throughput_rps()},
      {"response_time",
       {
           {"min", r.min_response_time},
           {"avg", r.avg_response_time},
           {"p50", r.p50_response_time},
           {"p95", r.p95_response_time},
           {"p99", r.p99_response_time},
           {"max", r.max_response_time},
       }},
  };
}

/// @brief Full export document: summary, report and every record.
inline auto run_to_json(const sim::RunSummary &summary, const RunReport &report,
                        const std::vector<MetricsRecord> &records)
    -> nlohmann::json {
  nlohmann::json j;
  j["type"] = "run";
  j["summary"] = summary;
  j["report"] = report;
  j["records"] = nlohmann::json::array();

  for (const auto &rec : records) {
    j["records"].push_back(nlohmann::json(rec));
  }

  return j;
}

/// @brief Write run_to_json() to @p path, pretty-printed.
inline auto export_json(const std::string &path,
                        const sim::RunSummary &summary, const RunReport &report,
                        const std::vector<MetricsRecord> &records)
    -> std::expected<void, std::error_code> {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return std::unexpected(make_error_code(errc::export_failed));
  }
  out << run_to_json(summary, report, records).dump(2) << '\n';
  if (!out) {
    return std::unexpected(make_error_code(errc::export_failed));
  }
  return {};
}

} // namespace report

} // namespace game_lb
