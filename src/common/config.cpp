/// @file config.cpp
/// @brief SimConfig validation and nlohmann/json loading.

#include "common/config.hpp"
#include "common/error.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace game_lb {

using json = nlohmann::json;

namespace {

auto fail(errc e) -> std::unexpected<std::error_code> {
  return std::unexpected(make_error_code(e));
}

/// Counts are read signed so a negative value is reported as out of range
/// instead of wrapping around.
auto read_count(const json &j, const char *key, std::size_t fallback,
                errc on_negative) -> std::expected<std::size_t, std::error_code> {
  if (!j.contains(key)) {
    return fallback;
  }
  const auto v = j.at(key).get<std::int64_t>();
  if (v < 0) {
    return fail(on_negative);
  }
  return static_cast<std::size_t>(v);
}

auto from_json_doc(const json &j) -> std::expected<SimConfig, std::error_code> {
  SimConfig cfg;

  auto servers = read_count(j, "server_count", cfg.server_count,
                            errc::invalid_server_count);
  if (!servers)
    return std::unexpected(servers.error());
  cfg.server_count = *servers;

  auto players = read_count(j, "num_players", cfg.num_players,
                            errc::invalid_player_count);
  if (!players)
    return std::unexpected(players.error());
  cfg.num_players = *players;

  if (j.contains("concurrency_limit")) {
    auto limit = read_count(j, "concurrency_limit", 0,
                            errc::invalid_concurrency);
    if (!limit)
      return std::unexpected(limit.error());
    cfg.concurrency_limit = *limit;
  }

  cfg.processing_time_min =
      j.value("processing_time_min", cfg.processing_time_min);
  cfg.processing_time_max =
      j.value("processing_time_max", cfg.processing_time_max);
  cfg.time_scale = j.value("time_scale", cfg.time_scale);
  if (j.contains("timeout_seconds")) {
    cfg.timeout_seconds = j.at("timeout_seconds").get<double>();
  }

  auto append_ms = read_count(j, "append_timeout_ms", cfg.append_timeout_ms,
                              errc::invalid_timeout);
  if (!append_ms)
    return std::unexpected(append_ms.error());
  cfg.append_timeout_ms = *append_ms;

  cfg.arrival_interval_seconds =
      j.value("arrival_interval_seconds", cfg.arrival_interval_seconds);
  cfg.log_path = j.value("log_path", cfg.log_path);
  cfg.csv_path = j.value("csv_path", cfg.csv_path);
  cfg.json_path = j.value("json_path", cfg.json_path);

  if (auto ok = validate(cfg); !ok) {
    return std::unexpected(ok.error());
  }
  return cfg;
}

} // namespace

auto SimConfig::effective_concurrency() const noexcept -> std::size_t {
  const auto limit = concurrency_limit.value_or(num_players);
  return std::max<std::size_t>(1, std::min(limit, num_players));
}

auto validate(const SimConfig &cfg) -> std::expected<void, std::error_code> {
  if (cfg.server_count == 0) {
    return fail(errc::invalid_server_count);
  }
  if (cfg.concurrency_limit.has_value() && *cfg.concurrency_limit == 0) {
    return fail(errc::invalid_concurrency);
  }
  if (!std::isfinite(cfg.processing_time_min) ||
      !std::isfinite(cfg.processing_time_max) ||
      cfg.processing_time_min < 0.0 ||
      cfg.processing_time_min > cfg.processing_time_max) {
    return fail(errc::invalid_delay_range);
  }
  if (!std::isfinite(cfg.time_scale) || cfg.time_scale <= 0.0) {
    return fail(errc::invalid_time_scale);
  }
  if (cfg.timeout_seconds.has_value() &&
      !(std::isfinite(*cfg.timeout_seconds) && *cfg.timeout_seconds > 0.0)) {
    return fail(errc::invalid_timeout);
  }
  if (cfg.append_timeout_ms == 0) {
    return fail(errc::invalid_timeout);
  }
  if (!std::isfinite(cfg.arrival_interval_seconds) ||
      cfg.arrival_interval_seconds < 0.0) {
    return fail(errc::invalid_arrival_interval);
  }
  return {};
}

auto parse_config(const std::string &json_text)
    -> std::expected<SimConfig, std::error_code> {
  try {
    const auto j = json::parse(json_text);
    if (!j.is_object()) {
      return fail(errc::config_parse_failed);
    }
    return from_json_doc(j);
  } catch (const json::exception &) {
    // Syntax errors and wrongly typed values alike.
    return fail(errc::config_parse_failed);
  }
}

auto load_config(const std::string &path)
    -> std::expected<SimConfig, std::error_code> {
  std::ifstream in(path);
  if (!in) {
    return fail(errc::config_parse_failed);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse_config(buffer.str());
}

} // namespace game_lb
