#pragma once
/// @file config.hpp
/// @brief Simulation configuration surface and its JSON loader.

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <system_error>

namespace game_lb {

/// @brief Everything a Simulation is built from.
///
/// Durations are in simulated seconds unless noted. `time_scale` converts a
/// simulated second into real seconds of waiting, so `time_scale = 0.001`
/// runs a 1-3 s processing range in 1-3 ms.
struct SimConfig {
  std::size_t server_count = 3;
  std::size_t num_players = 20;
  /// Maximum in-flight dispatches. Unset means num_players.
  std::optional<std::size_t> concurrency_limit;
  double processing_time_min = 1.0;
  double processing_time_max = 3.0;
  double time_scale = 1.0;
  /// Overall run timeout in real seconds. Unset means no timeout.
  std::optional<double> timeout_seconds;
  /// Bounded wait for the sink's exclusive region, in milliseconds.
  std::size_t append_timeout_ms = 1000;
  /// Simulated pause between issuing consecutive requests.
  double arrival_interval_seconds = 0.0;

  // Output files; empty means disabled.
  std::string log_path;
  std::string csv_path;
  std::string json_path;

  /// @brief Concurrency limit with the default applied and clamped to
  ///        num_players (at least 1).
  [[nodiscard]] auto effective_concurrency() const noexcept -> std::size_t;
};

/// @brief Check every field; returns the first configuration error found.
[[nodiscard]] auto validate(const SimConfig &cfg)
    -> std::expected<void, std::error_code>;

/// @brief Read a JSON configuration file. Missing keys keep their defaults.
/// @return The validated configuration, or a configuration error.
[[nodiscard]] auto load_config(const std::string &path)
    -> std::expected<SimConfig, std::error_code>;

/// @brief Same as load_config() but from an in-memory JSON document.
[[nodiscard]] auto parse_config(const std::string &json_text)
    -> std::expected<SimConfig, std::error_code>;

} // namespace game_lb
