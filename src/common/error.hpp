#pragma once
/// @file error.hpp
/// @brief Error codes for configuration, dispatch and sink failures.
///
/// Every fallible operation returns `std::expected<T, std::error_code>`; the
/// codes below live in the "game_lb" category so they compare and print like
/// any other `std::error_code`.

#include <cstdint>
#include <system_error>
#include <type_traits>

namespace game_lb {

enum class errc : std::uint8_t {
  // Configuration errors (fatal, reported before any dispatch).
  invalid_server_count = 1,
  invalid_player_count,
  invalid_concurrency,
  invalid_delay_range,
  invalid_time_scale,
  invalid_timeout,
  invalid_arrival_interval,
  config_parse_failed,

  // Dispatch errors (one request fails, the run continues).
  invalid_server_index,
  invalid_delay_sample,
  dispatch_exception,

  // Sink errors (the run stops issuing new requests).
  sink_write_failed,
  sink_timeout,
  sink_closed,
  sink_open_failed,
  export_failed,
};

/// @brief The singleton "game_lb" error category.
[[nodiscard]] auto error_category() noexcept -> const std::error_category &;

[[nodiscard]] auto make_error_code(errc e) noexcept -> std::error_code;

/// @brief True for codes that reject a configuration before the run starts.
[[nodiscard]] auto is_configuration_error(std::error_code ec) noexcept -> bool;

/// @brief True for codes that fail a single dispatch.
[[nodiscard]] auto is_dispatch_error(std::error_code ec) noexcept -> bool;

/// @brief True for codes raised by the metrics sink or exporters.
[[nodiscard]] auto is_sink_error(std::error_code ec) noexcept -> bool;

} // namespace game_lb

template <> struct std::is_error_code_enum<game_lb::errc> : std::true_type {};
