/// @file error.cpp
/// @brief The "game_lb" error category.

#include "common/error.hpp"

#include <string>

namespace game_lb {

namespace {

class ErrorCategory final : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "game_lb";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<errc>(ev)) {
    case errc::invalid_server_count:
      return "server_count must be positive";
    case errc::invalid_player_count:
      return "num_players must not be negative";
    case errc::invalid_concurrency:
      return "concurrency_limit must be positive";
    case errc::invalid_delay_range:
      return "processing_time_range must satisfy 0 <= min <= max";
    case errc::invalid_time_scale:
      return "time_scale must be positive";
    case errc::invalid_timeout:
      return "timeout must be positive";
    case errc::invalid_arrival_interval:
      return "arrival interval must not be negative";
    case errc::config_parse_failed:
      return "configuration could not be parsed";
    case errc::invalid_server_index:
      return "selector returned an index outside the server pool";
    case errc::invalid_delay_sample:
      return "delay distribution produced a negative or non-finite sample";
    case errc::dispatch_exception:
      return "dispatch raised an exception";
    case errc::sink_write_failed:
      return "metrics sink write failed";
    case errc::sink_timeout:
      return "metrics sink append timed out";
    case errc::sink_closed:
      return "metrics sink is closed";
    case errc::sink_open_failed:
      return "metrics sink could not be opened";
    case errc::export_failed:
      return "metrics export failed";
    }
    return "unknown game_lb error";
  }
};

auto in_range(std::error_code ec, errc first, errc last) noexcept -> bool {
  return ec.category() == error_category() &&
         ec.value() >= static_cast<int>(first) &&
         ec.value() <= static_cast<int>(last);
}

} // namespace

auto error_category() noexcept -> const std::error_category & {
  static const ErrorCategory category;
  return category;
}

auto make_error_code(errc e) noexcept -> std::error_code {
  return {static_cast<int>(e), error_category()};
}

auto is_configuration_error(std::error_code ec) noexcept -> bool {
  return in_range(ec, errc::invalid_server_count, errc::config_parse_failed);
}

auto is_dispatch_error(std::error_code ec) noexcept -> bool {
  return in_range(ec, errc::invalid_server_index, errc::dispatch_exception);
}

auto is_sink_error(std::error_code ec) noexcept -> bool {
  return in_range(ec, errc::sink_write_failed, errc::export_failed);
}

} // namespace game_lb
