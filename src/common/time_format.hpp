#pragma once
/// @file time_format.hpp
/// @brief Wall-clock formatting shared by the dispatch log and exporters.

#include <chrono>
#include <string>

namespace game_lb {

/// @brief Local time as "YYYY-MM-DD HH:MM:SS.ffffff".
[[nodiscard]] auto format_timestamp(std::chrono::system_clock::time_point tp)
    -> std::string;

/// @brief Seconds with three decimals, e.g. "1.250".
[[nodiscard]] auto format_seconds(double seconds) -> std::string;

} // namespace game_lb
