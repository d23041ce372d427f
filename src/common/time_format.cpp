/// @file time_format.cpp
/// @brief Implementation of timestamp and duration formatting.

#include "common/time_format.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace game_lb {

auto format_timestamp(std::chrono::system_clock::time_point tp)
    -> std::string {
  using namespace std::chrono;

  const auto secs = time_point_cast<seconds>(tp);
  auto micros = duration_cast<microseconds>(tp - secs).count();
  auto t = system_clock::to_time_t(secs);
  if (micros < 0) {
    // Pre-epoch points round toward zero; borrow one second.
    micros += 1'000'000;
    --t;
  }

  std::tm local{};
  ::localtime_r(&t, &local);

  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(6)
      << std::setfill('0') << micros;
  return out.str();
}

auto format_seconds(double seconds) -> std::string {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << seconds;
  return out.str();
}

} // namespace game_lb
