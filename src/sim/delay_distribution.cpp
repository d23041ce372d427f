/// @file delay_distribution.cpp
/// @brief Uniform and fixed simulated-delay sources.

#include "sim/delay_distribution.hpp"
#include "common/error.hpp"

#include <cmath>
#include <random>
#include <utility>

namespace game_lb::sim {

namespace {

auto &rng() {
  thread_local std::mt19937 gen{std::random_device{}()};
  return gen;
}

auto valid_range(double lo, double hi) -> bool {
  return std::isfinite(lo) && std::isfinite(hi) && lo >= 0.0 && lo <= hi;
}

} // namespace

auto UniformDelay::create(double min_seconds, double max_seconds)
    -> std::expected<std::unique_ptr<UniformDelay>, std::error_code> {
  if (!valid_range(min_seconds, max_seconds)) {
    return std::unexpected(make_error_code(errc::invalid_delay_range));
  }
  return std::make_unique<UniformDelay>(Key{}, min_seconds, max_seconds);
}

auto UniformDelay::sample() -> double {
  if (min_ == max_) {
    return min_;
  }
  std::uniform_real_distribution<double> dist(min_, max_);
  return dist(rng());
}

auto make_delay_distribution(double min_seconds, double max_seconds)
    -> std::expected<std::unique_ptr<DelayDistribution>, std::error_code> {
  if (!valid_range(min_seconds, max_seconds)) {
    return std::unexpected(make_error_code(errc::invalid_delay_range));
  }
  if (min_seconds == max_seconds) {
    return std::make_unique<FixedDelay>(min_seconds);
  }
  auto uniform = UniformDelay::create(min_seconds, max_seconds);
  if (!uniform) {
    return std::unexpected(uniform.error());
  }
  return std::unique_ptr<DelayDistribution>(std::move(*uniform));
}

} // namespace game_lb::sim
