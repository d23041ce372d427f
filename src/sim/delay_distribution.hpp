#pragma once
/// @file delay_distribution.hpp
/// @brief Sources of simulated processing time.

#include <expected>
#include <memory>
#include <system_error>

namespace game_lb::sim {

/// @brief Produces the simulated processing time of one request, in
///        simulated seconds.
///
/// sample() is called concurrently from dispatch threads.
class DelayDistribution {
public:
  virtual ~DelayDistribution() = default;

  virtual auto sample() -> double = 0;
};

/// @brief Uniform over [min, max]. Each thread draws from its own generator.
class UniformDelay final : public DelayDistribution {
  struct Key {
    explicit Key() = default;
  };

public:
  /// @return errc::invalid_delay_range unless 0 <= min <= max (both finite).
  [[nodiscard]] static auto create(double min_seconds, double max_seconds)
      -> std::expected<std::unique_ptr<UniformDelay>, std::error_code>;

  /// @brief Use create(), which validates the range.
  UniformDelay(Key, double min_seconds, double max_seconds) noexcept
      : min_{min_seconds}, max_{max_seconds} {}

  auto sample() -> double override;

  [[nodiscard]] auto min() const noexcept -> double { return min_; }
  [[nodiscard]] auto max() const noexcept -> double { return max_; }

private:
  double min_;
  double max_;
};

/// @brief Always the same delay. Used for deterministic runs.
class FixedDelay final : public DelayDistribution {
public:
  explicit FixedDelay(double seconds) noexcept : seconds_{seconds} {}

  auto sample() -> double override { return seconds_; }

private:
  double seconds_;
};

/// @brief FixedDelay when min == max, UniformDelay otherwise.
[[nodiscard]] auto make_delay_distribution(double min_seconds,
                                           double max_seconds)
    -> std::expected<std::unique_ptr<DelayDistribution>, std::error_code>;

} // namespace game_lb::sim
