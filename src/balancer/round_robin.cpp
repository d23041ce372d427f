/// @file round_robin.cpp
/// @brief Implementation of RoundRobinSelector.

#include "balancer/round_robin.hpp"
#include "common/error.hpp"

namespace game_lb {

auto RoundRobinSelector::create(std::size_t server_count)
    -> std::expected<std::unique_ptr<RoundRobinSelector>, std::error_code> {
  if (server_count == 0) {
    return std::unexpected(make_error_code(errc::invalid_server_count));
  }
  return std::make_unique<RoundRobinSelector>(Key{}, server_count);
}

auto RoundRobinSelector::select_next() -> std::size_t {
  std::lock_guard lock(mutex_);
  const auto chosen = next_index_;
  next_index_ = (next_index_ + 1) % server_count_;
  return chosen;
}

auto RoundRobinSelector::peek() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return next_index_;
}

} // namespace game_lb
