/// @file server_pool.cpp
/// @brief Implementation of ServerPool.

#include "pool/server_pool.hpp"
#include "common/error.hpp"

namespace game_lb {

auto ServerPool::create(std::size_t server_count)
    -> std::expected<ServerPool, std::error_code> {
  if (server_count == 0) {
    return std::unexpected(make_error_code(errc::invalid_server_count));
  }
  return ServerPool{server_count};
}

ServerPool::ServerPool(std::size_t server_count) {
  slots_.reserve(server_count);
  for (std::size_t i = 0; i < server_count; ++i) {
    slots_.push_back(std::make_unique<Slot>());
  }
}

auto ServerPool::record_completion(std::size_t server_index,
                                   double response_time)
    -> std::expected<void, std::error_code> {
  if (!contains(server_index)) {
    return std::unexpected(make_error_code(errc::invalid_server_index));
  }
  auto &slot = *slots_[server_index];
  std::lock_guard lock(slot.mutex);
  ++slot.requests_served;
  slot.total_response_time += response_time;
  return {};
}

auto ServerPool::read_slot(std::size_t server_index) const -> ServerStats {
  const auto &slot = *slots_[server_index];
  ServerStats s{
      .server_id = server_index,
      .name = server_name(server_index),
  };
  std::lock_guard lock(slot.mutex);
  s.requests_served = slot.requests_served;
  s.total_response_time = slot.total_response_time;
  return s;
}

auto ServerPool::snapshot() const -> std::vector<ServerStats> {
  std::vector<ServerStats> result;
  result.reserve(slots_.size());
  for (std::size_t i = 0; i < slots_.size(); ++i) {
    result.push_back(read_slot(i));
  }
  return result;
}

auto ServerPool::stats(std::size_t server_index) const
    -> std::expected<ServerStats, std::error_code> {
  if (!contains(server_index)) {
    return std::unexpected(make_error_code(errc::invalid_server_index));
  }
  return read_slot(server_index);
}

auto ServerPool::contains(std::size_t server_index) const noexcept -> bool {
  return server_index < slots_.size();
}

auto ServerPool::size() const noexcept -> std::size_t { return slots_.size(); }

auto ServerPool::server_name(std::size_t server_index) -> std::string {
  return "Game_Server_" + std::to_string(server_index + 1);
}

} // namespace game_lb
