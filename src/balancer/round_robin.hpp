#pragma once
/// @file round_robin.hpp
/// @brief Server selection interface and the round-robin cursor.

#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <system_error>

namespace game_lb {

/// @brief Picks the server that handles the next request.
///
/// Implementations must be safe to call from many dispatch threads at once.
class ServerSelector {
public:
  virtual ~ServerSelector() = default;

  /// @brief Index of the server for the next request.
  virtual auto select_next() -> std::size_t = 0;
};

/// @brief Cyclic selector: 0, 1, ..., n-1, 0, 1, ...
///
/// A single cursor is shared by all callers and advanced exactly once per
/// call inside a short critical section, so concurrent callers never receive
/// the same index within one cycle and never skip one.
class RoundRobinSelector final : public ServerSelector {
  struct Key {
    explicit Key() = default;
  };

public:
  /// @brief Build a selector over @p server_count servers.
  /// @return errc::invalid_server_count when @p server_count is 0.
  [[nodiscard]] static auto create(std::size_t server_count)
      -> std::expected<std::unique_ptr<RoundRobinSelector>, std::error_code>;

  /// @brief Use create(); the key keeps construction inside the factory.
  RoundRobinSelector(Key, std::size_t server_count) noexcept
      : server_count_{server_count} {}

  auto select_next() -> std::size_t override;

  /// @brief Index the next call will return (for diagnostics).
  [[nodiscard]] auto peek() const -> std::size_t;

  [[nodiscard]] auto server_count() const noexcept -> std::size_t {
    return server_count_;
  }

private:
  const std::size_t server_count_;
  mutable std::mutex mutex_; // protects next_index_
  std::size_t next_index_ = 0;
};

} // namespace game_lb
