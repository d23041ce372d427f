#pragma once
/// @file server_pool.hpp
/// @brief Fixed pool of simulated game servers with per-server load counters.

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace game_lb {

/// @brief Consistent copy of one server's counters.
struct ServerStats {
  std::size_t server_id = 0;       ///< Index in the pool.
  std::string name;                ///< "Game_Server_<id+1>".
  std::uint64_t requests_served = 0;
  double total_response_time = 0.0; ///< Simulated seconds.

  /// @brief Mean response time, 0 when the server handled nothing.
  [[nodiscard]] auto avg_response_time() const -> double {
    return (requests_served > 0) ? total_response_time /
                                       static_cast<double>(requests_served)
                                 : 0.0;
  }
};

/// @brief Ordered, fixed-size collection of servers.
///
/// The server count is set once by create() and never changes. Each server
/// carries its own mutex so completions on different servers do not contend,
/// and the (requests_served, total_response_time) pair is always updated and
/// read as one unit.
class ServerPool {
public:
  /// @brief Build a pool of @p server_count servers.
  /// @return The pool, or errc::invalid_server_count when the count is 0.
  [[nodiscard]] static auto create(std::size_t server_count)
      -> std::expected<ServerPool, std::error_code>;

  ServerPool(ServerPool &&) noexcept = default;
  ServerPool &operator=(ServerPool &&) noexcept = default;
  ServerPool(const ServerPool &) = delete;
  ServerPool &operator=(const ServerPool &) = delete;

  /// @brief Count one completed request against @p server_index.
  /// @return errc::invalid_server_index if the index is outside the pool.
  auto record_completion(std::size_t server_index, double response_time)
      -> std::expected<void, std::error_code>;

  /// @brief Per-server counters in pool order.
  [[nodiscard]] auto snapshot() const -> std::vector<ServerStats>;

  /// @brief Counters of a single server.
  [[nodiscard]] auto stats(std::size_t server_index) const
      -> std::expected<ServerStats, std::error_code>;

  [[nodiscard]] auto contains(std::size_t server_index) const noexcept -> bool;

  [[nodiscard]] auto size() const noexcept -> std::size_t;

  /// @brief Display name used in logs and exports.
  [[nodiscard]] static auto server_name(std::size_t server_index)
      -> std::string;

private:
  struct Slot {
    alignas(64) mutable std::mutex mutex;
    std::uint64_t requests_served = 0;
    double total_response_time = 0.0;
  };

  explicit ServerPool(std::size_t server_count);

  [[nodiscard]] auto read_slot(std::size_t server_index) const -> ServerStats;

  std::vector<std::unique_ptr<Slot>> slots_;
};

} // namespace game_lb
