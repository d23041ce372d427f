#pragma once
/// @file metrics_sink.hpp
/// @brief Thread-safe, append-only store of MetricsRecords plus the
///        human-readable dispatch log.

#include "metrics/metrics_record.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <system_error>
#include <vector>

namespace game_lb {

/// @brief Collects one record per successful dispatch.
///
/// append() holds an exclusive region just long enough to write the log line
/// and store the record, so the log and drain() order are identical and
/// reflect completion order. Waiting for that region is bounded by the
/// append timeout. A record is stored only if its log line was written.
///
/// Lifecycle: constructed (or open()ed) at simulation start, close()d at the
/// end. close() flushes the log and rejects later appends; records stay
/// readable through drain().
class MetricsSink {
public:
  using Timeout = std::chrono::milliseconds;

  static constexpr Timeout kDefaultAppendTimeout{1000};

  /// @brief Sink writing log lines to @p log (not owned, may be null).
  explicit MetricsSink(std::ostream *log = nullptr,
                       Timeout append_timeout = kDefaultAppendTimeout) noexcept;

  /// @brief Sink owning a log file opened in append mode at @p path.
  /// @return errc::sink_open_failed if the file cannot be opened.
  [[nodiscard]] static auto open(const std::string &path,
                                 Timeout append_timeout = kDefaultAppendTimeout)
      -> std::expected<std::unique_ptr<MetricsSink>, std::error_code>;

  MetricsSink(const MetricsSink &) = delete;
  MetricsSink &operator=(const MetricsSink &) = delete;

  /// @brief Log and store @p record.
  /// @return errc::sink_timeout if the region could not be entered in time,
  ///         errc::sink_write_failed if the log stream failed,
  ///         errc::sink_closed after close().
  auto append(const MetricsRecord &record)
      -> std::expected<void, std::error_code>;

  /// @brief Copy of every stored record in append order.
  [[nodiscard]] auto drain() const -> std::vector<MetricsRecord>;

  [[nodiscard]] auto size() const -> std::size_t;

  auto flush() -> std::expected<void, std::error_code>;

  /// @brief Flush and detach the log. Idempotent.
  auto close() -> std::expected<void, std::error_code>;

  [[nodiscard]] auto is_open() const -> bool;

  /// @brief The log line written for @p record (without trailing newline):
  ///        `<timestamp> player=<id> server=Game_Server_<server_id + 1>
  ///        response_time=<seconds>`.
  [[nodiscard]] static auto format_line(const MetricsRecord &record)
      -> std::string;

private:
  auto flush_locked() -> std::expected<void, std::error_code>;

  const Timeout append_timeout_;

  mutable std::timed_mutex mutex_; // protects everything below
  std::unique_ptr<std::ofstream> owned_log_;
  std::ostream *log_ = nullptr;
  std::vector<MetricsRecord> records_;
  bool closed_ = false;
};

} // namespace game_lb
