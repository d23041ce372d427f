/// @file metrics_sink.cpp
/// @brief Implementation of MetricsSink.

#include "metrics/metrics_sink.hpp"
#include "common/error.hpp"
#include "common/time_format.hpp"
#include "pool/server_pool.hpp"

#include <sstream>
#include <utility>

namespace game_lb {

MetricsSink::MetricsSink(std::ostream *log, Timeout append_timeout) noexcept
    : append_timeout_{append_timeout}, log_{log} {}

auto MetricsSink::open(const std::string &path, Timeout append_timeout)
    -> std::expected<std::unique_ptr<MetricsSink>, std::error_code> {
  auto file = std::make_unique<std::ofstream>(path, std::ios::app);
  if (!*file) {
    return std::unexpected(make_error_code(errc::sink_open_failed));
  }
  auto sink = std::make_unique<MetricsSink>(file.get(), append_timeout);
  sink->owned_log_ = std::move(file);
  return sink;
}

auto MetricsSink::format_line(const MetricsRecord &record) -> std::string {
  std::ostringstream line;
  line << format_timestamp(record.timestamp)
       << " player=" << record.player_id
       << " server=" << ServerPool::server_name(record.server_id)
       << " response_time=" << format_seconds(record.response_time);
  return line.str();
}

auto MetricsSink::append(const MetricsRecord &record)
    -> std::expected<void, std::error_code> {
  // Format outside the region.
  const auto line = format_line(record);

  std::unique_lock lock(mutex_, append_timeout_);
  if (!lock.owns_lock()) {
    return std::unexpected(make_error_code(errc::sink_timeout));
  }
  if (closed_) {
    return std::unexpected(make_error_code(errc::sink_closed));
  }

  if (log_ != nullptr) {
    *log_ << line << '\n';
    if (!*log_) {
      return std::unexpected(make_error_code(errc::sink_write_failed));
    }
  }
  records_.push_back(record);
  return {};
}

auto MetricsSink::drain() const -> std::vector<MetricsRecord> {
  std::lock_guard lock(mutex_);
  return records_;
}

auto MetricsSink::size() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return records_.size();
}

auto MetricsSink::flush_locked() -> std::expected<void, std::error_code> {
  if (log_ == nullptr) {
    return {};
  }
  log_->flush();
  if (!*log_) {
    return std::unexpected(make_error_code(errc::sink_write_failed));
  }
  return {};
}

auto MetricsSink::flush() -> std::expected<void, std::error_code> {
  std::lock_guard lock(mutex_);
  return flush_locked();
}

auto MetricsSink::close() -> std::expected<void, std::error_code> {
  std::lock_guard lock(mutex_);
  if (closed_) {
    return {};
  }
  closed_ = true;
  auto flushed = flush_locked();
  log_ = nullptr;
  if (owned_log_) {
    owned_log_->close();
    owned_log_.reset();
  }
  return flushed;
}

auto MetricsSink::is_open() const -> bool {
  std::lock_guard lock(mutex_);
  return !closed_;
}

} // namespace game_lb
