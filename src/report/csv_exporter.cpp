/// @file csv_exporter.cpp
/// @brief CSV metrics export.

#include "report/csv_exporter.hpp"
#include "common/error.hpp"
#include "common/time_format.hpp"
#include "pool/server_pool.hpp"

#include <fstream>

namespace game_lb::report {

auto write_csv(std::ostream &out, const std::vector<MetricsRecord> &records)
    -> std::expected<void, std::error_code> {
  out << kCsvHeader << '\n';
  for (const auto &r : records) {
    out << r.player_id << ',' << ServerPool::server_name(r.server_id) << ','
        << format_timestamp(r.start_time) << ','
        << format_timestamp(r.timestamp) << ','
        << format_seconds(r.response_time) << '\n';
  }
  out.flush();
  if (!out) {
    return std::unexpected(make_error_code(errc::export_failed));
  }
  return {};
}

auto export_csv(const std::string &path,
                const std::vector<MetricsRecord> &records)
    -> std::expected<void, std::error_code> {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return std::unexpected(make_error_code(errc::export_failed));
  }
  return write_csv(out, records);
}

} // namespace game_lb::report
