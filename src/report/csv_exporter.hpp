#pragma once
/// @file csv_exporter.hpp
/// @brief Row-per-record CSV export of drained metrics.
///
/// Columns: player_id, server_id, start_time, end_time, processing_time.
/// Server ids are written as display names ("Game_Server_1").

#include "metrics/metrics_record.hpp"

#include <expected>
#include <ostream>
#include <string>
#include <system_error>
#include <vector>

namespace game_lb::report {

inline constexpr const char *kCsvHeader =
    "player_id,server_id,start_time,end_time,processing_time";

/// @brief Write the header and one row per record to @p out.
/// @return errc::export_failed if the stream goes bad.
auto write_csv(std::ostream &out, const std::vector<MetricsRecord> &records)
    -> std::expected<void, std::error_code>;

/// @brief Truncate @p path and write the CSV there.
auto export_csv(const std::string &path,
                const std::vector<MetricsRecord> &records)
    -> std::expected<void, std::error_code>;

} // namespace game_lb::report
