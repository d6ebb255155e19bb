#pragma once

/// @file include/semdiff/data_loader.hpp
/// @brief CSV loader for scale items and long-format responses.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Feed the CLI and the test fixtures. Production deployments receive
/// sessions from their own store; this loader only understands two flat
/// CSV layouts.
///
/// ## Expected CSV Formats
/// Items (header required, category optional):
/// ```
/// id,low_label,high_label,category
/// p1,Traditional,Innovative,Values
/// ```
/// Responses (one row per answer, header required):
/// ```
/// session_id,group_id,group_label,status,item_id,raw_value,was_flipped,timestamp
/// s1,mkt,Marketing,completed,p1,5,0,1704067200000
/// ```
/// Rows of the same session may appear anywhere; sessions are returned in
/// order of first appearance. Group and status are taken from the first
/// row of each session.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` when a file cannot be opened
/// - Skips malformed rows (wrong field count, unparsable numbers, unknown
///   status) rather than failing the whole load
/// - Raw values are normalised with the supplied ScaleConfig

#include "semdiff/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace semdiff::core {

class DataLoader {
public:
    [[nodiscard]] static std::optional<std::vector<ScaleItem>>
    load_items(const std::string& filepath) noexcept;

    [[nodiscard]] static std::vector<ScaleItem>
    parse_items_string(const std::string& csv_content) noexcept;

    [[nodiscard]] static std::optional<std::vector<Session>>
    load_sessions(const std::string& filepath, const ScaleConfig& scale) noexcept;

    [[nodiscard]] static std::vector<Session>
    parse_sessions_string(const std::string& csv_content,
                          const ScaleConfig& scale) noexcept;

    /// Split a CSV line on commas, trimming whitespace. Double-quoted fields
    /// may contain commas; "" inside quotes is a literal quote.
    [[nodiscard]] static std::vector<std::string> split_csv(const std::string& line);

private:
    [[nodiscard]] static std::optional<std::string> read_file(const std::string& filepath);
};

}  // namespace semdiff::core
