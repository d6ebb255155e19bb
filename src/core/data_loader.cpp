/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for scale items and long-format responses.

#include "semdiff/data_loader.hpp"
#include "semdiff/normalizer.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace semdiff::core {

namespace {

constexpr std::size_t RESPONSE_FIELDS = 8;

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::optional<double> parse_double(const std::string& token) {
    if (token.empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        const double v = std::stod(token, &pos);
        if (pos != token.size() || !std::isfinite(v)) return std::nullopt;
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<std::int64_t> parse_int64(const std::string& token) {
    if (token.empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        const long long v = std::stoll(token, &pos);
        if (pos != token.size()) return std::nullopt;
        return static_cast<std::int64_t>(v);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<bool> parse_flag(const std::string& token) {
    if (token == "1" || token == "true")  return true;
    if (token == "0" || token == "false" || token.empty()) return false;
    return std::nullopt;
}

/// Calls `on_row` for every data line, after the first non-empty,
/// non-comment line (the header) has been skipped.
template <typename F>
void for_each_data_line(const std::string& csv_content, F&& on_row) {
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }
        on_row(line);
    }
}

}  // namespace

// ─── DataLoader::split_csv ────────────────────────────────────────────────────

std::vector<std::string> DataLoader::split_csv(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(trim(field));
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(trim(field));
    return fields;
}

// ─── DataLoader::parse_items_string ──────────────────────────────────────────

std::vector<ScaleItem>
DataLoader::parse_items_string(const std::string& csv_content) noexcept {
    std::vector<ScaleItem> items;

    for_each_data_line(csv_content, [&items](const std::string& line) {
        auto fields = split_csv(line);
        if (fields.size() < 3 || fields.size() > 4 || fields[0].empty()) {
            return;
        }

        ScaleItem item{
            .id         = fields[0],
            .low_label  = fields[1],
            .high_label = fields[2],
            .category   = std::nullopt,
        };
        if (fields.size() == 4 && !fields[3].empty()) {
            item.category = fields[3];
        }
        items.push_back(std::move(item));
    });

    return items;
}

// ─── DataLoader::parse_sessions_string ───────────────────────────────────────

std::vector<Session>
DataLoader::parse_sessions_string(const std::string& csv_content,
                                  const ScaleConfig& scale) noexcept {
    // Normalisation would throw on this; a loader reports nothing instead.
    if (scale.points <= 0) {
        return {};
    }

    std::vector<Session> sessions;
    std::unordered_map<std::string, std::size_t> index;

    for_each_data_line(csv_content, [&](const std::string& line) {
        const auto fields = split_csv(line);
        if (fields.size() != RESPONSE_FIELDS || fields[0].empty() || fields[4].empty()) {
            return;
        }

        const auto status  = parse_status(fields[3]);
        const auto raw     = parse_double(fields[5]);
        const auto flipped = parse_flag(fields[6]);
        const auto ts      = parse_int64(fields[7]);
        if (!status || !raw || !flipped || !ts) {
            return;
        }

        auto [it, inserted] = index.try_emplace(fields[0], sessions.size());
        if (inserted) {
            sessions.push_back(Session{
                .id          = fields[0],
                .group_id    = fields[1],
                .group_label = fields[2],
                .status      = *status,
                .responses   = {},
            });
        }

        sessions[it->second].responses.push_back(
            ResponseNormalizer::make_record(fields[4], *raw, *flipped, scale, *ts));
    });

    return sessions;
}

// ─── File entry points ───────────────────────────────────────────────────────

std::optional<std::string> DataLoader::read_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

std::optional<std::vector<ScaleItem>>
DataLoader::load_items(const std::string& filepath) noexcept {
    auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_items_string(*contents);
}

std::optional<std::vector<Session>>
DataLoader::load_sessions(const std::string& filepath, const ScaleConfig& scale) noexcept {
    auto contents = read_file(filepath);
    if (!contents) {
        return std::nullopt;
    }
    return parse_sessions_string(*contents, scale);
}

}  // namespace semdiff::core
