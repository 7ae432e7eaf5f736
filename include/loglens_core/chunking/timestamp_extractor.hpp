#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace loglens_core {

// Finds timestamps in log text and normalises them to ISO 8601.
// Recognised forms:
//   2024-01-15T10:30:45.123Z       kept as is
//   2024-01-15 10:30:45[.123]      space replaced with 'T'
//   15/Jan/2024:10:30:45           Apache/nginx access log, rewritten as 2024-01-15T10:30:45
std::vector<std::string> extract_timestamps(const std::string& text);

// Earliest and latest normalised timestamp (lexicographic), or nullopt when none are found.
std::optional<std::pair<std::string, std::string>> extract_timestamp_range(const std::string& text);

}  // namespace loglens_core
