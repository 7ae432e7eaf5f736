#include "loglens_core/chunking/timestamp_extractor.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <regex>

namespace loglens_core {

namespace {

const std::regex& iso_pattern() {
  static const std::regex pattern(
      R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(?:\.\d+)?(?:Z|[+-]\d{2}:\d{2})?)");
  return pattern;
}

const std::regex& space_separated_pattern() {
  static const std::regex pattern(R"((\d{4}-\d{2}-\d{2})[ \t]+(\d{2}:\d{2}:\d{2}(?:\.\d+)?))");
  return pattern;
}

const std::regex& access_log_pattern() {
  static const std::regex pattern(R"((\d{2})/([A-Za-z]{3})/(\d{4}):(\d{2}:\d{2}:\d{2}))");
  return pattern;
}

std::optional<std::string> month_number(const std::string& abbreviation) {
  static const std::array<const char*, 12> months = {"jan", "feb", "mar", "apr", "may", "jun",
                                                     "jul", "aug", "sep", "oct", "nov", "dec"};
  std::string lower = abbreviation;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (size_t i = 0; i < months.size(); ++i) {
    if (lower == months[i]) {
      char buffer[3];
      std::snprintf(buffer, sizeof(buffer), "%02zu", i + 1);
      return std::string(buffer);
    }
  }
  return std::nullopt;
}

}  // namespace

std::vector<std::string> extract_timestamps(const std::string& text) {
  std::vector<std::string> timestamps;

  for (auto it = std::sregex_iterator(text.begin(), text.end(), iso_pattern());
       it != std::sregex_iterator(); ++it) {
    timestamps.push_back(it->str());
  }

  for (auto it = std::sregex_iterator(text.begin(), text.end(), space_separated_pattern());
       it != std::sregex_iterator(); ++it) {
    timestamps.push_back((*it)[1].str() + "T" + (*it)[2].str());
  }

  for (auto it = std::sregex_iterator(text.begin(), text.end(), access_log_pattern());
       it != std::sregex_iterator(); ++it) {
    auto month = month_number((*it)[2].str());
    if (!month) {
      continue;  // not a date, e.g. "12/abc/2024:..."
    }
    timestamps.push_back((*it)[3].str() + "-" + *month + "-" + (*it)[1].str() + "T" +
                         (*it)[4].str());
  }

  return timestamps;
}

std::optional<std::pair<std::string, std::string>> extract_timestamp_range(
    const std::string& text) {
  auto timestamps = extract_timestamps(text);
  if (timestamps.empty()) {
    return std::nullopt;
  }
  auto [earliest, latest] = std::minmax_element(timestamps.begin(), timestamps.end());
  return std::make_pair(*earliest, *latest);
}

}  // namespace loglens_core
