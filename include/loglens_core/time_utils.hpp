#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace loglens_core {

// UTC wall clock as "YYYY-MM-DDTHH:MM:SSZ".
inline std::string utc_now_string() {
  auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

}  // namespace loglens_core
