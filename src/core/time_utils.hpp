#ifndef ISAPISYNC_CORE_TIME_UTILS_HPP_
#define ISAPISYNC_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace isapisync::core {

// `YYYY-MM-DDTHH:MM:SS` in UTC, the shape the device accepts for
// `<localTime>` when switching to manual time mode.
inline std::string FormatIsoSeconds(std::chrono::system_clock::time_point timestamp) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S");
  return out.str();
}

} // namespace isapisync::core

#endif // ISAPISYNC_CORE_TIME_UTILS_HPP_
