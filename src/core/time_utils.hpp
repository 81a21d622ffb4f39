#ifndef FORGEOPS_CORE_TIME_UTILS_HPP_
#define FORGEOPS_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace forgeops::core {

namespace detail {

inline bool ToUtcTm(std::chrono::system_clock::time_point timestamp, std::tm& utc_time) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
#if defined(_WIN32)
  return gmtime_s(&utc_time, &epoch_seconds) == 0;
#else
  return gmtime_r(&epoch_seconds, &utc_time) != nullptr;
#endif
}

} // namespace detail

// Canonical UTC timestamp formatter used by log lines and summaries.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  std::tm utc_time{};
  if (!detail::ToUtcTm(timestamp, utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Compact `YYYYMMDDTHHMMSSZ` form, safe for file names and run ids.
inline std::string FormatCompactUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  std::tm utc_time{};
  if (!detail::ToUtcTm(timestamp, utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y%m%dT%H%M%SZ");
  return out.str();
}

} // namespace forgeops::core

#endif // FORGEOPS_CORE_TIME_UTILS_HPP_
