#pragma once
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace tw {

inline std::string PathToUtf8String(const std::filesystem::path& path) {
  return path.string();
}

// RFC 3339 in UTC with microsecond precision, e.g. 2026-10-19T18:54:00.123456Z.
inline std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  if (fractional.count() < 0) {
    fractional += std::chrono::seconds(1);
  }
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

// Accepts the output of FormatTimestamp and the fractionless form. Only UTC
// ("Z") offsets are understood.
inline std::optional<std::chrono::system_clock::time_point> ParseTimestamp(std::string_view text) {
  std::tm tm{};
  std::istringstream iss{std::string(text)};
  iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }
  std::int64_t micros = 0;
  if (iss.peek() == '.') {
    iss.get();
    int digits = 0;
    while (std::isdigit(iss.peek()) != 0) {
      const int digit = iss.get() - '0';
      if (digits < 6) {
        micros = micros * 10 + digit;
      }
      ++digits;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < 6; ++digits) {
      micros *= 10;
    }
  }
  if (iss.get() != 'Z') {
    return std::nullopt;
  }
  const std::time_t seconds = timegm(&tm);
  return std::chrono::system_clock::from_time_t(seconds) + std::chrono::microseconds(micros);
}

} // namespace tw
