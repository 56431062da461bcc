// ============================================================================
// clock.cpp — implementation for clock.hpp
// ============================================================================
#include "meshwx/clock.hpp"

#include <cstdio>   // std::snprintf for the millisecond suffix
#include <ctime>    // localtime_r, gmtime_r, strftime

namespace meshwx {

std::string format_local_time(uint64_t ms, const char* fmt) {
  std::time_t secs = static_cast<std::time_t>(ms / 1000u);
  std::tm tmv{};
  localtime_r(&secs, &tmv);                       // thread-safe variant; callback thread uses it too
  char buf[64];
  size_t n = std::strftime(buf, sizeof(buf), fmt, &tmv);
  return std::string(buf, n);
}

std::string format_utc_iso(uint64_t ms) {
  std::time_t secs = static_cast<std::time_t>(ms / 1000u);
  std::tm tmv{};
  gmtime_r(&secs, &tmv);
  char buf[32];
  size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmv);
  char out[48];
  std::snprintf(out, sizeof(out), "%.*s.%03uZ", static_cast<int>(n), buf,
                static_cast<unsigned>(ms % 1000u));
  return out;
}

} // namespace meshwx
