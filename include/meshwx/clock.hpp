/**
 * @file clock.hpp
 * @brief Millisecond wall clock shared by the host loop and the callback thread.
 *
 * All core timestamps are Unix epoch milliseconds in a `uint64_t`. Components
 * that stamp events on their own (the ack handler runs on the transport
 * thread) take a `ClockFn` so tests can drive time by hand.
 */
#ifndef MESHWX_CLOCK_HPP
#define MESHWX_CLOCK_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace meshwx {

/// Source of "now" in epoch milliseconds.
using ClockFn = std::function<uint64_t()>;

/// System wall clock in epoch milliseconds.
inline uint64_t now_ms_system() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

/// Seconds (config units) to milliseconds (core units).
inline uint64_t seconds_to_ms(uint32_t s) { return static_cast<uint64_t>(s) * 1000u; }

/**
 * @brief Format an epoch-ms timestamp in local time with a strftime pattern.
 * @param ms  Epoch milliseconds.
 * @param fmt strftime(3) pattern, e.g. "%H:%M:%S".
 * @return Formatted text; empty if the pattern produced nothing.
 */
std::string format_local_time(uint64_t ms, const char* fmt);

/// ISO-8601 UTC with milliseconds, used as the log line prefix.
std::string format_utc_iso(uint64_t ms);

} // namespace meshwx

#endif // MESHWX_CLOCK_HPP
