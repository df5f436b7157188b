#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <thread>

namespace lanscan::core::common::time {

inline std::int64_t NowUnixMs() {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
  return static_cast<std::int64_t>(ms.count());
}

inline std::string Iso8601Utc(std::int64_t unix_ms) {
  const std::time_t tt = static_cast<std::time_t>(unix_ms / 1000);

  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

inline std::string NowIso8601Utc() { return Iso8601Utc(NowUnixMs()); }

inline void SleepMs(std::uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

inline std::int64_t SecondsToMs(double seconds) {
  if (seconds <= 0.0) return 0;
  return static_cast<std::int64_t>(seconds * 1000.0 + 0.5);
}

// Wall clock used for firstSeen/lastSeen stamps and the offline sweep.
class Clock {
public:
  virtual ~Clock() = default;
  virtual std::int64_t NowMs() const = 0;
};

class SystemClock final : public Clock {
public:
  std::int64_t NowMs() const override { return NowUnixMs(); }
};

}  // namespace lanscan::core::common::time
