#pragma once

#include <chrono>
#include <cstdint>

namespace chatgen {

using TimePoint = std::chrono::system_clock::time_point;

class IClock {
 public:
  virtual ~IClock() = default;
  virtual TimePoint Now() const = 0;
};

class SystemClock : public IClock {
 public:
  TimePoint Now() const override { return std::chrono::system_clock::now(); }
};

inline int64_t ToUnixMillis(TimePoint t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

}  // namespace chatgen
