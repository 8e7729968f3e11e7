#ifndef HITL_CORE_CLOCK_H
#define HITL_CORE_CLOCK_H

#include <chrono>
#include <functional>

namespace hitl {

using TimePoint = std::chrono::system_clock::time_point;

// Injected wherever expiry is computed so tests can move time
using Clock = std::function<TimePoint()>;

inline Clock systemClock() {
  return []() { return std::chrono::system_clock::now(); };
}

}  // namespace hitl

#endif  // HITL_CORE_CLOCK_H
