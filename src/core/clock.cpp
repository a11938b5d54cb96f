#include "flakeid/core/clock.h"

#include <chrono>

namespace flakeid::core {

std::int64_t SystemClock::now_unix_millis() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

std::int64_t FixedClock::now_unix_millis() {
  return unix_millis_.load(std::memory_order_acquire);
}

void FixedClock::set(const std::int64_t unix_millis) {
  unix_millis_.store(unix_millis, std::memory_order_release);
}

void FixedClock::advance(const std::int64_t delta_millis) {
  unix_millis_.fetch_add(delta_millis, std::memory_order_acq_rel);
}

}  // namespace flakeid::core
