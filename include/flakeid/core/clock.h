#pragma once

#include <atomic>
#include <cstdint>

namespace flakeid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests pin or step the clock.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current wall-clock time as milliseconds since the Unix epoch (UTC).
  virtual std::int64_t now_unix_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_unix_millis() override;
};

// Fixed clock: returns a pinned timestamp until moved with set() or advance().
// Thread-safe: the pinned value is atomic so tests may move it while other threads read.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::int64_t unix_millis) : unix_millis_(unix_millis) {}
  ~FixedClock() override = default;

  // Not copyable or movable (contains atomic value)
  FixedClock(const FixedClock&) = delete;
  FixedClock& operator=(const FixedClock&) = delete;
  FixedClock(FixedClock&&) = delete;
  FixedClock& operator=(FixedClock&&) = delete;

  std::int64_t now_unix_millis() override;

  void set(std::int64_t unix_millis);
  void advance(std::int64_t delta_millis);

 private:
  std::atomic<std::int64_t> unix_millis_;
};

}  // namespace flakeid::core
