#pragma once

#include <cstdint>

namespace flakeid::id {

// Abstract source of random 32-bit values for the node-id fallback.
class IEntropySource {
 public:
  virtual ~IEntropySource() = default;

  virtual std::uint32_t next_u32() = 0;

 protected:
  IEntropySource() = default;
  IEntropySource(const IEntropySource&) = default;
  IEntropySource& operator=(const IEntropySource&) = default;
  IEntropySource(IEntropySource&&) = default;
  IEntropySource& operator=(IEntropySource&&) = default;
};

// Production entropy: std::random_device, backed by the kernel CSPRNG on Linux.
// Throws std::runtime_error if the device is unavailable.
class SystemEntropySource final : public IEntropySource {
 public:
  std::uint32_t next_u32() override;
};

// Fixed entropy: always returns the same value.
class FixedEntropySource final : public IEntropySource {
 public:
  explicit FixedEntropySource(std::uint32_t value) : value_(value) {}

  std::uint32_t next_u32() override { return value_; }

 private:
  std::uint32_t value_;
};

}  // namespace flakeid::id
