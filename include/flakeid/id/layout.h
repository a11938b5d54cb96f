#pragma once

#include <cstdint>

namespace flakeid::id {

// Bit layout of a 64-bit identifier, most significant field first:
//
//   | adjusted timestamp (42) | node id (10) | sequence (12) |
//
// The timestamp is milliseconds since kCustomEpochMillis, which keeps the
// 42-bit field usable for roughly 139 years from 2018.
constexpr int kTimestampBits = 42;
constexpr int kNodeBits = 10;
constexpr int kSequenceBits = 12;
constexpr int kTotalBits = kTimestampBits + kNodeBits + kSequenceBits;
static_assert(kTotalBits == 64, "identifier layout must fill exactly 64 bits");

constexpr int kNodeShift = kSequenceBits;
constexpr int kTimestampShift = kNodeBits + kSequenceBits;

constexpr std::uint16_t kMaxNodeId = (1u << kNodeBits) - 1;
constexpr std::uint16_t kMaxSequence = (1u << kSequenceBits) - 1;
constexpr std::int64_t kMaxTimestamp = (std::int64_t{1} << kTimestampBits) - 1;

// 2018-01-01T00:00:00Z in Unix milliseconds.
constexpr std::int64_t kCustomEpochMillis = 1514764800000;

// IdParts is the decoded form of an identifier.
struct IdParts {
  // Adjusted timestamp: milliseconds since kCustomEpochMillis.
  std::int64_t timestamp{0};  // NOLINT(readability-identifier-naming)
  std::uint16_t node_id{0};   // NOLINT(readability-identifier-naming)
  std::uint16_t sequence{0};  // NOLINT(readability-identifier-naming)

  // Wall-clock time of the identifier in Unix milliseconds.
  [[nodiscard]] std::int64_t unix_millis() const { return timestamp + kCustomEpochMillis; }

  bool operator==(const IdParts&) const = default;
};

// compose packs the parts into an identifier. Fields wider than their bit
// budget are masked; callers are expected to pass in-range values.
[[nodiscard]] constexpr std::uint64_t compose(const IdParts& parts) {
  return ((static_cast<std::uint64_t>(parts.timestamp) & static_cast<std::uint64_t>(kMaxTimestamp))
          << kTimestampShift) |
         (static_cast<std::uint64_t>(parts.node_id & kMaxNodeId) << kNodeShift) |
         static_cast<std::uint64_t>(parts.sequence & kMaxSequence);
}

// decompose extracts the timestamp, node id and sequence fields.
[[nodiscard]] constexpr IdParts decompose(const std::uint64_t id) {
  return IdParts{
      static_cast<std::int64_t>(id >> kTimestampShift),
      static_cast<std::uint16_t>((id >> kNodeShift) & kMaxNodeId),
      static_cast<std::uint16_t>(id & kMaxSequence),
  };
}

}  // namespace flakeid::id
