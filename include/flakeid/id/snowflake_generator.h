#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/id/node_id.h"

#include <cstdint>
#include <memory>
#include <mutex>

namespace flakeid::id {

// SnowflakeGenerator issues 64-bit identifiers laid out as described in layout.h.
//
// Thread-safety: generate() may be called concurrently; each call runs its
// timestamp/sequence update and packing under one std::mutex.
//
// Ordering: for one instance, ids are strictly increasing as long as the clock
// never reports a time earlier than the last one used. When it does, generate()
// fails with kClockRegression and leaves the state untouched.
//
// Throughput: kMaxSequence + 1 ids per millisecond. The call that would exceed
// that spins (holding the lock) until the clock reaches the next millisecond.
class SnowflakeGenerator final {
  // Restricts construction to create() while keeping the constructor public.
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

 public:
  using CreateResult = core::Result<std::unique_ptr<SnowflakeGenerator>, core::IdError>;
  using GenerateResult = core::Result<std::uint64_t, core::IdError>;

  // create resolves the node id once. Fails with kInvalidConfiguration when an
  // explicit node id is outside [0, kMaxNodeId]. The clock must outlive the generator.
  [[nodiscard]] static CreateResult create(const NodeIdSetting& setting, core::IClock& clock,
                                           NodeIdResolver& resolver);

  SnowflakeGenerator(ConstructionKey key, NodeIdResolution resolution, core::IClock& clock);
  ~SnowflakeGenerator() = default;

  // Disable copy/move (mutex not copyable)
  SnowflakeGenerator(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator(SnowflakeGenerator&&) = delete;
  SnowflakeGenerator& operator=(SnowflakeGenerator&&) = delete;

  [[nodiscard]] GenerateResult generate();

  [[nodiscard]] std::uint16_t node_id() const { return resolution_.node_id; }
  [[nodiscard]] const NodeIdResolution& node_id_resolution() const { return resolution_; }

 private:
  std::int64_t adjusted_now();
  std::int64_t wait_past(std::int64_t timestamp);

  const NodeIdResolution resolution_;
  core::IClock& clock_;

  std::mutex mutex_;
  std::int64_t prev_timestamp_{-1};  // guarded by mutex_
  std::uint16_t sequence_{0};        // guarded by mutex_
};

}  // namespace flakeid::id
