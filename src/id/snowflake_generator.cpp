#include "flakeid/id/snowflake_generator.h"

#include "flakeid/id/layout.h"

#include <utility>

namespace flakeid::id {

SnowflakeGenerator::SnowflakeGenerator(ConstructionKey /*key*/, NodeIdResolution resolution,
                                       core::IClock& clock)
    : resolution_(std::move(resolution)), clock_(clock) {}

SnowflakeGenerator::CreateResult SnowflakeGenerator::create(const NodeIdSetting& setting,
                                                            core::IClock& clock,
                                                            NodeIdResolver& resolver) {
  auto resolution = resolver.resolve(setting);
  if (!resolution.has_value()) {
    return CreateResult::err(resolution.error());
  }

  return CreateResult::ok(
      std::make_unique<SnowflakeGenerator>(ConstructionKey{}, resolution.value(), clock));
}

SnowflakeGenerator::GenerateResult SnowflakeGenerator::generate() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::int64_t now = adjusted_now();

  // A clock before the custom epoch cannot be encoded and is treated like any
  // other backwards step.
  if (now < prev_timestamp_ || now < 0) {
    return GenerateResult::err(core::IdError::kClockRegression);
  }

  if (now == prev_timestamp_) {
    sequence_ = static_cast<std::uint16_t>((sequence_ + 1) & kMaxSequence);
    if (sequence_ == 0) {
      // Sequence exhausted for this millisecond.
      now = wait_past(prev_timestamp_);
    }
  } else {
    sequence_ = 0;
  }

  prev_timestamp_ = now;

  return GenerateResult::ok(compose(IdParts{now, resolution_.node_id, sequence_}));
}

std::int64_t SnowflakeGenerator::adjusted_now() {
  return clock_.now_unix_millis() - kCustomEpochMillis;
}

std::int64_t SnowflakeGenerator::wait_past(const std::int64_t timestamp) {
  // Busy-wait: the gap is below one millisecond, a sleep would overshoot it.
  std::int64_t now = adjusted_now();
  while (now <= timestamp) {
    now = adjusted_now();
  }
  return now;
}

}  // namespace flakeid::id
