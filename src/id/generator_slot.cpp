#include "flakeid/id/generator_slot.h"

#include <utility>

namespace flakeid::id {

GeneratorSlot::SlotResult GeneratorSlot::create(const NodeIdSetting& setting) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (generator_ != nullptr) {
    return SlotResult::err(core::IdError::kAlreadyCreated);
  }

  auto created = SnowflakeGenerator::create(setting, clock_, resolver_);
  if (!created.has_value()) {
    return SlotResult::err(created.error());
  }

  generator_ = std::move(created.value());
  return SlotResult::ok(generator_.get());
}

SnowflakeGenerator& GeneratorSlot::get_or_create_auto() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (generator_ == nullptr) {
    // Auto resolution has no failure path.
    auto created = SnowflakeGenerator::create(NodeIdSetting::automatic(), clock_, resolver_);
    generator_ = std::move(created.value());
  }
  return *generator_;
}

SnowflakeGenerator* GeneratorSlot::get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generator_.get();
}

}  // namespace flakeid::id
