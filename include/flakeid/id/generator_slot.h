#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/id/node_id.h"
#include "flakeid/id/snowflake_generator.h"

#include <memory>
#include <mutex>

namespace flakeid::id {

// GeneratorSlot holds at most one SnowflakeGenerator for a composition root.
//
// A process that owns a single slot cannot end up with two independent node-id
// assignments: an explicit create() after a generator exists is refused, while
// get_or_create_auto() hands back whatever generator is already installed.
//
// Thread-safe. Returned pointers stay valid for the lifetime of the slot.
class GeneratorSlot {
 public:
  using SlotResult = core::Result<SnowflakeGenerator*, core::IdError>;

  GeneratorSlot(core::IClock& clock, NodeIdResolver& resolver)
      : clock_(clock), resolver_(resolver) {}

  GeneratorSlot(const GeneratorSlot&) = delete;
  GeneratorSlot& operator=(const GeneratorSlot&) = delete;
  GeneratorSlot(GeneratorSlot&&) = delete;
  GeneratorSlot& operator=(GeneratorSlot&&) = delete;

  // create installs a generator for the setting.
  // Errors: kAlreadyCreated if one exists; kInvalidConfiguration from resolution.
  [[nodiscard]] SlotResult create(const NodeIdSetting& setting);

  // get_or_create_auto returns the installed generator, creating an
  // auto-derived one first if the slot is empty.
  [[nodiscard]] SnowflakeGenerator& get_or_create_auto();

  // get returns the installed generator or nullptr.
  [[nodiscard]] SnowflakeGenerator* get() const;

 private:
  core::IClock& clock_;
  NodeIdResolver& resolver_;

  mutable std::mutex mutex_;
  std::unique_ptr<SnowflakeGenerator> generator_;
};

}  // namespace flakeid::id
