#include "flakeid/core/clock.h"
#include "flakeid/id/entropy.h"
#include "flakeid/id/generator_slot.h"
#include "flakeid/id/layout.h"
#include "flakeid/id/network_interfaces.h"
#include "flakeid/id/node_id.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>

using namespace flakeid;

namespace {

constexpr std::int64_t kStartMillis = id::kCustomEpochMillis + 5'000;

}  // namespace

TEST_CASE("GeneratorSlot: explicit create installs a generator", "[slot]") {
  core::FixedClock clock(kStartMillis);
  id::StaticNetworkInterfaceSource interfaces(std::nullopt);
  id::FixedEntropySource entropy(0);
  id::NodeIdResolver resolver(interfaces, entropy);
  id::GeneratorSlot slot(clock, resolver);

  CHECK(slot.get() == nullptr);

  const auto installed = slot.create(id::NodeIdSetting::from_value(42));
  REQUIRE(installed.has_value());
  CHECK(installed.value()->node_id() == 42);
  CHECK(slot.get() == installed.value());
}

TEST_CASE("GeneratorSlot: a second create is refused with kAlreadyCreated", "[slot]") {
  core::FixedClock clock(kStartMillis);
  id::StaticNetworkInterfaceSource interfaces(std::nullopt);
  id::FixedEntropySource entropy(0);
  id::NodeIdResolver resolver(interfaces, entropy);
  id::GeneratorSlot slot(clock, resolver);

  REQUIRE(slot.create(id::NodeIdSetting::from_value(1)).has_value());

  const auto again = slot.create(id::NodeIdSetting::from_value(2));
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error() == core::IdError::kAlreadyCreated);

  const auto auto_again = slot.create(id::NodeIdSetting::automatic());
  REQUIRE_FALSE(auto_again.has_value());
  CHECK(auto_again.error() == core::IdError::kAlreadyCreated);

  // The first generator stays installed.
  CHECK(slot.get()->node_id() == 1);
}

TEST_CASE("GeneratorSlot: invalid explicit id leaves the slot empty", "[slot]") {
  core::FixedClock clock(kStartMillis);
  id::StaticNetworkInterfaceSource interfaces(std::nullopt);
  id::FixedEntropySource entropy(0);
  id::NodeIdResolver resolver(interfaces, entropy);
  id::GeneratorSlot slot(clock, resolver);

  const auto failed = slot.create(id::NodeIdSetting::from_value(4096));
  REQUIRE_FALSE(failed.has_value());
  CHECK(failed.error() == core::IdError::kInvalidConfiguration);
  CHECK(slot.get() == nullptr);

  REQUIRE(slot.create(id::NodeIdSetting::from_value(4)).has_value());
}

TEST_CASE("GeneratorSlot: get_or_create_auto creates once, then returns the same generator",
          "[slot]") {
  core::FixedClock clock(kStartMillis);
  id::StaticNetworkInterfaceSource interfaces(std::nullopt);
  id::FixedEntropySource entropy(1025);  // masks to 1
  id::NodeIdResolver resolver(interfaces, entropy);
  id::GeneratorSlot slot(clock, resolver);

  auto& first = slot.get_or_create_auto();
  auto& second = slot.get_or_create_auto();
  CHECK(&first == &second);
  CHECK(first.node_id() == 1);

  // The shared generator keeps one sequence across both handles.
  const auto a = first.generate();
  const auto b = second.generate();
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  CHECK(id::decompose(b.value()).sequence == 1);
}

TEST_CASE("GeneratorSlot: get_or_create_auto returns an explicitly created generator",
          "[slot]") {
  core::FixedClock clock(kStartMillis);
  id::StaticNetworkInterfaceSource interfaces(std::nullopt);
  id::FixedEntropySource entropy(0);
  id::NodeIdResolver resolver(interfaces, entropy);
  id::GeneratorSlot slot(clock, resolver);

  REQUIRE(slot.create(id::NodeIdSetting::from_value(300)).has_value());
  CHECK(slot.get_or_create_auto().node_id() == 300);
}
