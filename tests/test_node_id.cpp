#include "flakeid/core/hashing.h"
#include "flakeid/id/entropy.h"
#include "flakeid/id/layout.h"
#include "flakeid/id/network_interfaces.h"
#include "flakeid/id/node_id.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <utility>
#include <vector>

using namespace flakeid;
using id::NetworkInterface;

namespace {

NetworkInterface eth(const char* name, std::vector<std::uint8_t> mac) {
  return NetworkInterface{name, std::move(mac), false};
}

NetworkInterface loopback() { return NetworkInterface{"lo", {0, 0, 0, 0, 0, 0}, true}; }

}  // namespace

// ── parse_node_id_setting ───────────────────────────────────────────────────

TEST_CASE("parse_node_id_setting: auto and -1 mean auto-derive", "[node_id][config]") {
  const auto by_word = id::parse_node_id_setting("auto");
  REQUIRE(by_word.has_value());
  CHECK(by_word.value().is_auto());

  const auto by_sentinel = id::parse_node_id_setting("-1");
  REQUIRE(by_sentinel.has_value());
  CHECK(by_sentinel.value().is_auto());
}

TEST_CASE("parse_node_id_setting: integers are explicit, unchecked until resolution",
          "[node_id][config]") {
  const auto five = id::parse_node_id_setting("5");
  REQUIRE(five.has_value());
  REQUIRE(five.value().explicit_id.has_value());
  CHECK(*five.value().explicit_id == 5);

  const auto big = id::parse_node_id_setting("1024");
  REQUIRE(big.has_value());
  CHECK(*big.value().explicit_id == 1024);
}

TEST_CASE("parse_node_id_setting: malformed input is invalid configuration",
          "[node_id][config]") {
  for (const char* text : {"", "abc", "12x", " 5", "5 ", "AUTO", "1.5"}) {
    const auto result = id::parse_node_id_setting(text);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == core::IdError::kInvalidConfiguration);
  }
}

// ── Explicit resolution ─────────────────────────────────────────────────────

TEST_CASE("NodeIdResolver: every explicit id in range resolves to itself", "[node_id]") {
  id::StaticNetworkInterfaceSource interfaces(std::nullopt);
  id::FixedEntropySource entropy(0);
  id::NodeIdResolver resolver(interfaces, entropy);

  for (std::int64_t value = 0; value <= id::kMaxNodeId; ++value) {
    const auto result = resolver.resolve(id::NodeIdSetting::from_value(value));
    REQUIRE(result.has_value());
    CHECK(result.value().node_id == value);
    CHECK(result.value().source == id::NodeIdSource::kExplicit);
  }
}

TEST_CASE("NodeIdResolver: explicit ids outside [0, 1023] are rejected", "[node_id]") {
  id::StaticNetworkInterfaceSource interfaces(std::nullopt);
  id::FixedEntropySource entropy(0);
  id::NodeIdResolver resolver(interfaces, entropy);

  for (const std::int64_t value : {std::int64_t{-2}, std::int64_t{-100}, std::int64_t{1024},
                                   std::int64_t{65536}}) {
    const auto result = resolver.resolve(id::NodeIdSetting::from_value(value));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == core::IdError::kInvalidConfiguration);
  }
}

TEST_CASE("NodeIdSetting::from_value maps the -1 sentinel to auto", "[node_id]") {
  CHECK(id::NodeIdSetting::from_value(-1).is_auto());
  CHECK_FALSE(id::NodeIdSetting::from_value(0).is_auto());
}

// ── Hardware-address derivation ─────────────────────────────────────────────

TEST_CASE("hardware_address_accumulator: uppercase hex in enumeration order", "[node_id]") {
  const std::vector<NetworkInterface> interfaces = {
      eth("eth0", {0x0a, 0x1b, 0x2c, 0x3d, 0x4e, 0x5f}),
      loopback(),
      NetworkInterface{"tun0", {}, false},
      eth("eth1", {0x00, 0x00, 0x00, 0x00, 0x00, 0x01}),
  };

  CHECK(id::hardware_address_accumulator(interfaces) == "0A1B2C3D4E5F000000000001");
}

TEST_CASE("has_hardware_address skips loopback, empty and all-zero addresses", "[node_id]") {
  CHECK_FALSE(id::has_hardware_address(loopback()));
  CHECK_FALSE(id::has_hardware_address(NetworkInterface{"tun0", {}, false}));
  CHECK_FALSE(id::has_hardware_address(eth("dummy0", {0, 0, 0, 0, 0, 0})));
  CHECK(id::has_hardware_address(eth("eth0", {0, 0, 0, 0, 0, 1})));
}

TEST_CASE("NodeIdResolver: auto derives from the hash of hardware addresses", "[node_id]") {
  const std::vector<NetworkInterface> list = {eth("eth0", {0xde, 0xad, 0xbe, 0xef, 0x00, 0x01})};
  id::StaticNetworkInterfaceSource interfaces(list);
  id::FixedEntropySource entropy(0xFFFFFFFF);
  id::NodeIdResolver resolver(interfaces, entropy);

  const auto result = resolver.resolve(id::NodeIdSetting::automatic());
  REQUIRE(result.has_value());

  const auto expected =
      static_cast<std::uint16_t>(core::stable_hash64("DEADBEEF0001") & id::kMaxNodeId);
  CHECK(result.value().node_id == expected);
  CHECK(result.value().source == id::NodeIdSource::kHardwareAddress);
  CHECK(result.value().fingerprint == core::stable_hash64_hex("DEADBEEF0001"));

  // Same interfaces, same node id.
  CHECK(resolver.derive().node_id == expected);
}

TEST_CASE("NodeIdResolver: enumeration order changes the input string", "[node_id]") {
  const auto a = eth("eth0", {0x01, 0x02, 0x03, 0x04, 0x05, 0x06});
  const auto b = eth("eth1", {0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f});
  id::StaticNetworkInterfaceSource forward(std::vector<NetworkInterface>{a, b});
  id::StaticNetworkInterfaceSource reverse(std::vector<NetworkInterface>{b, a});
  id::FixedEntropySource entropy(0);

  id::NodeIdResolver forward_resolver(forward, entropy);
  id::NodeIdResolver reverse_resolver(reverse, entropy);

  CHECK(forward_resolver.derive().fingerprint != reverse_resolver.derive().fingerprint);
}

// ── Random fallback ─────────────────────────────────────────────────────────

TEST_CASE("NodeIdResolver: refused enumeration falls back to masked entropy", "[node_id]") {
  id::StaticNetworkInterfaceSource interfaces(std::nullopt);
  id::FixedEntropySource entropy(0xABCD1234);
  id::NodeIdResolver resolver(interfaces, entropy);

  const auto resolution = resolver.derive();
  CHECK(resolution.node_id == (0xABCD1234 & id::kMaxNodeId));
  CHECK(resolution.source == id::NodeIdSource::kRandom);
  CHECK(resolution.fingerprint.empty());
}

TEST_CASE("NodeIdResolver: loopback only hashes the empty accumulator", "[node_id]") {
  id::StaticNetworkInterfaceSource interfaces(std::vector<NetworkInterface>{loopback()});
  id::FixedEntropySource entropy(0xFFFFFFFF);
  id::NodeIdResolver resolver(interfaces, entropy);

  const auto resolution = resolver.derive();
  // FNV-1a of "" is 0xcbf29ce484222325; its low 10 bits are 0x325.
  CHECK(resolution.node_id == 0x325);
  CHECK(resolution.node_id == id::node_id_from_accumulator(""));
  CHECK(resolution.source == id::NodeIdSource::kHardwareAddress);
  CHECK(resolution.fingerprint == "cbf29ce484222325");
}

TEST_CASE("NodeIdResolver: loopback only ignores entropy across restarts", "[node_id]") {
  id::StaticNetworkInterfaceSource interfaces(std::vector<NetworkInterface>{loopback()});
  id::FixedEntropySource first_entropy(0x3FF);
  id::FixedEntropySource second_entropy(0x155);
  id::NodeIdResolver first_run(interfaces, first_entropy);
  id::NodeIdResolver second_run(interfaces, second_entropy);

  CHECK(first_run.derive().node_id == second_run.derive().node_id);
}

TEST_CASE("NodeIdResolver: an empty interface list hashes the empty accumulator", "[node_id]") {
  id::StaticNetworkInterfaceSource interfaces(std::vector<NetworkInterface>{});
  id::FixedEntropySource entropy(0x155);
  id::NodeIdResolver resolver(interfaces, entropy);

  const auto resolution = resolver.derive();
  CHECK(resolution.node_id == 0x325);
  CHECK(resolution.source == id::NodeIdSource::kHardwareAddress);
}

TEST_CASE("NodeIdResolver: system sources always yield an id in range", "[node_id][system]") {
  id::SystemNetworkInterfaceSource interfaces;
  id::SystemEntropySource entropy;
  id::NodeIdResolver resolver(interfaces, entropy);

  const auto resolution = resolver.derive();
  CHECK(resolution.node_id <= id::kMaxNodeId);
}
