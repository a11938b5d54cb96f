#pragma once

#include "flakeid/core/result.h"
#include "flakeid/id/entropy.h"
#include "flakeid/id/network_interfaces.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flakeid::id {

// Configuration value meaning "derive the node id locally". Kept for
// configuration systems that can only express integers.
constexpr std::int64_t kAutoNodeIdSentinel = -1;

// NodeIdSetting is the caller's request: an explicit node id, or auto-derive.
// An explicit value is not range-checked until it is resolved.
struct NodeIdSetting {
  std::optional<std::int64_t> explicit_id;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] static NodeIdSetting automatic() { return NodeIdSetting{std::nullopt}; }

  // from_value maps kAutoNodeIdSentinel to automatic(); any other value is explicit.
  [[nodiscard]] static NodeIdSetting from_value(std::int64_t value) {
    if (value == kAutoNodeIdSentinel) {
      return automatic();
    }
    return NodeIdSetting{value};
  }

  [[nodiscard]] bool is_auto() const { return !explicit_id.has_value(); }
};

// parse_node_id_setting accepts "auto", "-1" or a decimal integer.
// Returns kInvalidConfiguration for anything else. Range is checked at resolution.
[[nodiscard]] core::Result<NodeIdSetting, core::IdError> parse_node_id_setting(
    std::string_view text);

enum class NodeIdSource {
  kExplicit,         // NOLINT(readability-identifier-naming)
  kHardwareAddress,  // NOLINT(readability-identifier-naming)
  kRandom,           // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::string_view to_string(NodeIdSource source);

// NodeIdResolution records how a node id was obtained.
// fingerprint is the hex hash of the hardware-address accumulator (kHardwareAddress only);
// it identifies the input without exposing the addresses themselves.
struct NodeIdResolution {
  std::uint16_t node_id{0};                     // NOLINT(readability-identifier-naming)
  NodeIdSource source{NodeIdSource::kExplicit};  // NOLINT(readability-identifier-naming)
  std::string fingerprint;                      // NOLINT(readability-identifier-naming)
};

// hardware_address_accumulator concatenates the uppercase two-digit hex encoding
// of every hardware address byte, interfaces in the given order.
// Interfaces without a hardware address contribute nothing.
[[nodiscard]] std::string hardware_address_accumulator(
    const std::vector<NetworkInterface>& interfaces);

// node_id_from_accumulator hashes the accumulator and masks it to kNodeBits.
[[nodiscard]] std::uint16_t node_id_from_accumulator(std::string_view accumulator);

// NodeIdResolver turns a NodeIdSetting into a node id in [0, kMaxNodeId].
//
// Auto-derive order:
//   1. hash of the local hardware addresses, whenever enumeration succeeds
//      (no hardware address at all hashes the empty string)
//   2. random value, only when enumeration is refused
//
// Holds references (not ownership); sources must outlive the resolver.
class NodeIdResolver {
 public:
  NodeIdResolver(INetworkInterfaceSource& interfaces, IEntropySource& entropy)
      : interfaces_(interfaces), entropy_(entropy) {}

  [[nodiscard]] core::Result<NodeIdResolution, core::IdError> resolve(
      const NodeIdSetting& setting);

  [[nodiscard]] NodeIdResolution derive();

 private:
  INetworkInterfaceSource& interfaces_;
  IEntropySource& entropy_;
};

}  // namespace flakeid::id
