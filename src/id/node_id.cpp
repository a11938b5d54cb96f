#include "flakeid/id/node_id.h"

#include "flakeid/core/hashing.h"
#include "flakeid/id/layout.h"

#include <charconv>

namespace flakeid::id {

core::Result<NodeIdSetting, core::IdError> parse_node_id_setting(const std::string_view text) {
  if (text == "auto") {
    return core::Result<NodeIdSetting, core::IdError>::ok(NodeIdSetting::automatic());
  }

  std::int64_t value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc{} || ptr != last) {
    return core::Result<NodeIdSetting, core::IdError>::err(core::IdError::kInvalidConfiguration);
  }

  return core::Result<NodeIdSetting, core::IdError>::ok(NodeIdSetting::from_value(value));
}

std::string_view to_string(const NodeIdSource source) {
  switch (source) {
    case NodeIdSource::kExplicit:
      return "explicit";
    case NodeIdSource::kHardwareAddress:
      return "hardware_address";
    case NodeIdSource::kRandom:
      return "random";
  }
  return "unknown";
}

std::string hardware_address_accumulator(const std::vector<NetworkInterface>& interfaces) {
  static constexpr char kHexDigits[] = "0123456789ABCDEF";

  std::string acc;
  for (const auto& iface : interfaces) {
    if (!has_hardware_address(iface)) {
      continue;
    }
    for (const std::uint8_t byte : iface.hardware_address) {
      acc.push_back(kHexDigits[byte >> 4]);
      acc.push_back(kHexDigits[byte & 0x0F]);
    }
  }
  return acc;
}

std::uint16_t node_id_from_accumulator(const std::string_view accumulator) {
  return static_cast<std::uint16_t>(core::stable_hash64(accumulator) & kMaxNodeId);
}

core::Result<NodeIdResolution, core::IdError> NodeIdResolver::resolve(
    const NodeIdSetting& setting) {
  if (setting.is_auto()) {
    return core::Result<NodeIdResolution, core::IdError>::ok(derive());
  }

  const std::int64_t value = setting.explicit_id.value();
  if (value < 0 || value > kMaxNodeId) {
    return core::Result<NodeIdResolution, core::IdError>::err(
        core::IdError::kInvalidConfiguration);
  }

  return core::Result<NodeIdResolution, core::IdError>::ok(
      NodeIdResolution{static_cast<std::uint16_t>(value), NodeIdSource::kExplicit, ""});
}

NodeIdResolution NodeIdResolver::derive() {
  const auto interfaces = interfaces_.list_interfaces();
  if (interfaces.has_value()) {
    // An empty accumulator (loopback only) still hashes to a fixed node id.
    const std::string acc = hardware_address_accumulator(interfaces.value());
    return NodeIdResolution{node_id_from_accumulator(acc), NodeIdSource::kHardwareAddress,
                            core::stable_hash64_hex(acc)};
  }

  return NodeIdResolution{static_cast<std::uint16_t>(entropy_.next_u32() & kMaxNodeId),
                          NodeIdSource::kRandom, ""};
}

}  // namespace flakeid::id
