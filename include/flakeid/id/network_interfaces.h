#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace flakeid::id {

// NetworkInterface is the subset of local interface metadata used to derive a node id.
struct NetworkInterface {
  std::string name;                           // NOLINT(readability-identifier-naming)
  std::vector<std::uint8_t> hardware_address;  // NOLINT(readability-identifier-naming)
  bool is_loopback{false};                    // NOLINT(readability-identifier-naming)
};

// Abstract source of local network interfaces.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class INetworkInterfaceSource {
 public:
  virtual ~INetworkInterfaceSource() = default;

  // Enumerate local interfaces in platform order.
  // Returns nullopt when the platform refuses enumeration.
  virtual std::optional<std::vector<NetworkInterface>> list_interfaces() = 0;

 protected:
  INetworkInterfaceSource() = default;
  INetworkInterfaceSource(const INetworkInterfaceSource&) = default;
  INetworkInterfaceSource& operator=(const INetworkInterfaceSource&) = default;
  INetworkInterfaceSource(INetworkInterfaceSource&&) = default;
  INetworkInterfaceSource& operator=(INetworkInterfaceSource&&) = default;
};

// Production source: getifaddrs(3) link-layer entries (AF_PACKET).
// No network traffic; reads kernel interface tables only.
class SystemNetworkInterfaceSource final : public INetworkInterfaceSource {
 public:
  std::optional<std::vector<NetworkInterface>> list_interfaces() override;
};

// Static source: returns a preconfigured list, or nullopt to simulate a denied enumeration.
class StaticNetworkInterfaceSource final : public INetworkInterfaceSource {
 public:
  explicit StaticNetworkInterfaceSource(std::optional<std::vector<NetworkInterface>> interfaces)
      : interfaces_(std::move(interfaces)) {}

  std::optional<std::vector<NetworkInterface>> list_interfaces() override { return interfaces_; }

 private:
  std::optional<std::vector<NetworkInterface>> interfaces_;
};

// has_hardware_address is true for non-loopback interfaces carrying a non-zero link address.
[[nodiscard]] bool has_hardware_address(const NetworkInterface& iface);

}  // namespace flakeid::id
