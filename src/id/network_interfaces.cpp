#include "flakeid/id/network_interfaces.h"

#include <ifaddrs.h>
#include <net/if.h>
#include <netpacket/packet.h>
#include <sys/socket.h>

#include <algorithm>
#include <map>
#include <memory>

namespace flakeid::id {

namespace {

struct IfAddrsDeleter {
  void operator()(ifaddrs* list) const { freeifaddrs(list); }
};

using IfAddrsPtr = std::unique_ptr<ifaddrs, IfAddrsDeleter>;

}  // namespace

std::optional<std::vector<NetworkInterface>> SystemNetworkInterfaceSource::list_interfaces() {
  ifaddrs* raw = nullptr;
  if (getifaddrs(&raw) != 0) {
    return std::nullopt;
  }
  const IfAddrsPtr list(raw);

  // getifaddrs yields one entry per (interface, family); keep the first
  // appearance order of each interface name and attach its link-layer address.
  std::vector<NetworkInterface> interfaces;
  std::map<std::string, std::size_t> index_by_name;

  for (const ifaddrs* entry = list.get(); entry != nullptr; entry = entry->ifa_next) {
    if (entry->ifa_name == nullptr) {
      continue;
    }

    const std::string name{entry->ifa_name};
    auto it = index_by_name.find(name);
    if (it == index_by_name.end()) {
      NetworkInterface iface;
      iface.name = name;
      iface.is_loopback = (entry->ifa_flags & IFF_LOOPBACK) != 0;
      interfaces.push_back(std::move(iface));
      it = index_by_name.emplace(name, interfaces.size() - 1).first;
    }

    if (entry->ifa_addr == nullptr || entry->ifa_addr->sa_family != AF_PACKET) {
      continue;
    }

    const auto* link = reinterpret_cast<const sockaddr_ll*>(entry->ifa_addr);  // NOLINT
    const std::size_t len = std::min<std::size_t>(link->sll_halen, sizeof(link->sll_addr));
    interfaces[it->second].hardware_address.assign(link->sll_addr, link->sll_addr + len);
  }

  return interfaces;
}

bool has_hardware_address(const NetworkInterface& iface) {
  if (iface.is_loopback || iface.hardware_address.empty()) {
    return false;
  }
  return std::any_of(iface.hardware_address.begin(), iface.hardware_address.end(),
                     [](std::uint8_t b) { return b != 0; });
}

}  // namespace flakeid::id
