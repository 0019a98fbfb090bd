#include "memory_network_driver.hpp"

#include <stdexcept>

namespace relay::network {

void MemoryNetworkDriver::CreateNetwork(const NetworkSpec& spec) {
  std::lock_guard lock(mutex_);
  auto&           n = networks_[spec.name];
  if (!n.subnet.empty()) return;

  auto o   = subnet_overrides_.find(spec.name);
  n.subnet = o != subnet_overrides_.end() ? o->second : spec.subnet_cidr;
  n.reserved.insert(spec.gateway);
}

std::optional<std::string> MemoryNetworkDriver::InspectSubnet(const std::string& network) {
  std::lock_guard lock(mutex_);
  auto            it = networks_.find(network);
  if (it == networks_.end() || it->second.subnet.empty()) return std::nullopt;
  return it->second.subnet;
}

AttachOutcome MemoryNetworkDriver::ConnectContainer(const std::string& network, const std::string& container, const std::string& address) {
  std::lock_guard lock(mutex_);
  auto            it = networks_.find(network);
  if (it == networks_.end() || it->second.subnet.empty()) {
    throw std::runtime_error("network " + network + " not found");
  }

  auto& n = it->second;
  if (n.endpoints.count(container)) return AttachOutcome::kAlreadyAttached;
  if (n.reserved.count(address)) return AttachOutcome::kAddressInUse;
  for (const auto& [name, used] : n.endpoints) {
    if (used == address) return AttachOutcome::kAddressInUse;
  }

  n.endpoints[container] = address;
  return AttachOutcome::kAttached;
}

void MemoryNetworkDriver::DisconnectContainer(const std::string& network, const std::string& container) {
  std::lock_guard lock(mutex_);
  auto            it = networks_.find(network);
  if (it != networks_.end()) it->second.endpoints.erase(container);
}

void MemoryNetworkDriver::RemoveNetwork(const std::string& network) {
  std::lock_guard lock(mutex_);
  auto            it = networks_.find(network);
  if (it == networks_.end()) return;
  if (!it->second.endpoints.empty()) {
    throw std::runtime_error("network " + network + " has active endpoints");
  }
  networks_.erase(it);
}

void MemoryNetworkDriver::ReserveAddress(const std::string& network, const std::string& address) {
  std::lock_guard lock(mutex_);
  networks_[network].reserved.insert(address);
}

void MemoryNetworkDriver::OverrideSubnet(const std::string& network, const std::string& subnet) {
  std::lock_guard lock(mutex_);
  subnet_overrides_[network] = subnet;
}

bool MemoryNetworkDriver::HasNetwork(const std::string& network) const {
  std::lock_guard lock(mutex_);
  auto            it = networks_.find(network);
  return it != networks_.end() && !it->second.subnet.empty();
}

std::optional<std::string> MemoryNetworkDriver::AddressOf(const std::string& network, const std::string& container) const {
  std::lock_guard lock(mutex_);
  auto            it = networks_.find(network);
  if (it == networks_.end()) return std::nullopt;
  auto ep = it->second.endpoints.find(container);
  if (ep == it->second.endpoints.end()) return std::nullopt;
  return ep->second;
}

} // namespace relay::network
