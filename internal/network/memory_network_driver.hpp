#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>

#include "internal/network/network_driver.hpp"

namespace relay::network {

/*
  In-process driver for tests and for hosts without a container runtime.
*/
class MemoryNetworkDriver final : public NetworkDriver {
 public:
  void                       CreateNetwork(const NetworkSpec& spec) override;
  std::optional<std::string> InspectSubnet(const std::string& network) override;
  AttachOutcome              ConnectContainer(const std::string& network, const std::string& container, const std::string& address) override;
  void                       DisconnectContainer(const std::string& network, const std::string& container) override;
  void                       RemoveNetwork(const std::string& network) override;

  // Marks an address as taken by some other endpoint. May precede CreateNetwork.
  void ReserveAddress(const std::string& network, const std::string& address);

  // Makes InspectSubnet report a subnet other than the one requested.
  void OverrideSubnet(const std::string& network, const std::string& subnet);

  bool                       HasNetwork(const std::string& network) const;
  std::optional<std::string> AddressOf(const std::string& network, const std::string& container) const;

 private:
  struct Network {
    std::string                        subnet;
    std::map<std::string, std::string> endpoints;  // container -> address
    std::set<std::string>              reserved;
  };

  mutable std::mutex                 mutex_;
  std::map<std::string, Network>     networks_;  // empty subnet: reserved but not created
  std::map<std::string, std::string> subnet_overrides_;
};

} // namespace relay::network
