#pragma once

#include <map>
#include <optional>
#include <string>

namespace relay::network {

struct NetworkSpec {
  std::string                        name;
  std::string                        subnet_cidr;
  std::string                        gateway;
  std::map<std::string, std::string> labels;
};

enum class AttachOutcome {
  kAttached,
  kAlreadyAttached,
  kAddressInUse,
};

/*
  Container-network backend.

  Failures other than the outcomes modelled here throw std::runtime_error.
  CreateNetwork tolerates an existing network of the same name; the
  caller verifies its subnet through InspectSubnet.
*/
class NetworkDriver {
 public:
  virtual ~NetworkDriver() = default;

  virtual void CreateNetwork(const NetworkSpec& spec) = 0;

  // nullopt when the network does not exist.
  virtual std::optional<std::string> InspectSubnet(const std::string& network) = 0;

  virtual AttachOutcome ConnectContainer(const std::string& network, const std::string& container, const std::string& address) = 0;

  // Detaching a container that is not attached is not an error.
  virtual void DisconnectContainer(const std::string& network, const std::string& container) = 0;

  // Removing a missing network is not an error.
  virtual void RemoveNetwork(const std::string& network) = 0;
};

} // namespace relay::network
