#pragma once

#include <string>
#include <vector>

#include "internal/network/network_driver.hpp"
#include "internal/util/subprocess.hpp"

namespace relay::network {

// Drives `docker network ...` through the CLI.
class DockerCliDriver final : public NetworkDriver {
 public:
  explicit DockerCliDriver(std::string docker_binary = "docker");

  void                       CreateNetwork(const NetworkSpec& spec) override;
  std::optional<std::string> InspectSubnet(const std::string& network) override;
  AttachOutcome              ConnectContainer(const std::string& network, const std::string& container, const std::string& address) override;
  void                       DisconnectContainer(const std::string& network, const std::string& container) override;
  void                       RemoveNetwork(const std::string& network) override;

 private:
  util::ProcessResult Docker(std::vector<std::string> args) const;

  std::string binary_;
};

} // namespace relay::network
