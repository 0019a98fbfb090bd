#include "docker_cli_driver.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace relay::network {

using relay::observability::StringField;

namespace {

constexpr std::chrono::seconds kDockerTimeout{30};

bool Mentions(const util::ProcessResult& r, const char* needle) {
  return r.stderr_data.find(needle) != std::string::npos || r.stdout_data.find(needle) != std::string::npos;
}

std::string Trim(std::string s) {
  const auto first = s.find_first_not_of(" \t\r\n'");
  if (first == std::string::npos) return {};
  const auto last = s.find_last_not_of(" \t\r\n'");
  return s.substr(first, last - first + 1);
}

[[noreturn]] void Fail(const std::string& what, const util::ProcessResult& r) {
  if (r.timed_out) throw std::runtime_error(what + ": docker timed out");
  throw std::runtime_error(what + ": " + Trim(r.stderr_data));
}

} // namespace

DockerCliDriver::DockerCliDriver(std::string docker_binary) : binary_(std::move(docker_binary)) {
}

util::ProcessResult DockerCliDriver::Docker(std::vector<std::string> args) const {
  args.insert(args.begin(), binary_);
  util::ProcessOptions options;
  options.timeout = kDockerTimeout;
  return util::RunProcess(args, options);
}

void DockerCliDriver::CreateNetwork(const NetworkSpec& spec) {
  std::vector<std::string> args = {"network", "create", "--driver", "bridge", "--subnet", spec.subnet_cidr, "--gateway", spec.gateway,
                                   "--opt", "com.docker.network.bridge.enable_icc=true"};
  for (const auto& [key, value] : spec.labels) {
    args.push_back("--label");
    args.push_back(key + "=" + value);
  }
  args.push_back(spec.name);

  const auto r = Docker(std::move(args));
  if (r.Ok()) return;
  if (Mentions(r, "already exists")) {
    RELAY_LOG_INFO("using existing network", {StringField("network", spec.name)});
    return;
  }
  Fail("docker network create " + spec.name, r);
}

std::optional<std::string> DockerCliDriver::InspectSubnet(const std::string& network) {
  const auto r = Docker({"network", "inspect", "--format", "{{range .IPAM.Config}}{{.Subnet}}{{end}}", network});
  if (!r.Ok()) {
    if (Mentions(r, "No such network") || Mentions(r, "not found")) return std::nullopt;
    Fail("docker network inspect " + network, r);
  }
  return Trim(r.stdout_data);
}

AttachOutcome DockerCliDriver::ConnectContainer(const std::string& network, const std::string& container, const std::string& address) {
  const auto r = Docker({"network", "connect", "--ip", address, network, container});
  if (r.Ok()) return AttachOutcome::kAttached;
  if (Mentions(r, "Address already in use")) return AttachOutcome::kAddressInUse;
  if (Mentions(r, "already exists in network") || Mentions(r, "already attached")) return AttachOutcome::kAlreadyAttached;
  Fail("docker network connect " + network, r);
}

void DockerCliDriver::DisconnectContainer(const std::string& network, const std::string& container) {
  const auto r = Docker({"network", "disconnect", "--force", network, container});
  if (r.Ok() || Mentions(r, "is not connected") || Mentions(r, "No such network")) return;
  Fail("docker network disconnect " + network, r);
}

void DockerCliDriver::RemoveNetwork(const std::string& network) {
  const auto r = Docker({"network", "rm", network});
  if (r.Ok() || Mentions(r, "No such network") || Mentions(r, "not found")) return;
  Fail("docker network rm " + network, r);
}

} // namespace relay::network
