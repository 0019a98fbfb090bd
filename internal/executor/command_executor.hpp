#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "internal/crypto/cipher_service.hpp"
#include "internal/util/subprocess.hpp"
#include "relay/v1.hpp"

namespace relay::executor {

using ProcessRunner = std::function<util::ProcessResult(const std::vector<std::string>&, const util::ProcessOptions&)>;

struct ExecutorOptions {
  std::string python     = "python3";
  std::string powershell = "powershell";
  std::string docker     = "docker";

  std::chrono::milliseconds script_timeout{60000};
  std::chrono::milliseconds shell_timeout{30000};
};

/*
  Agent-side handler for relay commands.

  CRITICAL GUARANTEES:
    - Nothing is written to disk or executed unless every ciphertext
      in the unit (primary and helpers) authenticates.
    - Execute() throws on failure; the message is what the agent
      reports back as a CommandError.
    - A script that runs but exits non-zero is a normal result with
      success=false, not an error.
*/
class CommandExecutor {
 public:
  explicit CommandExecutor(ExecutorOptions options = {}, ProcessRunner runner = util::RunProcess);

  google::protobuf::Value Execute(const std::string& type, const google::protobuf::Value& payload) const;

  // Payload (canonical JSON shape) back into a unit.
  static relay::v1::ExecutionUnit UnitFromValue(const google::protobuf::Value& payload);

 private:
  google::protobuf::Value RunScript(const relay::v1::ExecutionUnit& unit) const;
  google::protobuf::Value RunShell(const relay::v1::ExecutionUnit& unit) const;

  google::protobuf::Value ContainerCreate(const google::protobuf::Struct& args) const;
  google::protobuf::Value ContainerLifecycle(const std::string& verb, const google::protobuf::Struct& args) const;
  google::protobuf::Value ContainerList() const;
  google::protobuf::Value ContainerExec(const google::protobuf::Struct& args) const;
  google::protobuf::Value ContainerLogs(const google::protobuf::Struct& args) const;
  google::protobuf::Value ContainerInspect(const google::protobuf::Struct& args) const;

  ExecutorOptions       options_;
  ProcessRunner         runner_;
  crypto::CipherService cipher_;
};

} // namespace relay::executor
