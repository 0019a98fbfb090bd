#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/crypto/cipher_service.hpp"
#include "internal/payload/script_catalog.hpp"
#include "internal/payload/tool_registry.hpp"
#include "relay/v1.hpp"

namespace relay::payload {

/*
  Builds encrypted execution units.

  Every part (primary script, each helper, a raw command) gets its own
  nonce and tag under the same tenant key. The unit carries the key and
  algorithm so the executor needs no side channel.

  A primary script that fails to load fails the build. A helper that
  fails to load is logged and left out.
*/
class PayloadBuilder {
 public:
  static constexpr const char* kScriptInstruction     = "Decrypt and execute this Python script with the provided arguments";
  static constexpr const char* kCommandInstruction    = "Decrypt and execute this PowerShell command";
  static constexpr const char* kDecryptionInstruction = "Decrypt using AES-256-GCM with provided key, IV, and auth tag";

  explicit PayloadBuilder(std::shared_ptr<const ScriptCatalog> catalog);

  relay::v1::ExecutionUnit Build(const std::string&              primary_script,
                                 const std::vector<std::string>& arguments,
                                 const crypto::Key&              key,
                                 const std::vector<std::string>& helper_scripts = {}) const;

  relay::v1::ExecutionUnit BuildCommand(const std::string& command, const crypto::Key& key) const;

  relay::v1::ExecutionUnit BuildInvocation(const ToolInvocation& invocation, const crypto::Key& key) const;

 private:
  static void FillDecryption(relay::v1::ExecutionUnit& unit, const crypto::Key& key);

  std::shared_ptr<const ScriptCatalog> catalog_;
  crypto::CipherService                cipher_;
};

} // namespace relay::payload
