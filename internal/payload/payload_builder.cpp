#include "payload_builder.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/hex.hpp"

namespace relay::payload {

using relay::observability::IntField;
using relay::observability::StringField;

PayloadBuilder::PayloadBuilder(std::shared_ptr<const ScriptCatalog> catalog) : catalog_(std::move(catalog)) {
}

void PayloadBuilder::FillDecryption(relay::v1::ExecutionUnit& unit, const crypto::Key& key) {
  auto* d = unit.mutable_decryption();
  d->set_algorithm(crypto::CipherService::kAlgorithm);
  d->set_key(crypto::KeyToHex(key));
  d->set_instructions(kDecryptionInstruction);
}

// ------------------------------------------------------------------
// Script units
// ------------------------------------------------------------------

relay::v1::ExecutionUnit PayloadBuilder::Build(const std::string&              primary_script,
                                               const std::vector<std::string>& arguments,
                                               const crypto::Key&              key,
                                               const std::vector<std::string>& helper_scripts) const {
  const auto source    = catalog_->Load(primary_script);
  const auto encrypted = cipher_.Encrypt(source, key);

  relay::v1::ExecutionUnit unit;
  unit.set_success(true);
  unit.set_encrypted(true);
  unit.set_type("python");
  unit.set_encrypted_script(util::ToHex(encrypted.ciphertext));
  unit.set_iv(util::ToHex(encrypted.nonce));
  unit.set_auth_tag(util::ToHex(encrypted.tag));
  unit.set_script_name(primary_script);
  for (const auto& a : arguments) unit.add_arguments(a);
  FillDecryption(unit, key);
  unit.set_instruction(kScriptInstruction);

  if (helper_scripts.empty()) return unit;

  for (const auto& name : helper_scripts) {
    std::string helper_source;
    try {
      helper_source = catalog_->Load(name);
    } catch (const std::exception& e) {
      RELAY_LOG_WARN("failed to bundle helper script", {StringField("helper", name), StringField("error", e.what())});
      continue;
    }

    const auto part   = cipher_.Encrypt(helper_source, key);
    auto*      helper = unit.add_helper_scripts();
    helper->set_name(name);
    helper->set_encrypted_content(util::ToHex(part.ciphertext));
    helper->set_iv(util::ToHex(part.nonce));
    helper->set_auth_tag(util::ToHex(part.tag));
  }

  RELAY_LOG_DEBUG("bundled helper scripts",
                  {StringField("script", primary_script), IntField("helpers", unit.helper_scripts_size())});
  return unit;
}

// ------------------------------------------------------------------
// Command units
// ------------------------------------------------------------------

relay::v1::ExecutionUnit PayloadBuilder::BuildCommand(const std::string& command, const crypto::Key& key) const {
  const auto encrypted = cipher_.Encrypt(command, key);

  relay::v1::ExecutionUnit unit;
  unit.set_success(true);
  unit.set_encrypted(true);
  unit.set_type("powershell");
  unit.set_encrypted_command(util::ToHex(encrypted.ciphertext));
  unit.set_iv(util::ToHex(encrypted.nonce));
  unit.set_auth_tag(util::ToHex(encrypted.tag));
  FillDecryption(unit, key);
  unit.set_instruction(kCommandInstruction);
  return unit;
}

relay::v1::ExecutionUnit PayloadBuilder::BuildInvocation(const ToolInvocation& invocation, const crypto::Key& key) const {
  if (invocation.kind == ToolInvocation::Kind::kCommand) {
    return BuildCommand(invocation.command, key);
  }

  auto unit = Build(invocation.script, invocation.arguments, key, invocation.helpers);
  for (const auto& [name, value] : invocation.environment) {
    (*unit.mutable_environment())[name] = value;
  }
  return unit;
}

} // namespace relay::payload
