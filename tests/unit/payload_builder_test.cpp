#include <assert.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/crypto/cipher_service.hpp"
#include "internal/payload/payload_builder.hpp"
#include "internal/payload/script_catalog.hpp"
#include "internal/payload/tool_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using relay::crypto::CipherService;
using relay::payload::PayloadBuilder;
using relay::payload::ScriptCatalog;

std::filesystem::path MakeCatalog() {
  const auto dir = std::filesystem::temp_directory_path() / "relay_payload_builder_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  std::ofstream(dir / "mouse-move.py") << "import sys\nprint('{\"moved\": true}')\n";
  std::ofstream(dir / "screen_utils.py") << "def grab():\n    return None\n";
  return dir;
}

std::shared_ptr<ScriptCatalog> Catalog() {
  static const auto dir = MakeCatalog();
  return std::make_shared<ScriptCatalog>(dir);
}

void TestScriptUnitIsSelfDescribing() {
  PayloadBuilder builder(Catalog());
  const auto     key = relay::crypto::GenerateKey();

  const auto unit = builder.Build("mouse-move.py", {"--x", "1", "--y", "2", "--json"}, key);

  assert(unit.success());
  assert(unit.encrypted());
  assert(unit.type() == "python");
  assert(unit.script_name() == "mouse-move.py");
  assert(unit.arguments_size() == 5);
  assert(unit.decryption().algorithm() == "aes-256-gcm");
  assert(unit.decryption().key() == relay::crypto::KeyToHex(key));
  assert(unit.decryption().instructions() == PayloadBuilder::kDecryptionInstruction);
  assert(unit.instruction() == PayloadBuilder::kScriptInstruction);
  assert(unit.encrypted_command().empty());

  CipherService cipher;
  const auto    plain = cipher.DecryptHex(unit.encrypted_script(), unit.iv(), unit.auth_tag(), relay::crypto::KeyFromHex(unit.decryption().key()));
  assert(plain.find("moved") != std::string::npos);
}

void TestHelpersAreBundledAndMissingOnesSkipped() {
  PayloadBuilder builder(Catalog());
  const auto     key = relay::crypto::GenerateKey();

  const auto unit = builder.Build("mouse-move.py", {}, key, {"screen_utils.py", "does_not_exist.py"});
  assert(unit.helper_scripts_size() == 1);

  const auto& helper = unit.helper_scripts(0);
  assert(helper.name() == "screen_utils.py");
  assert(helper.iv() != unit.iv());

  CipherService cipher;
  assert(cipher.DecryptHex(helper.encrypted_content(), helper.iv(), helper.auth_tag(), key).find("def grab") == 0);
}

void TestMissingPrimaryFailsTheBuild() {
  PayloadBuilder builder(Catalog());

  bool not_found = false;
  try {
    (void)builder.Build("nope.py", {}, relay::crypto::GenerateKey());
  } catch (const relay::util::NotFound& e) {
    not_found = std::string(e.what()) == "Failed to read script nope.py";
  }
  assert(not_found);

  bool rejected = false;
  try {
    (void)builder.Build("../etc/passwd", {}, relay::crypto::GenerateKey());
  } catch (const relay::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);
}

void TestCommandUnit() {
  PayloadBuilder builder(Catalog());
  const auto     key = relay::crypto::GenerateKey();

  const auto unit = builder.BuildCommand("Get-Process", key);
  assert(unit.type() == "powershell");
  assert(unit.encrypted_script().empty());
  assert(unit.instruction() == PayloadBuilder::kCommandInstruction);

  CipherService cipher;
  assert(cipher.DecryptHex(unit.encrypted_command(), unit.iv(), unit.auth_tag(), key) == "Get-Process");
}

void TestInvocationCarriesEnvironment() {
  PayloadBuilder builder(Catalog());

  relay::payload::ToolInvocation inv;
  inv.script                     = "mouse-move.py";
  inv.arguments                  = {"--json"};
  inv.environment["TERMINAL_PORT"] = "8765";

  const auto unit = builder.BuildInvocation(inv, relay::crypto::GenerateKey());
  assert(unit.environment().at("TERMINAL_PORT") == "8765");
  assert(unit.arguments(0) == "--json");
}

} // namespace

int main() {
  TestScriptUnitIsSelfDescribing();
  TestHelpersAreBundledAndMissingOnesSkipped();
  TestMissingPrimaryFailsTheBuild();
  TestCommandUnit();
  TestInvocationCarriesEnvironment();

  std::cout << "relay_unit_payload_builder: pass\n";
  return 0;
}
