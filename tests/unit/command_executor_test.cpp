#include <assert.h>

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "internal/executor/command_executor.hpp"
#include "internal/payload/payload_builder.hpp"
#include "internal/payload/script_catalog.hpp"
#include "internal/util/errors.hpp"

namespace {

using relay::executor::CommandExecutor;
using relay::util::ProcessOptions;
using relay::util::ProcessResult;

// Records each invocation and snapshots the scratch directory while the
// child would be running.
struct FakeRunner {
  struct Call {
    std::vector<std::string>           argv;
    ProcessOptions                     options;
    std::map<std::string, std::string> files;
  };

  std::vector<Call> calls;
  ProcessResult     next;

  relay::executor::ProcessRunner Bind() {
    return [this](const std::vector<std::string>& argv, const ProcessOptions& options) {
      Call call{argv, options, {}};
      if (!options.working_dir.empty()) {
        for (const auto& entry : std::filesystem::directory_iterator(options.working_dir)) {
          std::ifstream     in(entry.path(), std::ios::binary);
          std::stringstream ss;
          ss << in.rdbuf();
          call.files[entry.path().filename().string()] = ss.str();
        }
      }
      calls.push_back(std::move(call));
      return next;
    };
  }
};

std::shared_ptr<relay::payload::ScriptCatalog> Catalog() {
  static const auto dir = [] {
    const auto d = std::filesystem::temp_directory_path() / "relay_command_executor_tests";
    std::filesystem::remove_all(d);
    std::filesystem::create_directories(d);
    std::ofstream(d / "mouse-move.py") << "import screen_utils\r\nprint('ok')\r\n";
    std::ofstream(d / "screen_utils.py") << "def grab():\n    return None\n";
    return d;
  }();
  return std::make_shared<relay::payload::ScriptCatalog>(dir);
}

google::protobuf::Value ToValue(const relay::v1::ExecutionUnit& unit) {
  std::string json;
  assert(google::protobuf::util::MessageToJsonString(unit, &json).ok());
  google::protobuf::Value out;
  assert(google::protobuf::util::JsonStringToMessage(json, &out).ok());
  return out;
}

google::protobuf::Value Args(const std::string& json) {
  google::protobuf::Value out;
  assert(google::protobuf::util::JsonStringToMessage(json, &out).ok());
  return out;
}

const google::protobuf::Value& Field(const google::protobuf::Value& v, const std::string& name) {
  return v.struct_value().fields().at(name);
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestScriptRunWritesFilesAndMergesJson() {
  relay::payload::PayloadBuilder builder(Catalog());
  relay::payload::ToolInvocation inv;
  inv.script                       = "mouse-move.py";
  inv.arguments                    = {"--x", "5", "--json"};
  inv.helpers                      = {"screen_utils.py"};
  inv.environment["TERMINAL_PORT"] = "8765";
  const auto unit                  = builder.BuildInvocation(inv, relay::crypto::GenerateKey());

  FakeRunner runner;
  runner.next.exit_code   = 0;
  runner.next.stdout_data = "{\"moved\": true, \"x\": 5}\n";

  CommandExecutor executor({}, runner.Bind());
  const auto      result = executor.Execute("script.run", ToValue(unit));

  assert(runner.calls.size() == 1);
  const auto& call = runner.calls[0];
  assert(call.argv.size() == 5);
  assert(call.argv[0] == "python3");
  assert(std::filesystem::path(call.argv[1]).filename() == "mouse-move.py");
  assert(call.argv[2] == "--x" && call.argv[4] == "--json");
  assert(call.options.environment.size() == 1);
  assert(call.options.environment[0].first == "TERMINAL_PORT");
  assert(call.files.at("mouse-move.py") == "import screen_utils\nprint('ok')\n");
  assert(call.files.at("screen_utils.py").find("def grab") == 0);

  // Scratch files do not outlive the run.
  assert(!std::filesystem::exists(call.options.working_dir));

  assert(Field(result, "success").bool_value());
  assert(Field(result, "moved").bool_value());
  assert(Field(result, "x").number_value() == 5);
}

void TestScriptFailureIsAResult() {
  relay::payload::PayloadBuilder builder(Catalog());
  const auto                     unit = builder.Build("mouse-move.py", {}, relay::crypto::GenerateKey());

  FakeRunner runner;
  runner.next.exit_code   = 1;
  runner.next.stdout_data = "partial\n";
  runner.next.stderr_data = "Traceback: boom\n";

  CommandExecutor executor({}, runner.Bind());
  const auto      result = executor.Execute("script.run", ToValue(unit));
  assert(!Field(result, "success").bool_value());
  assert(Field(result, "error").string_value() == "Traceback: boom");
  assert(Field(result, "output").string_value() == "partial");

  runner.next.exit_code   = 0;
  runner.next.stderr_data = "";
  runner.next.stdout_data = "plain text\n";
  const auto plain        = executor.Execute("script.run", ToValue(unit));
  assert(Field(plain, "success").bool_value());
  assert(Field(plain, "output").string_value() == "plain text");
}

void TestTamperedUnitNeverRuns() {
  relay::payload::PayloadBuilder builder(Catalog());
  auto unit = builder.Build("mouse-move.py", {}, relay::crypto::GenerateKey(), {"screen_utils.py"});

  FakeRunner      runner;
  CommandExecutor executor({}, runner.Bind());

  auto bad_helper = unit;
  auto tag        = bad_helper.helper_scripts(0).auth_tag();
  tag[0]          = tag[0] == '0' ? '1' : '0';
  bad_helper.mutable_helper_scripts(0)->set_auth_tag(tag);
  assert(Throws<relay::util::DecryptionError>([&] { executor.Execute("script.run", ToValue(bad_helper)); }));

  auto wrong_key = unit;
  wrong_key.mutable_decryption()->set_key(relay::crypto::KeyToHex(relay::crypto::GenerateKey()));
  assert(Throws<relay::util::DecryptionError>([&] { executor.Execute("script.run", ToValue(wrong_key)); }));

  auto traversal = unit;
  traversal.set_script_name("../evil.py");
  assert(Throws<relay::util::InvalidArgument>([&] { executor.Execute("script.run", ToValue(traversal)); }));

  assert(runner.calls.empty());
}

void TestShellExec() {
  relay::payload::PayloadBuilder builder(Catalog());
  const auto                     unit = builder.BuildCommand("Get-Date", relay::crypto::GenerateKey());

  FakeRunner runner;
  runner.next.exit_code   = 0;
  runner.next.stdout_data = "Monday\r\n";

  relay::executor::ExecutorOptions options;
  options.powershell = "pwsh";
  CommandExecutor executor(options, runner.Bind());

  const auto result = executor.Execute("shell.exec", ToValue(unit));
  assert(runner.calls[0].argv == (std::vector<std::string>{"pwsh", "-Command", "Get-Date"}));
  assert(Field(result, "success").bool_value());
  assert(Field(result, "output").string_value() == "Monday");
  assert(Field(result, "error").kind_case() == google::protobuf::Value::kNullValue);

  // A script unit is not a shell command.
  const auto script = builder.Build("mouse-move.py", {}, relay::crypto::GenerateKey());
  assert(Throws<relay::util::InvalidArgument>([&] { executor.Execute("shell.exec", ToValue(script)); }));
}

void TestContainerCommands() {
  FakeRunner      runner;
  CommandExecutor executor({}, runner.Bind());

  runner.next.exit_code   = 0;
  runner.next.stdout_data = "{\"ID\":\"c1\",\"Names\":\"web\"}\n\n{\"ID\":\"c2\",\"Names\":\"db\"}\n";
  const auto list         = executor.Execute("container.list", Args("{}"));
  assert(list.list_value().values_size() == 2);
  assert(Field(list.list_value().values(1), "ID").string_value() == "c2");

  runner.next.stdout_data = "3f2a\n";
  const auto created      = executor.Execute("container.create", Args(R"({"image":"alpine","name":"w","env":{"A":"1"}})"));
  assert(Field(created, "containerId").string_value() == "3f2a");
  assert(runner.calls.back().argv ==
         (std::vector<std::string>{"docker", "create", "--name", "w", "-e", "A=1", "alpine"}));

  runner.next.stdout_data = "";
  executor.Execute("container.remove", Args(R"({"containerId":"3f2a"})"));
  assert(runner.calls.back().argv == (std::vector<std::string>{"docker", "rm", "3f2a"}));

  runner.next.exit_code   = 2;
  runner.next.stdout_data = "out";
  runner.next.stderr_data = "err";
  const auto exec         = executor.Execute("container.exec", Args(R"({"containerId":"c1","command":"ls"})"));
  assert(Field(exec, "exitCode").number_value() == 2);
  assert(runner.calls.back().argv == (std::vector<std::string>{"docker", "exec", "c1", "sh", "-c", "ls"}));

  runner.next.exit_code   = 0;
  runner.next.stdout_data = "[{\"Id\":\"c1\",\"State\":{\"Running\":true}}]";
  const auto inspect      = executor.Execute("container.inspect", Args(R"({"containerId":"c1"})"));
  assert(Field(inspect, "Id").string_value() == "c1");

  runner.next.stdout_data = "line\n";
  runner.next.stderr_data = "";
  (void)executor.Execute("container.logs", Args(R"({"containerId":"c1","tail":20})"));
  assert(runner.calls.back().argv == (std::vector<std::string>{"docker", "logs", "--tail", "20", "c1"}));

  const auto calls_before = runner.calls.size();
  for (const double tail : {std::nan(""), -1.0, 1e300, 2.5}) {
    auto bad = Args(R"({"containerId":"c1"})");
    (*bad.mutable_struct_value()->mutable_fields())["tail"].set_number_value(tail);
    assert(Throws<relay::util::InvalidArgument>([&] { executor.Execute("container.logs", bad); }));
  }
  assert(runner.calls.size() == calls_before);

  assert(Throws<relay::util::InvalidArgument>([&] { executor.Execute("container.logs", Args("{}")); }));
  assert(Throws<relay::util::InvalidArgument>([&] { executor.Execute("screen.capture", Args("{}")); }));
}

} // namespace

int main() {
  TestScriptRunWritesFilesAndMergesJson();
  TestScriptFailureIsAResult();
  TestTamperedUnitNeverRuns();
  TestShellExec();
  TestContainerCommands();

  std::cout << "relay_unit_command_executor: pass\n";
  return 0;
}
