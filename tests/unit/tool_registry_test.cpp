#include <assert.h>

#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "internal/payload/tool_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using relay::payload::ToolInvocation;
using relay::payload::ToolRegistry;

google::protobuf::Struct Args(std::initializer_list<std::pair<std::string, google::protobuf::Value>> fields) {
  google::protobuf::Struct s;
  for (const auto& [k, v] : fields) (*s.mutable_fields())[k] = v;
  return s;
}

google::protobuf::Value Num(double d) {
  google::protobuf::Value v;
  v.set_number_value(d);
  return v;
}

google::protobuf::Value Str(const std::string& s) {
  google::protobuf::Value v;
  v.set_string_value(s);
  return v;
}

google::protobuf::Value Bool(bool b) {
  google::protobuf::Value v;
  v.set_bool_value(b);
  return v;
}

std::string InvalidArgumentMessage(const ToolRegistry& tools, const std::string& tool, const google::protobuf::Struct& args) {
  try {
    (void)tools.Resolve(tool, args);
  } catch (const relay::util::InvalidArgument& e) {
    return e.what();
  }
  return {};
}

void TestDescribeListsEveryTool() {
  ToolRegistry tools;
  const auto   listing = tools.Describe();

  assert(listing.success());
  assert(listing.architecture() == "Encrypted Code-as-a-Service");
  assert(listing.encryption() == "AES-256-GCM per-project keys");
  assert(listing.tools_size() == 11);

  std::set<std::string> names;
  for (const auto& t : listing.tools()) {
    assert(!t.description().empty());
    names.insert(t.name());
  }
  assert(names.count("execute_powershell") == 1);
  assert(names.count("send_to_terminal") == 1);
}

void TestPowershellBecomesCommand() {
  ToolRegistry tools;
  const auto   inv = tools.Resolve("execute_powershell", Args({{"command", Str("Get-Date")}}));
  assert(inv.kind == ToolInvocation::Kind::kCommand);
  assert(inv.command == "Get-Date");
}

void TestMoveMouseFormatsIntegers() {
  ToolRegistry tools;
  const auto   inv = tools.Resolve("move_mouse", Args({{"x", Num(100)}, {"y", Num(200)}}));
  assert(inv.kind == ToolInvocation::Kind::kScript);
  assert(inv.script == "mouse-move.py");
  assert((inv.arguments == std::vector<std::string>{"--x", "100", "--y", "200", "--json"}));
}

void TestDefaultsAndFlags() {
  ToolRegistry tools;

  auto click = tools.Resolve("click_mouse", Args({{"x", Num(1)}, {"y", Num(2)}, {"double", Bool(true)}}));
  assert((click.arguments == std::vector<std::string>{"--x", "1", "--y", "2", "--button", "left", "--json", "--double"}));

  auto typed = tools.Resolve("type_text", Args({{"text", Str("hello")}}));
  assert((typed.arguments == std::vector<std::string>{"hello", "--interval", "0.05", "--json"}));

  auto scroll = tools.Resolve("scroll_mouse", Args({{"direction", Str("down")}}));
  assert((scroll.arguments == std::vector<std::string>{"down", "--clicks", "3", "--json"}));

  auto scroll_at = tools.Resolve("scroll_mouse", Args({{"direction", Str("up")}, {"clicks", Num(5)}, {"x", Num(10)}, {"y", Num(20)}}));
  assert((scroll_at.arguments == std::vector<std::string>{"up", "--clicks", "5", "--json", "--x", "10", "--y", "20"}));
}

void TestFindTextPartialMatch() {
  ToolRegistry tools;

  auto partial = tools.Resolve("find_text_on_screen", Args({{"text", Str("OK")}}));
  assert(partial.script == "ocr_detector.py");
  assert(partial.arguments.back() == "--partial");

  auto exact = tools.Resolve("find_text_on_screen", Args({{"text", Str("OK")}, {"partial_match", Bool(false)}}));
  assert(exact.arguments.back() == "--json");
}

void TestSendToTerminalCarriesPort() {
  ToolRegistry tools;
  auto         inv = tools.Resolve("send_to_terminal", Args({{"command", Str("dir")}, {"terminal_port", Num(8765)}}));
  assert((inv.arguments == std::vector<std::string>{"--command", "dir", "--json"}));
  assert(inv.environment.at("TERMINAL_PORT") == "8765");
}

void TestErrors() {
  ToolRegistry tools;
  assert(InvalidArgumentMessage(tools, "", {}) == "Tool name required");
  assert(InvalidArgumentMessage(tools, "format_disk", {}) == "Unknown tool: format_disk");
  assert(InvalidArgumentMessage(tools, "move_mouse", Args({{"x", Num(1)}})) == "move_mouse: missing argument 'y'");

  google::protobuf::Value nested;
  nested.mutable_struct_value();
  assert(!InvalidArgumentMessage(tools, "press_key", Args({{"key", nested}})).empty());
}

void TestFormatArgument() {
  assert(relay::payload::FormatArgument(Num(3)) == "3");
  assert(relay::payload::FormatArgument(Num(-7)) == "-7");
  assert(relay::payload::FormatArgument(Num(0.25)) == "0.25");
  assert(relay::payload::FormatArgument(Bool(true)) == "true");
  assert(relay::payload::FormatArgument(Str("enter")) == "enter");
}

} // namespace

int main() {
  TestDescribeListsEveryTool();
  TestPowershellBecomesCommand();
  TestMoveMouseFormatsIntegers();
  TestDefaultsAndFlags();
  TestFindTextPartialMatch();
  TestSendToTerminalCarriesPort();
  TestErrors();
  TestFormatArgument();

  std::cout << "relay_unit_tool_registry: pass\n";
  return 0;
}
