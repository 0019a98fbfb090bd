#include "tool_registry.hpp"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <utility>

#include "internal/util/errors.hpp"

namespace relay::payload {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

const std::vector<std::pair<const char*, const char*>>& Catalog() {
  static const std::vector<std::pair<const char*, const char*>> tools = {
      {"execute_powershell", "Execute PowerShell command (encrypted)"},
      {"take_screenshot", "Capture screen with OCR analysis (encrypted)"},
      {"get_ui_elements", "Get all UI elements including taskbar icons using UI Automation (encrypted)"},
      {"move_mouse", "Move mouse cursor (encrypted)"},
      {"click_mouse", "Click mouse button (encrypted)"},
      {"get_mouse_position", "Get current mouse position (encrypted)"},
      {"type_text", "Type text via keyboard (encrypted)"},
      {"press_key", "Press keyboard key (encrypted)"},
      {"scroll_mouse", "Scroll mouse wheel (encrypted)"},
      {"find_text_on_screen", "Find text using OCR (encrypted)"},
      {"send_to_terminal", "Send command to PowerShell terminal via WebSocket (encrypted)"},
  };
  return tools;
}

const Value* Find(const Struct& args, const std::string& key) {
  auto it = args.fields().find(key);
  if (it == args.fields().end() || it->second.kind_case() == Value::kNullValue) {
    return nullptr;
  }
  return &it->second;
}

std::string Required(const std::string& tool, const Struct& args, const std::string& key) {
  const auto* v = Find(args, key);
  if (!v) {
    throw util::InvalidArgument(tool + ": missing argument '" + key + "'");
  }
  return FormatArgument(*v);
}

std::string Optional(const Struct& args, const std::string& key, std::string fallback) {
  const auto* v = Find(args, key);
  return v ? FormatArgument(*v) : std::move(fallback);
}

bool Truthy(const Value& v) {
  switch (v.kind_case()) {
    case Value::kBoolValue:
      return v.bool_value();
    case Value::kNumberValue:
      return v.number_value() != 0;
    case Value::kStringValue:
      return !v.string_value().empty();
    case Value::kStructValue:
    case Value::kListValue:
      return true;
    case Value::kNullValue:
    case Value::KIND_NOT_SET:
      return false;
  }
  return false;
}

ToolInvocation Script(std::string name, std::vector<std::string> args) {
  ToolInvocation inv;
  inv.kind      = ToolInvocation::Kind::kScript;
  inv.script    = std::move(name);
  inv.arguments = std::move(args);
  return inv;
}

} // namespace

std::string FormatArgument(const Value& value) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      return value.string_value();
    case Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    case Value::kNumberValue: {
      const double d = value.number_value();
      if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e15) {
        return std::to_string(static_cast<int64_t>(d));
      }
      std::ostringstream out;
      out << std::setprecision(15) << d;
      return out.str();
    }
    case Value::kNullValue:
    case Value::kStructValue:
    case Value::kListValue:
    case Value::KIND_NOT_SET:
      break;
  }
  throw util::InvalidArgument("argument must be a string, number or boolean");
}

relay::v1::ListToolsResponse ToolRegistry::Describe() const {
  relay::v1::ListToolsResponse resp;
  resp.set_success(true);
  resp.set_architecture(kArchitecture);
  resp.set_encryption(kEncryption);
  for (const auto& [name, description] : Catalog()) {
    auto* t = resp.add_tools();
    t->set_name(name);
    t->set_description(description);
  }
  return resp;
}

ToolInvocation ToolRegistry::Resolve(const std::string& tool, const Struct& args) const {
  if (tool.empty()) {
    throw util::InvalidArgument("Tool name required");
  }

  if (tool == "execute_powershell") {
    ToolInvocation inv;
    inv.kind    = ToolInvocation::Kind::kCommand;
    inv.command = Required(tool, args, "command");
    return inv;
  }

  if (tool == "take_screenshot") {
    return Script("screenshot.py", {"--json"});
  }

  if (tool == "get_ui_elements") {
    return Script("get_ui_elements.py", {});
  }

  if (tool == "move_mouse") {
    return Script("mouse-move.py", {"--x", Required(tool, args, "x"), "--y", Required(tool, args, "y"), "--json"});
  }

  if (tool == "click_mouse") {
    auto inv = Script("mouse-click.py", {"--x", Required(tool, args, "x"), "--y", Required(tool, args, "y"), "--button",
                                         Optional(args, "button", "left"), "--json"});
    const auto* dbl = Find(args, "double");
    if (dbl && Truthy(*dbl)) inv.arguments.push_back("--double");
    return inv;
  }

  if (tool == "get_mouse_position") {
    return Script("mouse-position.py", {"--json"});
  }

  if (tool == "type_text") {
    return Script("keyboard-type.py", {Required(tool, args, "text"), "--interval", Optional(args, "interval", "0.05"), "--json"});
  }

  if (tool == "press_key") {
    return Script("keyboard-press.py", {Required(tool, args, "key"), "--json"});
  }

  if (tool == "scroll_mouse") {
    auto inv = Script("mouse-scroll.py", {Required(tool, args, "direction"), "--clicks", Optional(args, "clicks", "3"), "--json"});
    const auto* x = Find(args, "x");
    const auto* y = Find(args, "y");
    if (x && y) {
      inv.arguments.insert(inv.arguments.end(), {"--x", FormatArgument(*x), "--y", FormatArgument(*y)});
    }
    return inv;
  }

  if (tool == "find_text_on_screen") {
    auto        inv     = Script("ocr_detector.py", {Required(tool, args, "text"), "--json"});
    const auto* partial = Find(args, "partial_match");
    const bool  exact   = partial && partial->kind_case() == Value::kBoolValue && !partial->bool_value();
    if (!exact) inv.arguments.push_back("--partial");
    return inv;
  }

  if (tool == "send_to_terminal") {
    auto inv = Script("send-to-terminal.py", {"--command", Required(tool, args, "command"), "--json"});
    if (const auto* port = Find(args, "terminal_port")) {
      inv.environment["TERMINAL_PORT"] = FormatArgument(*port);
    }
    return inv;
  }

  throw util::InvalidArgument("Unknown tool: " + tool);
}

} // namespace relay::payload
