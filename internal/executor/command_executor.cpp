#include "internal/executor/command_executor.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relay::executor {

using relay::observability::IntField;
using relay::observability::StringField;

namespace {

constexpr int64_t kMaxLogTail = 100000;

struct DecryptedFile {
  std::string name;
  std::string content;
};

class ScratchDir {
 public:
  ScratchDir() {
    std::string pattern = (std::filesystem::temp_directory_path() / "relay_script_XXXXXX").string();
    if (::mkdtemp(pattern.data()) == nullptr) {
      throw std::runtime_error("failed to create scratch directory");
    }
    path_ = pattern;
  }

  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
      RELAY_LOG_WARN("scratch cleanup failed", {StringField("path", path_.string()), StringField("error", ec.message())});
    }
  }

  ScratchDir(const ScratchDir&)            = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

void ValidateFileName(const std::string& name) {
  if (name.empty() || name.find('/') != std::string::npos || name.find('\\') != std::string::npos || name.find("..") != std::string::npos) {
    throw util::InvalidArgument("invalid script name: " + name);
  }
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("failed to write " + path.string());
  out << content;
}

// CRLF and lone CR become LF.
std::string NormalizeLineEndings(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r') {
      out.push_back('\n');
      if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
    } else {
      out.push_back(text[i]);
    }
  }
  return out;
}

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

google::protobuf::Value StringValue(const std::string& s) {
  google::protobuf::Value v;
  v.set_string_value(s);
  return v;
}

google::protobuf::Value BoolValue(bool b) {
  google::protobuf::Value v;
  v.set_bool_value(b);
  return v;
}

std::string RequireString(const google::protobuf::Struct& args, const std::string& field) {
  auto it = args.fields().find(field);
  if (it == args.fields().end() || it->second.string_value().empty()) {
    throw util::InvalidArgument("missing field '" + field + "'");
  }
  return it->second.string_value();
}

bool ParseJson(const std::string& text, google::protobuf::Value* out) {
  return google::protobuf::util::JsonStringToMessage(text, out).ok();
}

const google::protobuf::Struct& ArgsOf(const google::protobuf::Value& payload) {
  return payload.struct_value();
}

} // namespace

CommandExecutor::CommandExecutor(ExecutorOptions options, ProcessRunner runner)
    : options_(std::move(options)), runner_(std::move(runner)) {}

relay::v1::ExecutionUnit CommandExecutor::UnitFromValue(const google::protobuf::Value& payload) {
  if (payload.kind_case() != google::protobuf::Value::kStructValue) {
    throw util::InvalidArgument("execution unit payload must be an object");
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(payload, &json);
  if (!status.ok()) {
    throw util::InvalidArgument("unreadable execution unit: " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  relay::v1::ExecutionUnit unit;
  status = google::protobuf::util::JsonStringToMessage(json, &unit, options);
  if (!status.ok()) {
    throw util::InvalidArgument("invalid execution unit: " + std::string(status.message()));
  }
  return unit;
}

google::protobuf::Value CommandExecutor::Execute(const std::string& type, const google::protobuf::Value& payload) const {
  RELAY_LOG_DEBUG("executing command", {StringField("type", type)});

  if (type == "script.run") return RunScript(UnitFromValue(payload));
  if (type == "shell.exec") return RunShell(UnitFromValue(payload));

  if (type == "container.create") return ContainerCreate(ArgsOf(payload));
  if (type == "container.start") return ContainerLifecycle("start", ArgsOf(payload));
  if (type == "container.stop") return ContainerLifecycle("stop", ArgsOf(payload));
  if (type == "container.remove") return ContainerLifecycle("rm", ArgsOf(payload));
  if (type == "container.list") return ContainerList();
  if (type == "container.exec") return ContainerExec(ArgsOf(payload));
  if (type == "container.logs") return ContainerLogs(ArgsOf(payload));
  if (type == "container.inspect") return ContainerInspect(ArgsOf(payload));

  throw util::InvalidArgument("Unknown command type: " + type);
}

// ---------------------------------------------------------------------
// Encrypted units
// ---------------------------------------------------------------------

google::protobuf::Value CommandExecutor::RunScript(const relay::v1::ExecutionUnit& unit) const {
  if (unit.encrypted_script().empty()) {
    throw util::InvalidArgument("script unit carries no encryptedScript");
  }
  ValidateFileName(unit.script_name());

  const auto key = crypto::KeyFromHex(unit.decryption().key());

  // Decrypt everything up front so a single bad tag stops the whole unit.
  std::vector<DecryptedFile> helpers;
  helpers.reserve(unit.helper_scripts_size());
  for (const auto& helper : unit.helper_scripts()) {
    ValidateFileName(helper.name());
    helpers.push_back({helper.name(), NormalizeLineEndings(cipher_.DecryptHex(helper.encrypted_content(), helper.iv(), helper.auth_tag(), key))});
  }
  const auto script = NormalizeLineEndings(cipher_.DecryptHex(unit.encrypted_script(), unit.iv(), unit.auth_tag(), key));

  ScratchDir dir;
  for (const auto& helper : helpers) {
    WriteFile(dir.path() / helper.name, helper.content);
  }
  const auto script_path = dir.path() / unit.script_name();
  WriteFile(script_path, script);

  std::vector<std::string> argv{options_.python, script_path.string()};
  argv.insert(argv.end(), unit.arguments().begin(), unit.arguments().end());

  util::ProcessOptions process;
  process.working_dir = dir.path().string();
  process.timeout     = options_.script_timeout;
  for (const auto& [name, value] : unit.environment()) {
    process.environment.emplace_back(name, value);
  }

  RELAY_LOG_INFO("running script", {StringField("script", unit.script_name()), IntField("helpers", static_cast<int64_t>(helpers.size()))});
  const auto result = runner_(argv, process);

  google::protobuf::Value out;
  auto*                   fields = out.mutable_struct_value()->mutable_fields();

  if (!result.Ok()) {
    (*fields)["success"] = BoolValue(false);
    (*fields)["error"]   = StringValue(result.timed_out ? "Script timed out" : (Trim(result.stderr_data).empty() ? "Script execution failed" : Trim(result.stderr_data)));
    (*fields)["output"]  = StringValue(Trim(result.stdout_data));
    return out;
  }

  // JSON objects from the script are merged into the result.
  google::protobuf::Value parsed;
  if (ParseJson(result.stdout_data, &parsed) && parsed.kind_case() == google::protobuf::Value::kStructValue) {
    out = parsed;
    (*out.mutable_struct_value()->mutable_fields())["success"] = BoolValue(true);
    return out;
  }

  (*fields)["success"] = BoolValue(true);
  (*fields)["output"]  = StringValue(Trim(result.stdout_data));
  return out;
}

google::protobuf::Value CommandExecutor::RunShell(const relay::v1::ExecutionUnit& unit) const {
  if (unit.encrypted_command().empty()) {
    throw util::InvalidArgument("command unit carries no encryptedCommand");
  }

  const auto key     = crypto::KeyFromHex(unit.decryption().key());
  const auto command = cipher_.DecryptHex(unit.encrypted_command(), unit.iv(), unit.auth_tag(), key);

  util::ProcessOptions process;
  process.timeout = options_.shell_timeout;
  for (const auto& [name, value] : unit.environment()) {
    process.environment.emplace_back(name, value);
  }

  const auto result = runner_({options_.powershell, "-Command", command}, process);

  google::protobuf::Value out;
  auto*                   fields = out.mutable_struct_value()->mutable_fields();
  (*fields)["success"]           = BoolValue(result.Ok());
  (*fields)["output"]            = StringValue(Trim(result.stdout_data));
  if (result.timed_out) {
    (*fields)["error"] = StringValue("Command timed out");
  } else if (!Trim(result.stderr_data).empty()) {
    (*fields)["error"] = StringValue(Trim(result.stderr_data));
  } else {
    (*fields)["error"].set_null_value(google::protobuf::NULL_VALUE);
  }
  return out;
}

// ---------------------------------------------------------------------
// Containers (docker CLI)
// ---------------------------------------------------------------------

// {image, name?, env?: {K: V}, command?} -> {containerId}
google::protobuf::Value CommandExecutor::ContainerCreate(const google::protobuf::Struct& args) const {
  const auto image = RequireString(args, "image");

  std::vector<std::string> argv{options_.docker, "create"};
  auto                     name = args.fields().find("name");
  if (name != args.fields().end() && !name->second.string_value().empty()) {
    argv.insert(argv.end(), {"--name", name->second.string_value()});
  }
  auto env = args.fields().find("env");
  if (env != args.fields().end()) {
    for (const auto& [key, value] : env->second.struct_value().fields()) {
      argv.insert(argv.end(), {"-e", key + "=" + value.string_value()});
    }
  }
  argv.push_back(image);
  auto command = args.fields().find("command");
  if (command != args.fields().end() && !command->second.string_value().empty()) {
    argv.insert(argv.end(), {"sh", "-c", command->second.string_value()});
  }

  const auto result = runner_(argv, util::ProcessOptions{{}, {}, options_.shell_timeout});
  if (!result.Ok()) {
    throw std::runtime_error("docker create failed: " + Trim(result.stderr_data));
  }

  google::protobuf::Value out;
  (*out.mutable_struct_value()->mutable_fields())["containerId"] = StringValue(Trim(result.stdout_data));
  return out;
}

google::protobuf::Value CommandExecutor::ContainerLifecycle(const std::string& verb, const google::protobuf::Struct& args) const {
  const auto container = RequireString(args, "containerId");

  const auto result = runner_({options_.docker, verb, container}, util::ProcessOptions{{}, {}, options_.shell_timeout});
  if (!result.Ok()) {
    throw std::runtime_error("docker " + verb + " failed: " + Trim(result.stderr_data));
  }

  google::protobuf::Value out;
  auto*                   fields = out.mutable_struct_value()->mutable_fields();
  (*fields)["success"]           = BoolValue(true);
  (*fields)["containerId"]       = StringValue(container);
  return out;
}

google::protobuf::Value CommandExecutor::ContainerList() const {
  const auto result = runner_({options_.docker, "ps", "--format", "{{json .}}"}, util::ProcessOptions{{}, {}, options_.shell_timeout});
  if (!result.Ok()) {
    throw std::runtime_error("docker ps failed: " + Trim(result.stderr_data));
  }

  // One JSON object per line.
  google::protobuf::Value out;
  auto*                   list = out.mutable_list_value();

  std::size_t start = 0;
  while (start < result.stdout_data.size()) {
    auto end = result.stdout_data.find('\n', start);
    if (end == std::string::npos) end = result.stdout_data.size();

    const auto line = Trim(result.stdout_data.substr(start, end - start));
    if (!line.empty()) {
      google::protobuf::Value entry;
      if (!ParseJson(line, &entry)) {
        throw std::runtime_error("unexpected docker ps output: " + line);
      }
      *list->add_values() = entry;
    }
    start = end + 1;
  }
  return out;
}

google::protobuf::Value CommandExecutor::ContainerExec(const google::protobuf::Struct& args) const {
  const auto container = RequireString(args, "containerId");
  const auto command   = RequireString(args, "command");

  const auto result = runner_({options_.docker, "exec", container, "sh", "-c", command}, util::ProcessOptions{{}, {}, options_.shell_timeout});

  google::protobuf::Value out;
  auto*                   fields = out.mutable_struct_value()->mutable_fields();
  (*fields)["exitCode"].set_number_value(result.exit_code);
  (*fields)["stdout"] = StringValue(result.stdout_data);
  (*fields)["stderr"] = StringValue(result.stderr_data);
  return out;
}

google::protobuf::Value CommandExecutor::ContainerLogs(const google::protobuf::Struct& args) const {
  const auto container = RequireString(args, "containerId");

  std::string tail = "100";
  auto        it   = args.fields().find("tail");
  if (it != args.fields().end() && it->second.kind_case() == google::protobuf::Value::kNumberValue) {
    const double n = it->second.number_value();
    if (!std::isfinite(n) || n < 0 || n > kMaxLogTail || n != std::floor(n)) {
      throw util::InvalidArgument("tail must be an integer between 0 and " + std::to_string(kMaxLogTail));
    }
    tail = std::to_string(static_cast<int64_t>(n));
  }

  const auto result = runner_({options_.docker, "logs", "--tail", tail, container}, util::ProcessOptions{{}, {}, options_.shell_timeout});
  if (!result.Ok()) {
    throw std::runtime_error("docker logs failed: " + Trim(result.stderr_data));
  }

  // docker writes container stderr to its own stderr.
  return StringValue(result.stdout_data + result.stderr_data);
}

google::protobuf::Value CommandExecutor::ContainerInspect(const google::protobuf::Struct& args) const {
  const auto container = RequireString(args, "containerId");

  const auto result = runner_({options_.docker, "inspect", container}, util::ProcessOptions{{}, {}, options_.shell_timeout});
  if (!result.Ok()) {
    throw std::runtime_error("docker inspect failed: " + Trim(result.stderr_data));
  }

  google::protobuf::Value parsed;
  if (!ParseJson(result.stdout_data, &parsed)) {
    throw std::runtime_error("unexpected docker inspect output");
  }
  if (parsed.kind_case() == google::protobuf::Value::kListValue && parsed.list_value().values_size() > 0) {
    return parsed.list_value().values(0);
  }
  return parsed;
}

} // namespace relay::executor
