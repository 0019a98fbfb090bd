#pragma once

#include <map>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "relay/v1.hpp"

namespace relay::payload {

// What a tool call turns into before encryption.
struct ToolInvocation {
  enum class Kind {
    kScript,
    kCommand,
  };

  Kind                               kind = Kind::kScript;
  std::string                        script;
  std::vector<std::string>           arguments;
  std::vector<std::string>           helpers;
  std::string                        command;
  std::map<std::string, std::string> environment;
};

/*
  Maps a tool name and its JSON arguments to a script invocation.

  Unknown or empty tool names and missing required arguments raise
  util::InvalidArgument.
*/
class ToolRegistry {
 public:
  static constexpr const char* kArchitecture = "Encrypted Code-as-a-Service";
  static constexpr const char* kEncryption   = "AES-256-GCM per-project keys";

  relay::v1::ListToolsResponse Describe() const;

  ToolInvocation Resolve(const std::string& tool, const google::protobuf::Struct& arguments) const;
};

// Integral numbers print without a fractional part.
std::string FormatArgument(const google::protobuf::Value& value);

} // namespace relay::payload
