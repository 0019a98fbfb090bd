#include "script_catalog.hpp"

#include <fstream>
#include <sstream>

#include "internal/util/errors.hpp"

namespace relay::payload {

ScriptCatalog::ScriptCatalog(std::filesystem::path root) : root_(std::move(root)) {
}

std::string ScriptCatalog::Load(const std::string& name) const {
  if (name.empty() || name.find('/') != std::string::npos || name.find('\\') != std::string::npos ||
      name.find("..") != std::string::npos) {
    throw util::InvalidArgument("invalid script name: " + name);
  }

  const auto    path = root_ / name;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::NotFound("Failed to read script " + name);
  }

  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

} // namespace relay::payload
