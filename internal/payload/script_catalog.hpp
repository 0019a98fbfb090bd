#pragma once

#include <filesystem>
#include <string>

namespace relay::payload {

/*
  Trusted directory of automation scripts.

  Names are bare file names. Anything containing a path separator or
  ".." is rejected before the filesystem is touched.
*/
class ScriptCatalog {
 public:
  explicit ScriptCatalog(std::filesystem::path root);

  // Throws util::InvalidArgument for unsafe names, util::NotFound when
  // the file is missing or unreadable.
  std::string Load(const std::string& name) const;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace relay::payload
