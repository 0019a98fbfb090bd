#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace relay::util {

struct ProcessOptions {
  // Added to the inherited environment.
  std::vector<std::pair<std::string, std::string>> environment;
  std::string                                      working_dir;

  // Zero waits forever. On expiry the child is killed and timed_out is set.
  std::chrono::milliseconds timeout{0};
};

struct ProcessResult {
  int         exit_code = -1;
  bool        timed_out = false;
  std::string stdout_data;
  std::string stderr_data;

  bool Ok() const {
    return exit_code == 0 && !timed_out;
  }
};

/*
  fork/exec argv[0] (PATH lookup) and collect both output streams.

  Throws std::runtime_error when the child cannot be spawned at all.
  An exec failure inside the child is reported as exit code 127.
*/
ProcessResult RunProcess(const std::vector<std::string>& argv, const ProcessOptions& options = {});

} // namespace relay::util
