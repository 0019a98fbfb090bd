#include "subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace relay::util {

namespace {

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

bool DrainInto(int fd, std::string& out) {
  char          buf[4096];
  const ssize_t n = ::read(fd, buf, sizeof(buf));
  if (n > 0) {
    out.append(buf, static_cast<size_t>(n));
    return true;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
    return true;
  }
  return false;
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, const ProcessOptions& options) {
  if (argv.empty()) {
    throw std::runtime_error("RunProcess: empty argv");
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0) {
    CloseFd(out_pipe[0]);
    CloseFd(out_pipe[1]);
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int saved = errno;
    CloseFd(out_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[0]);
    CloseFd(err_pipe[1]);
    throw std::runtime_error(std::string("fork failed: ") + std::strerror(saved));
  }

  if (pid == 0) {
    // Child: only async-signal-safe work until exec.
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);

    for (const auto& [key, value] : options.environment) {
      ::setenv(key.c_str(), value.c_str(), 1);
    }
    if (!options.working_dir.empty() && ::chdir(options.working_dir.c_str()) != 0) {
      ::_exit(127);
    }

    std::vector<char*> exec_args;
    exec_args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
      exec_args.push_back(const_cast<char*>(arg.c_str()));
    }
    exec_args.push_back(nullptr);

    ::execvp(exec_args[0], exec_args.data());

    const char msg[] = "exec failed\n";
    (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    ::_exit(127);
  }

  CloseFd(out_pipe[1]);
  CloseFd(err_pipe[1]);

  ProcessResult result;
  const auto    started = std::chrono::steady_clock::now();

  pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
  int    open_streams = 2;

  while (open_streams > 0) {
    int wait_ms = -1;
    if (options.timeout.count() > 0) {
      const auto elapsed   = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
      const auto remaining = options.timeout - elapsed;
      if (remaining.count() <= 0) {
        result.timed_out = true;
        ::kill(pid, SIGKILL);
        break;
      }
      wait_ms = static_cast<int>(remaining.count());
    }

    const int rc = ::poll(fds, 2, wait_ms);
    if (rc < 0) {
      if (errno == EINTR) continue;
      ::kill(pid, SIGKILL);
      break;
    }

    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) continue;
      auto& sink = i == 0 ? result.stdout_data : result.stderr_data;
      if (!DrainInto(fds[i].fd, sink)) {
        ::close(fds[i].fd);
        fds[i].fd = -1;
        --open_streams;
      }
    }
  }

  if (fds[0].fd >= 0) ::close(fds[0].fd);
  if (fds[1].fd >= 0) ::close(fds[1].fd);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }

  return result;
}

} // namespace relay::util
