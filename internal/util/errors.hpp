#pragma once

#include <stdexcept>
#include <string>

namespace relay::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Credentials
// ---------------------------------------------------------------------

class AuthError : public std::runtime_error {
 public:
  enum class Reason {
    kMissingCredential,
    kInvalidCredential,
  };

  AuthError(Reason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {
  }

  Reason reason() const {
    return reason_;
  }

 private:
  Reason reason_;
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Command dispatch
// ---------------------------------------------------------------------

// No live connection for the agent. Never queued or retried.
class AgentUnavailable : public std::runtime_error {
 public:
  explicit AgentUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The agent may still complete the action after this is raised.
class CommandTimeout : public std::runtime_error {
 public:
  explicit CommandTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AgentDisconnected : public std::runtime_error {
 public:
  explicit AgentDisconnected(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Application-level failure reported by the agent, including decryption failures.
class CommandFailed : public std::runtime_error {
 public:
  explicit CommandFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Crypto
// ---------------------------------------------------------------------

class DecryptionError : public std::runtime_error {
 public:
  explicit DecryptionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace relay::util
