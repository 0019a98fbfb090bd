#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "internal/agent/agent_connection.hpp"
#include "relay/v1.hpp"

namespace relay::testing {

/*
  In-process AgentConnection. Tests play the agent side:
  Deliver() feeds an inbound message, DropTransport()/Fail() raise the
  transport events, on_send observes outbound traffic.
*/
class FakeConnection : public relay::agent::AgentConnection {
 public:
  explicit FakeConnection(std::string peer = "ipv4:127.0.0.1:40000") : peer_(std::move(peer)) {}

  bool Send(const relay::v1::RelayMessage& message) override {
    std::function<void(const relay::v1::RelayMessage&)> hook;
    {
      std::lock_guard lock(mutex_);
      if (!writable_) return false;
      sent_.push_back(message);
      hook = on_send;
    }
    if (hook) hook(message);
    return true;
  }

  void Bind(Handlers handlers) override {
    std::lock_guard lock(mutex_);
    handlers_ = std::move(handlers);
  }

  void Close(const std::string& reason) override {
    std::lock_guard lock(mutex_);
    closed_       = true;
    close_reason_ = reason;
    writable_     = false;
  }

  std::string Peer() const override {
    return peer_;
  }

  // -------------------------------------------------------------------
  // Agent side
  // -------------------------------------------------------------------

  void Deliver(const relay::v1::AgentMessage& message) {
    Handlers h;
    {
      std::lock_guard lock(mutex_);
      h = handlers_;
    }
    if (h.on_message) h.on_message(message);
  }

  void Reply(const std::string& command_id, const google::protobuf::Value& result) {
    relay::v1::AgentMessage m;
    m.mutable_response()->set_command_id(command_id);
    *m.mutable_response()->mutable_result() = result;
    Deliver(m);
  }

  void ReplyError(const std::string& command_id, const std::string& error) {
    relay::v1::AgentMessage m;
    m.mutable_error()->set_command_id(command_id);
    m.mutable_error()->set_error(error);
    Deliver(m);
  }

  void DropTransport() {
    Handlers h;
    {
      std::lock_guard lock(mutex_);
      writable_ = false;
      h         = handlers_;
    }
    if (h.on_close) h.on_close();
  }

  void Fail(const std::string& error) {
    Handlers h;
    {
      std::lock_guard lock(mutex_);
      writable_ = false;
      h         = handlers_;
    }
    if (h.on_error) h.on_error(error);
  }

  void SetWritable(bool writable) {
    std::lock_guard lock(mutex_);
    writable_ = writable;
  }

  std::vector<relay::v1::RelayMessage> Sent() const {
    std::lock_guard lock(mutex_);
    return sent_;
  }

  std::vector<relay::v1::Command> Commands() const {
    std::lock_guard                 lock(mutex_);
    std::vector<relay::v1::Command> out;
    for (const auto& m : sent_) {
      if (m.has_command()) out.push_back(m.command());
    }
    return out;
  }

  bool Closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  std::string CloseReason() const {
    std::lock_guard lock(mutex_);
    return close_reason_;
  }

  // Runs on the sending thread after the message is recorded.
  std::function<void(const relay::v1::RelayMessage&)> on_send;

 private:
  mutable std::mutex                   mutex_;
  std::string                          peer_;
  Handlers                             handlers_;
  std::vector<relay::v1::RelayMessage> sent_;
  bool                                 writable_ = true;
  bool                                 closed_   = false;
  std::string                          close_reason_;
};

} // namespace relay::testing
