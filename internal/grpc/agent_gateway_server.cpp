#include "agent_gateway_server.hpp"

#include <atomic>
#include <deque>
#include <mutex>

#include "bearer.hpp"
#include "grpc_error.hpp"
#include "internal/agent/agent_registry.hpp"
#include "internal/keystore/key_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"
#include "relay/v1.hpp"

namespace relay::grpc {

using relay::observability::StringField;
using relay::v1::AgentMessage;
using relay::v1::RelayMessage;

namespace {

class AgentStream;

// Registry-facing handle. Outlives the reactor; Send() fails once detached.
class StreamConnection final : public relay::agent::AgentConnection {
 public:
  StreamConnection(AgentStream* stream, std::string peer) : stream_(stream), peer_(std::move(peer)) {}

  bool Send(const RelayMessage& message) override;
  void Close(const std::string& reason) override;

  void Bind(Handlers handlers) override {
    std::lock_guard lock(mutex_);
    handlers_ = std::move(handlers);
  }

  std::string Peer() const override { return peer_; }

  Handlers CurrentHandlers() const {
    std::lock_guard lock(mutex_);
    return handlers_;
  }

  void Detach() {
    std::lock_guard lock(mutex_);
    stream_ = nullptr;
  }

 private:
  mutable std::mutex mutex_;
  AgentStream*       stream_;
  Handlers           handlers_;
  const std::string  peer_;
};

class AgentStream final : public ::grpc::ServerBidiReactor<AgentMessage, RelayMessage> {
 public:
  AgentStream(::grpc::CallbackServerContext*               ctx,
              std::shared_ptr<relay::agent::AgentRegistry> registry,
              std::shared_ptr<relay::keystore::KeyStore>   key_store,
              bool                                         require_credential)
      : ctx_(ctx),
        registry_(std::move(registry)),
        key_store_(std::move(key_store)),
        require_credential_(require_credential),
        connection_(std::make_shared<StreamConnection>(this, ctx->peer())) {
    StartRead(&incoming_);
  }

  // false once the stream is finishing.
  bool Enqueue(const RelayMessage& message) {
    std::lock_guard lock(mutex_);
    if (finishing_ || finished_) return false;

    outgoing_.push_back(message);
    if (!writing_) {
      writing_ = true;
      StartWrite(&outgoing_.front());
    }
    return true;
  }

  // Queued writes are flushed first.
  void FinishAfterWrites(::grpc::Status status) {
    std::lock_guard lock(mutex_);
    if (finishing_ || finished_) return;

    finishing_ = true;
    final_status_ = std::move(status);
    if (!writing_) {
      finished_ = true;
      Finish(final_status_);
    }
  }

  void OnReadDone(bool ok) override {
    if (!ok) {
      NotifyClosed();
      FinishAfterWrites(::grpc::Status::OK);
      return;
    }

    if (!hello_seen_) {
      HandleHello();
      return;
    }

    auto handlers = connection_->CurrentHandlers();
    if (handlers.on_message) handlers.on_message(incoming_);
    StartRead(&incoming_);
  }

  void OnWriteDone(bool ok) override {
    bool failed = false;
    {
      std::lock_guard lock(mutex_);
      outgoing_.pop_front();

      if (!ok) {
        failed = true;
        writing_ = false;
        outgoing_.clear();
        if (!finished_) {
          finished_ = true;
          Finish(::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "agent stream write failed"));
        }
      } else if (!outgoing_.empty()) {
        StartWrite(&outgoing_.front());
      } else {
        writing_ = false;
        if (finishing_ && !finished_) {
          finished_ = true;
          Finish(final_status_);
        }
      }
    }

    if (failed) {
      auto handlers = connection_->CurrentHandlers();
      if (handlers.on_error) handlers.on_error("write failed");
    }
  }

  void OnDone() override {
    NotifyClosed();
    connection_->Detach();
    // Finish() may have been issued on another thread still holding mutex_.
    { std::lock_guard lock(mutex_); }
    delete this;
  }

 private:
  void HandleHello() {
    if (incoming_.kind_case() != AgentMessage::kHello) {
      RELAY_LOG_WARN("agent stream did not open with hello", {StringField("peer", ctx_->peer())});
      FinishAfterWrites(::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, "first message must be hello"));
      return;
    }
    hello_seen_ = true;

    std::string tenant_id;
    try {
      const auto secret = BearerSecret(*ctx_);
      if (require_credential_ || (!secret.empty() && key_store_)) {
        if (!key_store_) {
          throw std::runtime_error("agent credentials required but no key store configured");
        }
        tenant_id = key_store_->Resolve(secret).tenant_id;
      }
    } catch (const std::exception& e) {
      RELAY_LOG_WARN("agent authentication failed", {StringField("peer", ctx_->peer()), StringField("error", e.what())});
      FinishAfterWrites(ToStatus(e));
      return;
    }

    const auto& hello = incoming_.hello();
    const auto agent_id = hello.agent_id().empty() ? util::NewUUIDString() : hello.agent_id();
    registry_->Register(agent_id, connection_, hello.metadata(), tenant_id);

    StartRead(&incoming_);
  }

  void NotifyClosed() {
    if (close_notified_.exchange(true)) return;
    auto handlers = connection_->CurrentHandlers();
    if (handlers.on_close) handlers.on_close();
  }

  ::grpc::CallbackServerContext*               ctx_;
  std::shared_ptr<relay::agent::AgentRegistry> registry_;
  std::shared_ptr<relay::keystore::KeyStore>   key_store_;
  const bool                                   require_credential_;
  std::shared_ptr<StreamConnection>            connection_;

  // Touched only from read callbacks, which never overlap.
  AgentMessage incoming_;
  bool         hello_seen_ = false;

  std::mutex               mutex_;
  std::deque<RelayMessage> outgoing_;
  bool                     writing_   = false;
  bool                     finishing_ = false;
  bool                     finished_  = false;
  ::grpc::Status           final_status_;

  std::atomic<bool> close_notified_{false};
};

bool StreamConnection::Send(const RelayMessage& message) {
  std::lock_guard lock(mutex_);
  return stream_ != nullptr && stream_->Enqueue(message);
}

void StreamConnection::Close(const std::string& reason) {
  std::lock_guard lock(mutex_);
  if (stream_) {
    RELAY_LOG_DEBUG("closing agent stream", {StringField("peer", peer_), StringField("reason", reason)});
    stream_->FinishAfterWrites(::grpc::Status::OK);
  }
}

} // namespace

AgentGatewayServer::AgentGatewayServer(std::shared_ptr<relay::agent::AgentRegistry> registry,
                                       std::shared_ptr<relay::keystore::KeyStore>   key_store,
                                       bool                                         require_credential)
    : registry_(std::move(registry)), key_store_(std::move(key_store)), require_credential_(require_credential) {
}

::grpc::ServerBidiReactor<AgentMessage, RelayMessage>* AgentGatewayServer::Connect(::grpc::CallbackServerContext* ctx) {
  return new AgentStream(ctx, registry_, key_store_, require_credential_);
}

} // namespace relay::grpc
