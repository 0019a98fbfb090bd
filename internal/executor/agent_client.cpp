#include "internal/executor/agent_client.hpp"

#include <sys/utsname.h>
#include <unistd.h>

#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/worker_set.hpp"

namespace relay::executor {

using relay::observability::StringField;

namespace {

std::string Hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0) return "unknown";
  return buf;
}

std::string Platform() {
  struct utsname info {};
  if (::uname(&info) != 0) return "unknown";
  return std::string(info.sysname) + " " + info.release + " " + info.machine;
}

} // namespace

AgentClient::AgentClient(std::shared_ptr<grpc::Channel> channel, AgentClientOptions options, std::shared_ptr<const CommandExecutor> executor)
    : stub_(relay::v1::AgentGateway::NewStub(std::move(channel))), options_(std::move(options)), executor_(std::move(executor)) {}

google::protobuf::Struct AgentClient::HelloMetadata() const {
  google::protobuf::Struct metadata;
  auto*                    fields = metadata.mutable_fields();
  (*fields)["hostname"].set_string_value(Hostname());
  (*fields)["platform"].set_string_value(Platform());
  (*fields)["executorVersion"].set_string_value(options_.executor_version);
  return metadata;
}

void AgentClient::Run() {
  while (running_) {
    RunSession();

    std::unique_lock lock(mutex_);
    if (!running_) break;

    RELAY_LOG_INFO("reconnecting", {relay::observability::IntField("delay_ms", options_.reconnect_delay.count())});
    cv_.wait_for(lock, options_.reconnect_delay, [&] { return !running_.load(); });
  }
}

void AgentClient::Stop() {
  std::lock_guard lock(mutex_);
  running_ = false;
  if (active_ctx_) active_ctx_->TryCancel();
  cv_.notify_all();
}

void AgentClient::RunSession() {
  grpc::ClientContext ctx;
  if (!options_.secret.empty()) {
    ctx.AddMetadata("authorization", "Bearer " + options_.secret);
  }

  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    active_ctx_ = &ctx;
  }

  auto stream = stub_->Connect(&ctx);

  std::mutex write_mutex;
  auto       write = [&](const relay::v1::AgentMessage& msg) {
    std::lock_guard lock(write_mutex);
    return stream->Write(msg);
  };

  relay::v1::AgentMessage hello;
  hello.mutable_hello()->set_agent_id(options_.agent_id);
  *hello.mutable_hello()->mutable_metadata() = HelloMetadata();

  util::WorkerSet         workers(options_.max_concurrent_commands);
  std::thread             heartbeat;
  bool                    session_open = false;
  std::condition_variable heartbeat_cv;
  std::mutex              heartbeat_mutex;

  if (write(hello)) {
    session_open = true;

    heartbeat = std::thread([&] {
      relay::v1::AgentMessage beat;
      beat.mutable_heartbeat();

      std::unique_lock lock(heartbeat_mutex);
      while (session_open) {
        if (heartbeat_cv.wait_for(lock, options_.heartbeat_interval, [&] { return !session_open; })) break;
        if (!write(beat)) break;
      }
    });

    relay::v1::RelayMessage incoming;
    while (stream->Read(&incoming)) {
      switch (incoming.kind_case()) {
        case relay::v1::RelayMessage::kWelcome:
          RELAY_LOG_INFO("connected to relay", {StringField("agent_id", incoming.welcome().agent_id())});
          break;

        case relay::v1::RelayMessage::kCommand: {
          const auto& command = incoming.command();
          const bool  started = workers.Spawn([&, command] {
            relay::v1::AgentMessage reply;
            try {
              auto result = executor_->Execute(command.type(), command.payload());
              reply.mutable_response()->set_command_id(command.command_id());
              *reply.mutable_response()->mutable_result() = std::move(result);
            } catch (const std::exception& e) {
              RELAY_LOG_WARN("command failed", {StringField("command_id", command.command_id()), StringField("error", e.what())});
              reply.mutable_error()->set_command_id(command.command_id());
              reply.mutable_error()->set_error(e.what());
            }
            if (!write(reply)) {
              RELAY_LOG_WARN("reply dropped, stream closed", {StringField("command_id", command.command_id())});
            }
          });
          if (!started) {
            RELAY_LOG_WARN("agent busy, command refused", {StringField("command_id", command.command_id())});
            relay::v1::AgentMessage reply;
            reply.mutable_error()->set_command_id(command.command_id());
            reply.mutable_error()->set_error("agent busy");
            if (!write(reply)) {
              RELAY_LOG_WARN("reply dropped, stream closed", {StringField("command_id", command.command_id())});
            }
          }
          break;
        }

        case relay::v1::RelayMessage::KIND_NOT_SET:
          RELAY_LOG_WARN("relay message without kind");
          break;
      }
    }
  }

  {
    std::lock_guard lock(heartbeat_mutex);
    session_open = false;
  }
  heartbeat_cv.notify_all();
  if (heartbeat.joinable()) heartbeat.join();

  workers.JoinAll();

  {
    std::lock_guard lock(write_mutex);
    stream->WritesDone();
  }
  const auto status = stream->Finish();

  {
    std::lock_guard lock(mutex_);
    active_ctx_ = nullptr;
  }

  if (status.ok()) {
    RELAY_LOG_INFO("relay closed the session");
  } else {
    RELAY_LOG_WARN("session ended", {StringField("error", status.error_message())});
  }
}

} // namespace relay::executor
