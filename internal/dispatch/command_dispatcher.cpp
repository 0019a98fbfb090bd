#include "command_dispatcher.hpp"

#include <vector>

#include "internal/agent/agent_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace relay::dispatch {

using relay::observability::IntField;
using relay::observability::StringField;

namespace {

google::protobuf::Value StringValue(const std::string& s) {
  google::protobuf::Value v;
  v.set_string_value(s);
  return v;
}

google::protobuf::Value NumberValue(double d) {
  google::protobuf::Value v;
  v.set_number_value(d);
  return v;
}

} // namespace

CommandDispatcher::CommandDispatcher(std::shared_ptr<agent::AgentRegistry> registry,
                                     std::shared_ptr<util::TimerQueue>     timers,
                                     std::chrono::milliseconds             default_timeout)
    : registry_(std::move(registry)), timers_(std::move(timers)), default_timeout_(default_timeout) {
  registry_->SetObserver(this);
}

CommandDispatcher::~CommandDispatcher() {
  registry_->SetObserver(nullptr);
  Shutdown();
}

// ------------------------------------------------------------------
// Send
// ------------------------------------------------------------------

CommandHandle CommandDispatcher::Send(const std::string&                       agent_id,
                                      const std::string&                       type,
                                      google::protobuf::Value                  payload,
                                      std::optional<std::chrono::milliseconds> timeout,
                                      const std::string*                       required_tenant) {
  auto route = registry_->Lookup(agent_id);
  if (!route) {
    throw util::AgentUnavailable("Agent " + agent_id + " not connected");
  }
  if (required_tenant && !route->tenant_id.empty() && route->tenant_id != *required_tenant) {
    throw util::PermissionDenied("agent " + agent_id + " belongs to another tenant");
  }

  const auto command_id = util::NewUUIDString();
  const auto window     = timeout.value_or(default_timeout_);
  auto       state      = std::make_shared<CommandState>(command_id, agent_id);

  {
    std::lock_guard lock(mutex_);
    Pending         p;
    p.state     = state;
    p.agent_id  = agent_id;
    p.type      = type;
    p.session   = route->session;
    p.issued_at = util::Now();
    // The callback blocks on mutex_ until the timer id is stored.
    p.timer = timers_->Schedule(window, [this, command_id, window] { OnTimeout(command_id, window); });
    pending_.emplace(command_id, std::move(p));
  }

  relay::v1::RelayMessage message;
  auto*                   cmd = message.mutable_command();
  cmd->set_command_id(command_id);
  cmd->set_type(type);
  *cmd->mutable_payload() = std::move(payload);

  RELAY_LOG_INFO("sending command",
                 {StringField("agent_id", agent_id), StringField("command_id", command_id), StringField("type", type)});

  if (!route->connection->Send(message)) {
    if (auto p = Take(command_id, nullptr)) {
      timers_->Cancel(p->timer);
    }
    throw util::AgentUnavailable("Agent " + agent_id + " not connected");
  }

  return CommandHandle(std::move(state));
}

std::optional<CommandDispatcher::Pending> CommandDispatcher::Take(const std::string& command_id, const std::string* agent_id) {
  std::lock_guard lock(mutex_);
  auto            it = pending_.find(command_id);
  if (it == pending_.end()) return std::nullopt;
  if (agent_id && it->second.agent_id != *agent_id) return std::nullopt;

  auto out = std::move(it->second);
  pending_.erase(it);
  return out;
}

// ------------------------------------------------------------------
// Resolution
// ------------------------------------------------------------------

void CommandDispatcher::OnCommandResponse(const std::string& agent_id, const relay::v1::CommandResponse& response) {
  if (response.command_id().empty()) {
    RELAY_LOG_ERROR("response missing command id", {StringField("agent_id", agent_id)});
    return;
  }

  auto p = Take(response.command_id(), &agent_id);
  if (!p) {
    RELAY_LOG_WARN("response for unknown command",
                   {StringField("agent_id", agent_id), StringField("command_id", response.command_id())});
    return;
  }

  timers_->Cancel(p->timer);
  if (p->state->TryComplete(response.result())) {
    ++completed_;
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(util::Now() - p->issued_at);
    RELAY_LOG_INFO("command completed", {StringField("command_id", response.command_id()), StringField("type", p->type),
                                         IntField("elapsed_ms", elapsed.count())});
  }
}

void CommandDispatcher::OnCommandError(const std::string& agent_id, const relay::v1::CommandError& error) {
  if (error.command_id().empty()) {
    RELAY_LOG_ERROR("error reply missing command id", {StringField("agent_id", agent_id)});
    return;
  }

  auto p = Take(error.command_id(), &agent_id);
  if (!p) {
    RELAY_LOG_WARN("error for unknown command", {StringField("agent_id", agent_id), StringField("command_id", error.command_id())});
    return;
  }

  timers_->Cancel(p->timer);
  if (p->state->TryFail(CommandOutcome::kFailed, error.error())) {
    ++failed_;
    RELAY_LOG_WARN("command failed", {StringField("command_id", error.command_id()), StringField("error", error.error())});
  }
}

void CommandDispatcher::OnTimeout(const std::string& command_id, std::chrono::milliseconds window) {
  auto p = Take(command_id, nullptr);
  if (!p) return;

  if (p->state->TryFail(CommandOutcome::kTimedOut, "Command timeout after " + std::to_string(window.count()) + "ms")) {
    ++timed_out_;
    RELAY_LOG_WARN("command timed out", {StringField("agent_id", p->agent_id), StringField("command_id", command_id),
                                         IntField("timeout_ms", window.count())});
  }
}

void CommandDispatcher::OnAgentDisconnected(const std::string& agent_id, uint64_t session) {
  std::vector<Pending> dropped;
  {
    std::lock_guard lock(mutex_);
    for (auto it = pending_.begin(); it != pending_.end();) {
      if (it->second.agent_id == agent_id && it->second.session == session) {
        dropped.push_back(std::move(it->second));
        it = pending_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (auto& p : dropped) {
    timers_->Cancel(p.timer);
    if (p.state->TryFail(CommandOutcome::kDisconnected, "Agent disconnected")) ++failed_;
  }

  if (!dropped.empty()) {
    RELAY_LOG_WARN("rejected pending commands of disconnected agent",
                   {StringField("agent_id", agent_id), IntField("count", static_cast<int64_t>(dropped.size()))});
  }
}

void CommandDispatcher::Shutdown() {
  std::unordered_map<std::string, Pending> dropped;
  {
    std::lock_guard lock(mutex_);
    dropped.swap(pending_);
  }

  for (auto& [id, p] : dropped) {
    timers_->Cancel(p.timer);
    if (p.state->TryFail(CommandOutcome::kDisconnected, "Dispatcher shutting down")) ++failed_;
  }
}

// ------------------------------------------------------------------
// Container commands
// ------------------------------------------------------------------

CommandHandle CommandDispatcher::SendContainer(const std::string& agent_id, const std::string& type, google::protobuf::Struct payload) {
  google::protobuf::Value v;
  *v.mutable_struct_value() = std::move(payload);
  return Send(agent_id, type, std::move(v));
}

CommandHandle CommandDispatcher::CreateContainer(const std::string& agent_id, const google::protobuf::Struct& options) {
  return SendContainer(agent_id, "container.create", options);
}

CommandHandle CommandDispatcher::StartContainer(const std::string& agent_id, const std::string& container_id) {
  google::protobuf::Struct s;
  (*s.mutable_fields())["containerId"] = StringValue(container_id);
  return SendContainer(agent_id, "container.start", std::move(s));
}

CommandHandle CommandDispatcher::StopContainer(const std::string& agent_id, const std::string& container_id) {
  google::protobuf::Struct s;
  (*s.mutable_fields())["containerId"] = StringValue(container_id);
  return SendContainer(agent_id, "container.stop", std::move(s));
}

CommandHandle CommandDispatcher::RemoveContainer(const std::string& agent_id, const std::string& container_id) {
  google::protobuf::Struct s;
  (*s.mutable_fields())["containerId"] = StringValue(container_id);
  return SendContainer(agent_id, "container.remove", std::move(s));
}

CommandHandle CommandDispatcher::ListContainers(const std::string& agent_id) {
  return SendContainer(agent_id, "container.list", google::protobuf::Struct{});
}

CommandHandle CommandDispatcher::ExecInContainer(const std::string& agent_id, const std::string& container_id, const std::string& command) {
  google::protobuf::Struct s;
  (*s.mutable_fields())["containerId"] = StringValue(container_id);
  (*s.mutable_fields())["command"]     = StringValue(command);
  return SendContainer(agent_id, "container.exec", std::move(s));
}

CommandHandle CommandDispatcher::ContainerLogs(const std::string& agent_id, const std::string& container_id, uint32_t tail) {
  google::protobuf::Struct s;
  (*s.mutable_fields())["containerId"] = StringValue(container_id);
  (*s.mutable_fields())["tail"]        = NumberValue(tail);
  return SendContainer(agent_id, "container.logs", std::move(s));
}

CommandHandle CommandDispatcher::InspectContainer(const std::string& agent_id, const std::string& container_id) {
  google::protobuf::Struct s;
  (*s.mutable_fields())["containerId"] = StringValue(container_id);
  return SendContainer(agent_id, "container.inspect", std::move(s));
}

// ------------------------------------------------------------------
// Stats
// ------------------------------------------------------------------

std::size_t CommandDispatcher::PendingCount() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

CommandDispatcher::Counters CommandDispatcher::Stats() const {
  Counters c;
  c.completed = completed_.load();
  c.failed    = failed_.load();
  c.timed_out = timed_out_.load();
  return c;
}

} // namespace relay::dispatch
