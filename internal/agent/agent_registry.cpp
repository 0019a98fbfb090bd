#include "agent_registry.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace relay::agent {

using relay::observability::IntField;
using relay::observability::StringField;

namespace {

std::string FieldOr(const google::protobuf::Struct& s, const std::string& key, const std::string& fallback) {
  auto it = s.fields().find(key);
  if (it == s.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return fallback;
  }
  return it->second.string_value();
}

// Containers are reported either as ids or as objects carrying one.
std::vector<std::string> ResourceIds(const google::protobuf::ListValue& list) {
  std::vector<std::string> out;
  for (const auto& v : list.values()) {
    if (v.kind_case() == google::protobuf::Value::kStringValue) {
      out.push_back(v.string_value());
    } else if (v.kind_case() == google::protobuf::Value::kStructValue) {
      auto id = FieldOr(v.struct_value(), "id", FieldOr(v.struct_value(), "Id", ""));
      if (!id.empty()) out.push_back(std::move(id));
    }
  }
  return out;
}

} // namespace

AgentRegistry::AgentRegistry(util::ClockFn clock) : clock_(std::move(clock)) {
}

// ------------------------------------------------------------------
// Registration
// ------------------------------------------------------------------

uint64_t AgentRegistry::Register(const std::string&               agent_id,
                                 std::shared_ptr<AgentConnection> connection,
                                 google::protobuf::Struct         metadata,
                                 std::string                      tenant_id) {
  std::optional<Record> replaced;
  uint64_t              session = 0;
  const auto            peer    = connection->Peer();

  RELAY_LOG_INFO("agent connected", {StringField("agent_id", agent_id), StringField("peer", peer),
                                     StringField("hostname", FieldOr(metadata, "hostname", "unknown")),
                                     StringField("platform", FieldOr(metadata, "platform", "unknown"))});

  {
    std::lock_guard lock(mutex_);
    session = next_session_++;

    auto it = agents_.find(agent_id);
    if (it != agents_.end()) {
      replaced = std::move(it->second);
      agents_.erase(it);
    }

    Record r;
    r.connection = connection;
    r.session    = session;
    r.metadata   = std::move(metadata);
    r.last_seen  = clock_();
    r.tenant_id  = std::move(tenant_id);
    agents_.emplace(agent_id, std::move(r));
  }

  if (replaced) {
    RELAY_LOG_WARN("agent reconnected, replacing previous connection",
                   {StringField("agent_id", agent_id), IntField("session", static_cast<int64_t>(replaced->session))});
    NotifyDisconnected(agent_id, replaced->session);
    replaced->connection->Close("replaced by a newer connection");
  }

  AgentConnection::Handlers handlers;
  handlers.on_message = [this, agent_id, session](const relay::v1::AgentMessage& m) { HandleMessage(agent_id, session, m); };
  handlers.on_close   = [this, agent_id, session]() { Unregister(agent_id, session); };
  handlers.on_error   = [this, agent_id, session](const std::string& error) {
    RELAY_LOG_ERROR("agent transport error", {StringField("agent_id", agent_id), StringField("error", error)});
    Unregister(agent_id, session);
  };
  connection->Bind(std::move(handlers));

  relay::v1::RelayMessage welcome;
  welcome.mutable_welcome()->set_agent_id(agent_id);
  welcome.mutable_welcome()->set_timestamp_ms(static_cast<int64_t>(util::ToUnixMillis(clock_())));
  if (!connection->Send(welcome)) {
    RELAY_LOG_WARN("failed to send welcome", {StringField("agent_id", agent_id)});
    Unregister(agent_id, session);
  }

  return session;
}

bool AgentRegistry::Unregister(const std::string& agent_id) {
  auto removed = Remove(agent_id, nullptr);
  if (!removed) return false;

  NotifyDisconnected(agent_id, removed->session);
  removed->connection->Close("unregistered");
  return true;
}

bool AgentRegistry::Unregister(const std::string& agent_id, uint64_t session) {
  auto removed = Remove(agent_id, &session);
  if (!removed) return false;

  NotifyDisconnected(agent_id, session);
  return true;
}

std::optional<AgentRegistry::Record> AgentRegistry::Remove(const std::string& agent_id, const uint64_t* session) {
  std::optional<Record> out;
  {
    std::lock_guard lock(mutex_);
    auto            it = agents_.find(agent_id);
    if (it == agents_.end()) return std::nullopt;
    if (session && it->second.session != *session) return std::nullopt;

    out = std::move(it->second);
    agents_.erase(it);
  }

  RELAY_LOG_INFO("agent disconnected", {StringField("agent_id", agent_id), IntField("session", static_cast<int64_t>(out->session))});
  return out;
}

void AgentRegistry::NotifyDisconnected(const std::string& agent_id, uint64_t session) {
  std::shared_lock lock(observer_mutex_);
  if (observer_) observer_->OnAgentDisconnected(agent_id, session);
}

// ------------------------------------------------------------------
// Inbound messages
// ------------------------------------------------------------------

void AgentRegistry::HandleMessage(const std::string& agent_id, uint64_t session, const relay::v1::AgentMessage& message) {
  using Kind = relay::v1::AgentMessage::KindCase;

  {
    std::lock_guard lock(mutex_);
    auto            it = agents_.find(agent_id);
    if (it == agents_.end() || it->second.session != session) {
      RELAY_LOG_WARN("message from unknown agent", {StringField("agent_id", agent_id)});
      return;
    }

    auto& record     = it->second;
    record.last_seen = clock_();

    switch (message.kind_case()) {
      case Kind::kHeartbeat:
        return;

      case Kind::kStatus: {
        const auto& status = message.status().status();
        for (const auto& [key, value] : status.fields()) {
          (*record.metadata.mutable_fields())[key] = value;
        }
        auto active = status.fields().find("activeContainers");
        if (active != status.fields().end() && active->second.kind_case() == google::protobuf::Value::kListValue) {
          record.active_resources = ResourceIds(active->second.list_value());
        }
        RELAY_LOG_INFO("agent status updated", {StringField("agent_id", agent_id)});
        return;
      }

      case Kind::kHello:
        RELAY_LOG_WARN("duplicate hello ignored", {StringField("agent_id", agent_id)});
        return;

      case Kind::KIND_NOT_SET:
        RELAY_LOG_WARN("empty agent message", {StringField("agent_id", agent_id)});
        return;

      case Kind::kResponse:
      case Kind::kError:
        break;
    }
  }

  // Replies are matched by the observer, outside the registry lock.
  std::shared_lock lock(observer_mutex_);
  if (!observer_) {
    RELAY_LOG_WARN("no dispatcher attached, dropping reply", {StringField("agent_id", agent_id)});
    return;
  }
  if (message.kind_case() == Kind::kResponse) {
    observer_->OnCommandResponse(agent_id, message.response());
  } else {
    observer_->OnCommandError(agent_id, message.error());
  }
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::optional<AgentRoute> AgentRegistry::Lookup(const std::string& agent_id) const {
  std::lock_guard lock(mutex_);
  auto            it = agents_.find(agent_id);
  if (it == agents_.end()) return std::nullopt;
  return AgentRoute{it->second.connection, it->second.session, it->second.tenant_id};
}

relay::v1::AgentSummary AgentRegistry::Summarize(const std::string& agent_id, const Record& record) const {
  relay::v1::AgentSummary s;
  s.set_agent_id(agent_id);
  *s.mutable_metadata()  = record.metadata;
  *s.mutable_last_seen() = util::ToProto(record.last_seen);
  for (const auto& r : record.active_resources) s.add_active_resources(r);
  s.set_connected(true);
  s.set_tenant_id(record.tenant_id);
  s.set_peer(record.connection->Peer());
  return s;
}

std::optional<relay::v1::AgentSummary> AgentRegistry::Get(const std::string& agent_id) const {
  std::lock_guard lock(mutex_);
  auto            it = agents_.find(agent_id);
  if (it == agents_.end()) return std::nullopt;
  return Summarize(agent_id, it->second);
}

std::vector<relay::v1::AgentSummary> AgentRegistry::List() const {
  std::lock_guard                      lock(mutex_);
  std::vector<relay::v1::AgentSummary> out;
  out.reserve(agents_.size());
  for (const auto& [id, record] : agents_) out.push_back(Summarize(id, record));
  return out;
}

bool AgentRegistry::IsConnected(const std::string& agent_id) const {
  std::lock_guard lock(mutex_);
  return agents_.count(agent_id) > 0;
}

std::size_t AgentRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return agents_.size();
}

void AgentRegistry::SetObserver(AgentObserver* observer) {
  std::unique_lock lock(observer_mutex_);
  observer_ = observer;
}

} // namespace relay::agent
