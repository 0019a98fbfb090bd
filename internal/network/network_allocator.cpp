#include "network_allocator.hpp"

#include <set>
#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relay::network {

using db::model::AllocationState;
using db::model::NetworkAllocationRecord;
using relay::observability::IntField;
using relay::observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

NetworkAllocationRecord RequireRecord(db::Repository& repo, db::Transaction& tx, const std::string& tenant_id) {
  auto rec = repo.GetNetwork(tx, tenant_id);
  if (!rec) {
    throw util::NotFound("no network allocation for tenant " + tenant_id);
  }
  return *rec;
}

} // namespace

NetworkAllocator::NetworkAllocator(std::shared_ptr<db::Repository> repository,
                                   std::shared_ptr<NetworkDriver>  driver,
                                   NetworkOptions                  options,
                                   util::ClockFn                   clock)
    : repository_(std::move(repository)),
      driver_(std::move(driver)),
      options_(std::move(options)),
      clock_(std::move(clock)),
      plan_(options_.pools) {
  for (const auto& c : options_.control_plane_cidrs) {
    control_plane_.push_back(ParseCidr(c));
  }
}

std::string NetworkAllocator::NetworkName(const std::string& tenant_id) {
  return "tenant-" + tenant_id.substr(0, 8) + "-network";
}

// ------------------------------------------------------------------
// Allocate
// ------------------------------------------------------------------

NetworkAllocationRecord NetworkAllocator::Allocate(const std::string& tenant_id) {
  if (tenant_id.empty()) {
    throw util::InvalidArgument("tenant_id is required");
  }

  std::lock_guard lock(mutex_);
  const auto      name = NetworkName(tenant_id);

  // Reserve the block first so no driver call runs under a transaction.
  NetworkAllocationRecord rec;
  {
    auto tx = repository_->Begin();

    if (auto existing = repository_->GetNetwork(*tx, tenant_id)) {
      if (existing->state == AllocationState::kPendingTeardown) {
        throw util::InvalidState("network for tenant " + tenant_id + " is pending teardown");
      }
      return *existing;
    }

    std::set<uint32_t> used_blocks;
    std::vector<Cidr>  used_subnets;
    for (const auto& r : repository_->ListNetworks(*tx)) {
      if (r.network_name == name) {
        throw util::AlreadyExists("network " + name + " already belongs to tenant " + r.tenant_id);
      }
      used_blocks.insert(r.block_index);
      used_subnets.push_back(ParseCidr(r.subnet_cidr));
    }

    const auto isolated = [&](const Cidr& block) {
      for (const auto& c : control_plane_) {
        if (Overlaps(block, c)) return false;
      }
      for (const auto& c : used_subnets) {
        if (Overlaps(block, c)) return false;
      }
      return true;
    };

    const auto total = plan_.BlockCount();
    auto       index = plan_.PreferredIndex(tenant_id);
    bool       found = false;
    Cidr       block;
    for (uint64_t probe = 0; probe < total; ++probe, index = (index + 1) % total) {
      if (used_blocks.count(static_cast<uint32_t>(index))) continue;
      block = plan_.BlockAt(index);
      if (isolated(block)) {
        found = true;
        break;
      }
    }
    if (!found) {
      throw util::ResourceExhausted("no free subnet block for tenant " + tenant_id);
    }

    rec.tenant_id          = tenant_id;
    rec.network_name       = name;
    rec.block_index        = static_cast<uint32_t>(index);
    rec.subnet_cidr        = FormatCidr(block);
    rec.gateway_address    = FormatAddress(block.First() + kGatewayOffset);
    rec.file_share_address = FormatAddress(block.First() + kFileShareOffset);
    rec.vm_address         = FormatAddress(block.First() + kVmOffset);
    rec.relay_address      = FormatAddress(block.First() + kRelayOffset);
    rec.relay_attached     = false;
    rec.state              = AllocationState::kActive;
    rec.created_at_ms      = util::ToUnixMillis(clock_());

    ThrowIfDbError(repository_->InsertNetwork(*tx, rec), "insert network allocation");
    tx->Commit();
  }

  try {
    NetworkSpec spec;
    spec.name                       = name;
    spec.subnet_cidr                = rec.subnet_cidr;
    spec.gateway                    = rec.gateway_address;
    spec.labels["relay.tenant-id"]  = tenant_id;
    spec.labels["relay.tenant-net"] = "true";
    driver_->CreateNetwork(spec);

    const auto actual = driver_->InspectSubnet(name);
    if (!actual || *actual != rec.subnet_cidr) {
      throw util::InvalidState("network " + name + " has subnet " + actual.value_or("<none>") + ", expected " + rec.subnet_cidr);
    }
  } catch (const std::exception& e) {
    RELAY_LOG_WARN("network create failed, dropping reservation",
                   {StringField("tenant_id", tenant_id), StringField("network", name), StringField("error", e.what())});
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->DeleteNetwork(*tx, tenant_id), "delete network reservation");
    tx->Commit();
    throw;
  }

  RELAY_LOG_INFO("allocated tenant network", {StringField("tenant_id", tenant_id), StringField("network", name),
                                              StringField("subnet", rec.subnet_cidr), IntField("block", rec.block_index)});
  return rec;
}

// ------------------------------------------------------------------
// Relay attachment
// ------------------------------------------------------------------

NetworkAllocationRecord NetworkAllocator::AttachRelay(const std::string& tenant_id) {
  std::lock_guard lock(mutex_);
  auto            rec = Load(tenant_id);

  if (rec.state == AllocationState::kPendingTeardown) {
    throw util::InvalidState("network for tenant " + tenant_id + " is pending teardown");
  }
  if (rec.relay_attached) {
    return rec;
  }

  const auto base = ParseCidr(rec.subnet_cidr).First();
  for (int attempt = 0; attempt < kRelayAttempts; ++attempt) {
    const auto address = FormatAddress(base + kRelayOffset + kRelayRetryStep * static_cast<uint32_t>(attempt));
    const auto outcome = driver_->ConnectContainer(rec.network_name, options_.relay_container, address);

    switch (outcome) {
      case AttachOutcome::kAddressInUse:
        RELAY_LOG_WARN("relay address in use, retrying", {StringField("network", rec.network_name), StringField("address", address)});
        continue;

      case AttachOutcome::kAlreadyAttached:
      case AttachOutcome::kAttached:
        rec.relay_address  = address;
        rec.relay_attached = true;
        Store(rec);
        RELAY_LOG_INFO("relay attached", {StringField("network", rec.network_name), StringField("address", address)});
        return rec;
    }
  }

  throw util::ResourceExhausted("no free relay address on network " + rec.network_name);
}

// ------------------------------------------------------------------
// Teardown
// ------------------------------------------------------------------

NetworkAllocationRecord NetworkAllocator::Release(const std::string& tenant_id) {
  std::lock_guard lock(mutex_);
  auto            rec = Load(tenant_id);

  if (rec.state == AllocationState::kPendingTeardown) {
    return rec;
  }

  if (rec.relay_attached) {
    driver_->DisconnectContainer(rec.network_name, options_.relay_container);
    rec.relay_attached = false;
  }
  rec.state = AllocationState::kPendingTeardown;
  Store(rec);

  RELAY_LOG_INFO("tenant network released", {StringField("tenant_id", tenant_id), StringField("network", rec.network_name)});
  return rec;
}

NetworkAllocationRecord NetworkAllocator::ConfirmTeardown(const std::string& tenant_id) {
  std::lock_guard lock(mutex_);
  const auto      rec = Load(tenant_id);

  if (rec.state != AllocationState::kPendingTeardown) {
    throw util::InvalidState("network for tenant " + tenant_id + " must be released before teardown");
  }

  driver_->RemoveNetwork(rec.network_name);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteNetwork(*tx, tenant_id), "delete network allocation");
  tx->Commit();

  RELAY_LOG_INFO("tenant network removed", {StringField("tenant_id", tenant_id), StringField("subnet", rec.subnet_cidr)});
  return rec;
}

NetworkAllocationRecord NetworkAllocator::Load(const std::string& tenant_id) {
  auto tx  = repository_->Begin();
  auto rec = RequireRecord(*repository_, *tx, tenant_id);
  tx->Commit();
  return rec;
}

void NetworkAllocator::Store(const NetworkAllocationRecord& record) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpdateNetwork(*tx, record), "update network allocation");
  tx->Commit();
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

NetworkAllocationRecord NetworkAllocator::Get(const std::string& tenant_id) {
  return Load(tenant_id);
}

std::vector<NetworkAllocationRecord> NetworkAllocator::List() {
  auto tx  = repository_->Begin();
  auto out = repository_->ListNetworks(*tx);
  tx->Commit();
  return out;
}

relay::v1::NetworkAllocation NetworkAllocator::ToProto(const NetworkAllocationRecord& r) {
  relay::v1::NetworkAllocation out;
  out.set_tenant_id(r.tenant_id);
  out.set_network_name(r.network_name);
  out.set_subnet_cidr(r.subnet_cidr);
  out.set_gateway_address(r.gateway_address);
  out.mutable_addresses()->set_vm(r.vm_address);
  out.mutable_addresses()->set_file_share(r.file_share_address);
  out.mutable_addresses()->set_relay(r.relay_address);
  out.set_state(r.state == AllocationState::kPendingTeardown ? relay::v1::ALLOCATION_STATE_PENDING_TEARDOWN
                                                             : relay::v1::ALLOCATION_STATE_ACTIVE);
  out.set_relay_attached(r.relay_attached);
  out.set_block_index(r.block_index);
  return out;
}

} // namespace relay::network
