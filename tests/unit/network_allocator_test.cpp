#include <assert.h>

#include <chrono>
#include <condition_variable>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/network/memory_network_driver.hpp"
#include "internal/network/network_allocator.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace relay::network;
using relay::db::model::AllocationState;

// Four blocks: 10.10.0.0/24 .. 10.10.3.0/24, with block 1 held by the
// control plane.
struct Fixture {
  std::shared_ptr<relay::db::memory::MemoryRepository> repo   = std::make_shared<relay::db::memory::MemoryRepository>();
  std::shared_ptr<MemoryNetworkDriver>         driver = std::make_shared<MemoryNetworkDriver>();
  NetworkAllocator                             allocator;

  Fixture() : allocator(repo, driver, Options()) {}

  static NetworkOptions Options() {
    NetworkOptions o;
    o.pools               = {"10.10.0.0/22"};
    o.control_plane_cidrs = {"10.10.1.0/24"};
    o.relay_container     = "tools-relay";
    return o;
  }
};

// Parks CreateNetwork until released so callers can observe the
// repository while a driver call is in flight.
class GatedDriver : public NetworkDriver {
 public:
  void CreateNetwork(const NetworkSpec& spec) override {
    std::unique_lock lock(mu_);
    entered_ = true;
    cv_.notify_all();
    cv_.wait(lock, [&] { return released_; });
    if (fail_) {
      throw std::runtime_error("docker network create: daemon timeout");
    }
    inner_.CreateNetwork(spec);
  }
  std::optional<std::string> InspectSubnet(const std::string& network) override { return inner_.InspectSubnet(network); }
  AttachOutcome ConnectContainer(const std::string& network, const std::string& container, const std::string& address) override {
    return inner_.ConnectContainer(network, container, address);
  }
  void DisconnectContainer(const std::string& network, const std::string& container) override {
    inner_.DisconnectContainer(network, container);
  }
  void RemoveNetwork(const std::string& network) override { inner_.RemoveNetwork(network); }

  void WaitEntered() {
    std::unique_lock lock(mu_);
    cv_.wait(lock, [&] { return entered_; });
  }
  void Release(bool fail) {
    std::lock_guard lock(mu_);
    released_ = true;
    fail_     = fail;
    cv_.notify_all();
  }

 private:
  MemoryNetworkDriver     inner_;
  std::mutex              mu_;
  std::condition_variable cv_;
  bool                    entered_  = false;
  bool                    released_ = false;
  bool                    fail_     = false;
};

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestAddressLayout() {
  Fixture f;
  const auto rec = f.allocator.Allocate("00000000-aaaa");

  assert(rec.network_name == "tenant-00000000-network");
  assert(rec.subnet_cidr == "10.10.0.0/24");
  assert(rec.gateway_address == "10.10.0.1");
  assert(rec.file_share_address == "10.10.0.2");
  assert(rec.vm_address == "10.10.0.3");
  assert(rec.relay_address == "10.10.0.4");
  assert(rec.state == AllocationState::kActive);
  assert(!rec.relay_attached);
  assert(f.driver->HasNetwork(rec.network_name));

  // Allocation is idempotent per tenant.
  const auto again = f.allocator.Allocate("00000000-aaaa");
  assert(again.subnet_cidr == rec.subnet_cidr);
  assert(f.allocator.List().size() == 1);

  const auto proto = NetworkAllocator::ToProto(rec);
  assert(proto.addresses().vm() == "10.10.0.3");
  assert(proto.state() == relay::v1::ALLOCATION_STATE_ACTIVE);
}

void TestTenantsAreDisjointAndSkipControlPlane() {
  Fixture f;
  const auto a = f.allocator.Allocate("00000000-aaaa");
  const auto b = f.allocator.Allocate("00000001-bbbb");  // prefers block 1
  const auto c = f.allocator.Allocate("00000003-cccc");

  assert(a.subnet_cidr == "10.10.0.0/24");
  assert(b.subnet_cidr == "10.10.2.0/24");
  assert(b.block_index == 2);
  assert(c.subnet_cidr == "10.10.3.0/24");

  // Only the control-plane block is left.
  assert(Throws<relay::util::ResourceExhausted>([&] { f.allocator.Allocate("00000002-dddd"); }));
}

void TestRelayAddressRetry() {
  Fixture f;
  f.driver->ReserveAddress("tenant-00000000-network", "10.10.0.4");
  f.allocator.Allocate("00000000-aaaa");

  const auto rec = f.allocator.AttachRelay("00000000-aaaa");
  assert(rec.relay_attached);
  assert(rec.relay_address == "10.10.0.14");
  assert(f.driver->AddressOf(rec.network_name, "tools-relay") == "10.10.0.14");
  assert(f.allocator.Get("00000000-aaaa").relay_address == "10.10.0.14");

  // Attaching twice keeps the recorded address.
  assert(f.allocator.AttachRelay("00000000-aaaa").relay_address == "10.10.0.14");

  for (const char* addr : {"10.10.3.4", "10.10.3.14", "10.10.3.24", "10.10.3.34"}) {
    f.driver->ReserveAddress("tenant-00000003-network", addr);
  }
  f.allocator.Allocate("00000003-cccc");
  assert(Throws<relay::util::ResourceExhausted>([&] { f.allocator.AttachRelay("00000003-cccc"); }));
  assert(!f.allocator.Get("00000003-cccc").relay_attached);
}

void TestTeardownHoldsBlockUntilConfirmed() {
  Fixture f;
  f.allocator.Allocate("00000000-aaaa");
  f.allocator.AttachRelay("00000000-aaaa");

  const auto released = f.allocator.Release("00000000-aaaa");
  assert(released.state == AllocationState::kPendingTeardown);
  assert(!released.relay_attached);
  assert(!f.driver->AddressOf(released.network_name, "tools-relay").has_value());

  // Release is idempotent; the tenant cannot re-allocate yet.
  assert(f.allocator.Release("00000000-aaaa").state == AllocationState::kPendingTeardown);
  assert(Throws<relay::util::InvalidState>([&] { f.allocator.Allocate("00000000-aaaa"); }));
  assert(Throws<relay::util::InvalidState>([&] { f.allocator.AttachRelay("00000000-aaaa"); }));

  // Another tenant preferring block 0 skips the pending block.
  assert(f.allocator.Allocate("00000004-eeee").subnet_cidr == "10.10.2.0/24");

  const auto removed = f.allocator.ConfirmTeardown("00000000-aaaa");
  assert(removed.subnet_cidr == "10.10.0.0/24");
  assert(!f.driver->HasNetwork("tenant-00000000-network"));
  assert(Throws<relay::util::NotFound>([&] { f.allocator.Get("00000000-aaaa"); }));

  assert(f.allocator.Allocate("00000008-ffff").subnet_cidr == "10.10.0.0/24");
}

void TestRejectedAllocationsLeaveNoRecord() {
  Fixture f;

  f.driver->OverrideSubnet("tenant-00000000-network", "10.99.0.0/24");
  assert(Throws<relay::util::InvalidState>([&] { f.allocator.Allocate("00000000-aaaa"); }));
  assert(f.allocator.List().empty());

  f.allocator.Allocate("abcdef01-1111");
  assert(Throws<relay::util::AlreadyExists>([&] { f.allocator.Allocate("abcdef01-2222"); }));
  assert(f.allocator.List().size() == 1);

  assert(Throws<relay::util::InvalidArgument>([&] { f.allocator.Allocate(""); }));
}

void RunWithStalledDriver(bool fail) {
  auto             repo   = std::make_shared<relay::db::memory::MemoryRepository>();
  auto             driver = std::make_shared<GatedDriver>();
  NetworkAllocator allocator(repo, driver, Fixture::Options());

  bool        threw = false;
  std::thread worker([&] {
    try {
      allocator.Allocate("00000000-aaaa");
    } catch (const std::runtime_error&) {
      threw = true;
    }
  });
  driver->WaitEntered();

  // The repository stays usable while the driver is stuck, and the
  // reservation is already visible.
  auto reader = std::async(std::launch::async, [&] {
    auto tx   = repo->Begin();
    auto recs = repo->ListNetworks(*tx);
    tx->Commit();
    return recs.size();
  });
  const bool ready = reader.wait_for(std::chrono::seconds(2)) == std::future_status::ready;

  driver->Release(fail);
  worker.join();

  assert(ready);
  assert(reader.get() == 1);
  assert(threw == fail);
  assert(allocator.List().size() == (fail ? 0u : 1u));
}

void TestDriverRunsOutsideTransactions() {
  RunWithStalledDriver(false);
  RunWithStalledDriver(true);
}

void TestLookupsOfUnknownTenants() {
  Fixture f;
  assert(Throws<relay::util::NotFound>([&] { f.allocator.Get("nobody"); }));
  assert(Throws<relay::util::NotFound>([&] { f.allocator.Release("nobody"); }));

  f.allocator.Allocate("00000000-aaaa");
  assert(Throws<relay::util::InvalidState>([&] { f.allocator.ConfirmTeardown("00000000-aaaa"); }));
}

} // namespace

int main() {
  TestAddressLayout();
  TestTenantsAreDisjointAndSkipControlPlane();
  TestRelayAddressRetry();
  TestTeardownHoldsBlockUntilConfirmed();
  TestRejectedAllocationsLeaveNoRecord();
  TestDriverRunsOutsideTransactions();
  TestLookupsOfUnknownTenants();

  std::cout << "relay_unit_network_allocator: pass\n";
  return 0;
}
