/**
 * @file test_inventory.cpp
 * @brief Tests for RuntimeInventory classification and RCU snapshot publication.
 *
 * Validates:
 *  - Matching containers take the engine's lifecycle state
 *  - Fingerprint mismatch and foreign name collisions are orphans owned by the service
 *  - Project-labelled leftovers are orphans; unrelated objects are invisible
 *  - Missing desired objects are reported absent
 *  - Unreachable runtime → Unavailable; snapshot()/version() follow refresh()
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "converge/config/constants.hpp"
#include "converge/runtime/inventory.hpp"
#include "converge/runtime/simulated_runtime.hpp"

namespace K = converge::config::constants;
using converge::model::ServiceSpec;
using converge::model::Topology;
using converge::runtime::Inventory;
using converge::runtime::InventoryRecord;
using converge::runtime::LifecycleState;
using converge::runtime::ObjectKind;
using converge::runtime::ObjectState;
using converge::runtime::RuntimeErrc;
using converge::runtime::RuntimeInventory;
using converge::runtime::RuntimeObject;
using converge::runtime::SimulatedRuntime;

namespace {

Topology demo_topology() {
  ServiceSpec db{.name = "db", .image = "postgres:16"};
  db.volumes.push_back({"demo-db", "/var/lib/postgresql/data"});
  ServiceSpec api{.name = "api", .image = "api:1"};
  api.depends_on = {"db"};
  return Topology{"demo", {db, api}};
}

/// Container as converge would have created it for `service`.
RuntimeObject ours(const Topology& t, const std::string& service, ObjectState state) {
  const auto* spec = t.find(service);
  RuntimeObject o;
  o.kind   = ObjectKind::Container;
  o.name   = t.container_name(service);
  o.image  = spec->image;
  o.state  = state;
  o.labels = {{std::string(K::LABEL_PROJECT), t.project()},
              {std::string(K::LABEL_SERVICE), service},
              {std::string(K::LABEL_FINGERPRINT), converge::model::fingerprint(*spec)}};
  return o;
}

const InventoryRecord* find(const Inventory& inv, ObjectKind kind, const std::string& name) {
  for (const auto& r : inv) {
    if (r.kind == kind && r.name == name) return &r;
  }
  return nullptr;
}

} // namespace

/**
 * @test Classify_EmptyRuntime_AllAbsent
 * @brief Zero observed objects is a valid empty state: everything desired is absent.
 */
TEST(RuntimeInventory, Classify_EmptyRuntime_AllAbsent) {
  const auto topo = demo_topology();
  const auto inv  = RuntimeInventory::classify(topo, {});

  ASSERT_EQ(inv.size(), 4u); // 2 containers, 1 network, 1 volume
  EXPECT_EQ(converge::runtime::count_state(inv, LifecycleState::Absent), 4u);

  const auto* api = find(inv, ObjectKind::Container, "demo-api");
  ASSERT_NE(api, nullptr);
  EXPECT_EQ(api->service, "api");
  EXPECT_NE(find(inv, ObjectKind::Network, "demo_default"), nullptr);
  EXPECT_NE(find(inv, ObjectKind::Volume, "demo-db"), nullptr);
}

/**
 * @test Classify_MatchingContainers_TakeEngineState
 */
TEST(RuntimeInventory, Classify_MatchingContainers_TakeEngineState) {
  const auto topo = demo_topology();
  const std::vector<RuntimeObject> observed{
      ours(topo, "db", ObjectState::Running),
      ours(topo, "api", ObjectState::Stopped),
      RuntimeObject{.kind = ObjectKind::Network, .name = "demo_default"},
  };
  const auto inv = RuntimeInventory::classify(topo, observed);

  EXPECT_EQ(find(inv, ObjectKind::Container, "demo-db")->state, LifecycleState::Running);
  EXPECT_EQ(find(inv, ObjectKind::Container, "demo-api")->state, LifecycleState::Stopped);
  EXPECT_EQ(find(inv, ObjectKind::Network, "demo_default")->state, LifecycleState::Running);
  EXPECT_EQ(find(inv, ObjectKind::Volume, "demo-db")->state, LifecycleState::Absent);
}

/**
 * @test Classify_StaleFingerprint_IsOrphanOwnedByService
 */
TEST(RuntimeInventory, Classify_StaleFingerprint_IsOrphanOwnedByService) {
  const auto topo = demo_topology();
  auto stale = ours(topo, "api", ObjectState::Running);
  stale.labels[std::string(K::LABEL_FINGERPRINT)] = "0000000000000000";

  const auto inv = RuntimeInventory::classify(topo, {stale});
  const auto* rec = find(inv, ObjectKind::Container, "demo-api");
  ASSERT_NE(rec, nullptr);
  EXPECT_EQ(rec->state, LifecycleState::Orphaned);
  EXPECT_EQ(rec->service, "api");
  EXPECT_TRUE(rec->running);
  EXPECT_NE(rec->reason.find("stale definition"), std::string::npos);
  // The orphan occupies the name, so no separate absent record is emitted for it.
  EXPECT_EQ(std::count_if(inv.begin(), inv.end(), [](const InventoryRecord& r) { return r.name == "demo-api"; }), 1);
}

/**
 * @test Classify_ForeignNameCollision_IsOrphan
 * @brief A container with a desired name but no converge labels is in the way.
 */
TEST(RuntimeInventory, Classify_ForeignNameCollision_IsOrphan) {
  const auto topo = demo_topology();
  RuntimeObject foreign{.kind = ObjectKind::Container, .name = "demo-db", .image = "mysql",
                        .state = ObjectState::Stopped};
  const auto inv = RuntimeInventory::classify(topo, {foreign});
  const auto* rec = find(inv, ObjectKind::Container, "demo-db");
  ASSERT_NE(rec, nullptr);
  EXPECT_EQ(rec->state, LifecycleState::Orphaned);
  EXPECT_FALSE(rec->running);
  EXPECT_NE(rec->reason.find("not created by converge"), std::string::npos);
}

/**
 * @test Classify_ProjectLeftovers_OrphanedAndOthersIgnored
 */
TEST(RuntimeInventory, Classify_ProjectLeftovers_OrphanedAndOthersIgnored) {
  const auto topo = demo_topology();
  RuntimeObject leftover{.kind = ObjectKind::Container, .name = "demo-worker", .image = "w",
                         .state = ObjectState::Running,
                         .labels = {{std::string(K::LABEL_PROJECT), "demo"}}};
  RuntimeObject old_volume{.kind = ObjectKind::Volume, .name = "demo-cache",
                           .labels = {{std::string(K::LABEL_PROJECT), "demo"}}};
  RuntimeObject unrelated{.kind = ObjectKind::Container, .name = "other-web", .image = "nginx",
                          .labels = {{std::string(K::LABEL_PROJECT), "other"}}};

  const auto inv = RuntimeInventory::classify(topo, {leftover, old_volume, unrelated});
  EXPECT_EQ(find(inv, ObjectKind::Container, "demo-worker")->state, LifecycleState::Orphaned);
  EXPECT_TRUE(find(inv, ObjectKind::Container, "demo-worker")->service.empty());
  EXPECT_EQ(find(inv, ObjectKind::Volume, "demo-cache")->state, LifecycleState::Orphaned);
  EXPECT_EQ(find(inv, ObjectKind::Container, "other-web"), nullptr);
}

/**
 * @test Classify_SortedByKindThenName
 */
TEST(RuntimeInventory, Classify_SortedByKindThenName) {
  const auto inv = RuntimeInventory::classify(demo_topology(), {});
  ASSERT_EQ(inv.size(), 4u);
  EXPECT_EQ(inv[0].name, "demo-api");
  EXPECT_EQ(inv[1].name, "demo-db");
  EXPECT_EQ(inv[2].kind, ObjectKind::Network);
  EXPECT_EQ(inv[3].kind, ObjectKind::Volume);
}

/**
 * @test Refresh_PublishesSnapshotAndVersion
 */
TEST(RuntimeInventory, Refresh_PublishesSnapshotAndVersion) {
  SimulatedRuntime rt;
  RuntimeInventory inv(rt, demo_topology());
  ASSERT_TRUE(inv.snapshot());
  EXPECT_TRUE(inv.snapshot()->empty());
  EXPECT_EQ(inv.version(), 0u);

  auto first = inv.refresh();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(inv.version(), 1u);
  EXPECT_EQ(*inv.snapshot(), *first);

  rt.seed(ours(inv.topology(), "db", ObjectState::Running));
  auto held = inv.snapshot();          // reader keeps the old view alive
  auto second = inv.refresh();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(inv.version(), 2u);
  EXPECT_EQ(find(*held, ObjectKind::Container, "demo-db")->state, LifecycleState::Absent);
  EXPECT_EQ(find(*inv.snapshot(), ObjectKind::Container, "demo-db")->state, LifecycleState::Running);
}

/**
 * @test Refresh_UnreachableRuntime_IsUnavailable
 * @brief Distinct from "zero objects found"; the previous snapshot is kept.
 */
TEST(RuntimeInventory, Refresh_UnreachableRuntime_IsUnavailable) {
  SimulatedRuntime rt;
  RuntimeInventory inv(rt, demo_topology());
  ASSERT_TRUE(inv.refresh().has_value());

  rt.set_available(false);
  auto r = inv.refresh();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, RuntimeErrc::Unavailable);
  EXPECT_EQ(inv.version(), 1u);
  EXPECT_EQ(inv.snapshot()->size(), 4u);
}

/**
 * @test Snapshot_ReadersDuringRefresh_SeeWholeInventories
 * @brief No torn reads under 1 refresher / many readers.
 */
TEST(RuntimeInventory, Snapshot_ReadersDuringRefresh_SeeWholeInventories) {
  SimulatedRuntime rt;
  RuntimeInventory inv(rt, demo_topology());
  std::atomic<bool> stop{false};
  std::atomic<int> torn{0};

  std::vector<std::thread> readers;
  for (int i = 0; i < 4; ++i) {
    readers.emplace_back([&] {
      while (!stop.load(std::memory_order_relaxed)) {
        const auto snap = inv.snapshot();
        if (!snap->empty() && snap->size() != 4u) torn.fetch_add(1);
      }
    });
  }
  for (int i = 0; i < 200; ++i) ASSERT_TRUE(inv.refresh().has_value());
  stop = true;
  for (auto& t : readers) t.join();
  EXPECT_EQ(torn.load(), 0);
  EXPECT_EQ(inv.version(), 200u);
}
