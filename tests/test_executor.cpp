/**
 * @file test_executor.cpp
 * @brief Tests for ReconciliationExecutor against the simulated runtime.
 *
 * Validates:
 *  - Plan order is preserved and every action yields one result
 *  - Partial-failure isolation: dependents are Skipped, independents proceed
 *  - Readiness gate: unhealthy dependency skips the start, checked once per run
 *  - NotFound on stop/remove is success
 *  - Stop request skips every remaining action
 */

#include <gtest/gtest.h>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "converge/config/constants.hpp"
#include "converge/health/verifier.hpp"
#include "converge/plan/executor.hpp"
#include "converge/plan/planner.hpp"
#include "converge/runtime/inventory.hpp"
#include "converge/runtime/simulated_runtime.hpp"
#include "fake_prober.hpp"

using namespace std::chrono_literals;
using converge::health::DependencyHealthVerifier;
using converge::health::HealthStatus;
using converge::health::VerifyOptions;
using converge::model::HealthCheckDescriptor;
using converge::model::ServiceSpec;
using converge::model::Topology;
using converge::plan::Action;
using converge::plan::ActionKind;
using converge::plan::ActionOutcome;
using converge::plan::ActionResult;
using converge::plan::Plan;
using converge::plan::ReconciliationExecutor;
using converge::plan::ReconciliationPlanner;
using converge::runtime::ObjectKind;
using converge::runtime::ObjectState;
using converge::runtime::RuntimeObject;
using converge::runtime::RuntimeErrc;
using converge::runtime::RuntimeError;
using converge::runtime::RuntimeInventory;
using converge::runtime::SimOp;
using converge::runtime::SimulatedRuntime;
using converge::testing::FakeMode;
using converge::testing::FakeProber;

namespace {

ServiceSpec svc(std::string name, std::vector<std::string> deps = {}, bool health = false) {
  ServiceSpec s{.name = name, .image = name + ":1"};
  s.depends_on = std::move(deps);
  if (health) {
    s.health = HealthCheckDescriptor{.target = name, .host = "127.0.0.1", .port = 1};
  }
  return s;
}

/// a ← b ← c chain plus an independent d.
Topology chain() {
  return Topology{"t", {svc("a"), svc("b", {"a"}), svc("c", {"b"}), svc("d")}};
}

Plan plan_for(const Topology& t, SimulatedRuntime& rt) {
  auto objects = rt.list();
  EXPECT_TRUE(objects.has_value());
  auto p = ReconciliationPlanner{}.plan(t, RuntimeInventory::classify(t, *objects));
  EXPECT_TRUE(p.has_value());
  return p ? *p : Plan{};
}

const ActionResult& result_for(const std::vector<ActionResult>& rs, const std::string& label) {
  for (const auto& r : rs) {
    if (r.action.label() == label) return r;
  }
  ADD_FAILURE() << "no result for " << label;
  static const ActionResult none{};
  return none;
}

VerifyOptions fast_options() {
  VerifyOptions o;
  o.timeout         = 300ms;
  o.poll_interval   = 10ms;
  o.max_attempts    = 3;
  o.attempt_timeout = 50ms;
  o.concurrency     = 2;
  return o;
}

} // namespace

/**
 * @test Execute_AllSucceed_InPlanOrder
 */
TEST(ReconciliationExecutor, Execute_AllSucceed_InPlanOrder) {
  SimulatedRuntime rt;
  const auto t = chain();
  const auto p = plan_for(t, rt);

  ReconciliationExecutor ex(rt);
  const auto report = ex.execute(p);
  ASSERT_EQ(report.results.size(), p.size());
  for (std::size_t i = 0; i < p.size(); ++i) {
    EXPECT_EQ(report.results[i].action, p[i]);
    EXPECT_EQ(report.results[i].outcome, ActionOutcome::Succeeded) << p[i].label();
  }
  EXPECT_FALSE(report.cancelled);
  EXPECT_TRUE(report.gates.empty());
  EXPECT_EQ(rt.journal().front(), "create:network:t_default");
}

/**
 * @test Execute_FailureIsolation_DependentsSkipped
 * @brief If b's create fails, c (transitively dependent) is Skipped; a and d still succeed.
 */
TEST(ReconciliationExecutor, Execute_FailureIsolation_DependentsSkipped) {
  SimulatedRuntime rt;
  const auto t = chain();
  const auto p = plan_for(t, rt);
  rt.inject_failure(SimOp::Create, "t-b", RuntimeError{RuntimeErrc::Failed, "image pull failed"});

  ReconciliationExecutor ex(rt);
  const auto rs = ex.execute(p).results;

  EXPECT_EQ(result_for(rs, "create container t-a").outcome, ActionOutcome::Succeeded);
  EXPECT_EQ(result_for(rs, "start container t-a").outcome, ActionOutcome::Succeeded);
  EXPECT_EQ(result_for(rs, "create container t-d").outcome, ActionOutcome::Succeeded);
  EXPECT_EQ(result_for(rs, "start container t-d").outcome, ActionOutcome::Succeeded);

  const auto& create_b = result_for(rs, "create container t-b");
  EXPECT_EQ(create_b.outcome, ActionOutcome::Failed);
  EXPECT_EQ(create_b.error, "Failed: image pull failed");

  const auto& start_b = result_for(rs, "start container t-b");
  EXPECT_EQ(start_b.outcome, ActionOutcome::Skipped);
  EXPECT_EQ(start_b.error, "dependency failed: t-b");

  EXPECT_EQ(result_for(rs, "create container t-c").outcome, ActionOutcome::Skipped);
  EXPECT_EQ(result_for(rs, "create container t-c").error, "dependency failed: t-b");
  EXPECT_EQ(result_for(rs, "start container t-c").outcome, ActionOutcome::Skipped);
}

/**
 * @test Execute_NetworkFailure_SkipsEveryContainer
 */
TEST(ReconciliationExecutor, Execute_NetworkFailure_SkipsEveryContainer) {
  SimulatedRuntime rt;
  const auto t = chain();
  const auto p = plan_for(t, rt);
  rt.inject_failure(SimOp::Create, "t_default", RuntimeError{RuntimeErrc::Conflict, "pool overlaps"});

  const auto rs = ReconciliationExecutor(rt).execute(p).results;
  ASSERT_EQ(rs.front().outcome, ActionOutcome::Failed);
  for (std::size_t i = 1; i < rs.size(); ++i) {
    EXPECT_EQ(rs[i].outcome, ActionOutcome::Skipped) << rs[i].action.label();
  }
}

/**
 * @test Execute_FailedContainer_DoesNotBlockSameNamedVolume
 * @brief A leftover container and a desired volume share the name "demo-cache". The failed
 *        removal of the container must not skip the volume or the service mounting it.
 */
TEST(ReconciliationExecutor, Execute_FailedContainer_DoesNotBlockSameNamedVolume) {
  namespace K = converge::config::constants;
  SimulatedRuntime rt;
  rt.seed(RuntimeObject{.kind = ObjectKind::Container, .name = "demo-cache", .image = "redis:7",
                        .state = ObjectState::Stopped,
                        .labels = {{std::string(K::LABEL_PROJECT), "demo"},
                                   {std::string(K::LABEL_SERVICE), "cache"}}});
  rt.inject_failure(SimOp::Remove, "demo-cache", RuntimeError{RuntimeErrc::Failed, "device busy"});

  auto api = svc("api");
  api.volumes.push_back({"demo-cache", "/cache"});
  const Topology t{"demo", {api}};
  const auto p = plan_for(t, rt);

  const auto rs = ReconciliationExecutor(rt).execute(p).results;
  EXPECT_EQ(result_for(rs, "remove container demo-cache").outcome, ActionOutcome::Failed);
  EXPECT_EQ(result_for(rs, "create volume demo-cache").outcome, ActionOutcome::Succeeded);
  EXPECT_EQ(result_for(rs, "create container demo-api").outcome, ActionOutcome::Succeeded);
  EXPECT_EQ(result_for(rs, "start container demo-api").outcome, ActionOutcome::Succeeded);
}

/**
 * @test Execute_NotFoundOnStopRemove_IsSuccess
 */
TEST(ReconciliationExecutor, Execute_NotFoundOnStopRemove_IsSuccess) {
  SimulatedRuntime rt;
  const Plan p{
      Action{.kind = ActionKind::Stop, .object = ObjectKind::Container, .target = "gone"},
      Action{.kind = ActionKind::Remove, .object = ObjectKind::Container, .target = "gone"},
      Action{.kind = ActionKind::Remove, .object = ObjectKind::Volume, .target = "gone-vol"},
  };
  const auto rs = ReconciliationExecutor(rt).execute(p).results;
  for (const auto& r : rs) EXPECT_EQ(r.outcome, ActionOutcome::Succeeded) << r.action.label();
}

/**
 * @test Execute_StartOfMissingContainer_Fails
 * @brief NotFound is only forgiven for stop/remove.
 */
TEST(ReconciliationExecutor, Execute_StartOfMissingContainer_Fails) {
  SimulatedRuntime rt;
  const Plan p{Action{.kind = ActionKind::Start, .object = ObjectKind::Container, .target = "ghost"}};
  const auto rs = ReconciliationExecutor(rt).execute(p).results;
  ASSERT_EQ(rs.size(), 1u);
  EXPECT_EQ(rs[0].outcome, ActionOutcome::Failed);
  EXPECT_EQ(rs[0].error.rfind("NotFound: ", 0), 0u);
}

/**
 * @test Gate_UnhealthyDependency_SkipsStart
 * @brief Start of b is Skipped when a's readiness fails; c follows transitively.
 */
TEST(ReconciliationExecutor, Gate_UnhealthyDependency_SkipsStart) {
  SimulatedRuntime rt;
  const Topology t{"t", {svc("a", {}, true), svc("b", {"a"}), svc("c", {"b"})}};
  const auto p = plan_for(t, rt);

  auto prober = std::make_shared<FakeProber>();
  prober->set("a", FakeMode::Refused);
  const DependencyHealthVerifier gate(prober, fast_options());

  ReconciliationExecutor ex(rt, &gate);
  const auto report = ex.execute(p);

  EXPECT_EQ(result_for(report.results, "start container t-a").outcome, ActionOutcome::Succeeded);
  EXPECT_EQ(result_for(report.results, "create container t-b").outcome, ActionOutcome::Succeeded);
  const auto& start_b = result_for(report.results, "start container t-b");
  EXPECT_EQ(start_b.outcome, ActionOutcome::Skipped);
  EXPECT_EQ(start_b.error, "dependency unhealthy: a (unhealthy)");
  EXPECT_EQ(result_for(report.results, "create container t-c").error, "dependency failed: t-b");

  ASSERT_EQ(report.gates.size(), 1u);
  EXPECT_EQ(report.gates[0].target, "a");
  EXPECT_EQ(report.gates[0].status, HealthStatus::Unhealthy);
  EXPECT_EQ(report.gates[0].attempts, 3u);
}

/**
 * @test Gate_CheckedOncePerRun
 * @brief Two dependents of one healthy service share one cached readiness result.
 */
TEST(ReconciliationExecutor, Gate_CheckedOncePerRun) {
  SimulatedRuntime rt;
  const Topology t{"t", {svc("db", {}, true), svc("api", {"db"}), svc("jobs", {"db"})}};
  const auto p = plan_for(t, rt);

  auto prober = std::make_shared<FakeProber>();
  const DependencyHealthVerifier gate(prober, fast_options());
  ReconciliationExecutor ex(rt, &gate);
  const auto report = ex.execute(p);

  for (const auto& r : report.results) EXPECT_EQ(r.outcome, ActionOutcome::Succeeded) << r.action.label();
  EXPECT_EQ(report.gates.size(), 1u);
  EXPECT_EQ(prober->calls("db"), 1u);
}

/**
 * @test Gate_Disabled_StartsWithoutChecking
 */
TEST(ReconciliationExecutor, Gate_Disabled_StartsWithoutChecking) {
  SimulatedRuntime rt;
  const Topology t{"t", {svc("a", {}, true), svc("b", {"a"})}};
  const auto report = ReconciliationExecutor(rt).execute(plan_for(t, rt));
  for (const auto& r : report.results) EXPECT_EQ(r.outcome, ActionOutcome::Succeeded);
  EXPECT_TRUE(report.gates.empty());
}

/**
 * @test Execute_StopRequested_SkipsRemaining
 */
TEST(ReconciliationExecutor, Execute_StopRequested_SkipsRemaining) {
  SimulatedRuntime rt;
  const auto t = chain();
  const auto p = plan_for(t, rt);

  std::stop_source src;
  src.request_stop();
  const auto report = ReconciliationExecutor(rt).execute(p, src.get_token());
  EXPECT_TRUE(report.cancelled);
  ASSERT_EQ(report.results.size(), p.size());
  for (const auto& r : report.results) {
    EXPECT_EQ(r.outcome, ActionOutcome::Skipped);
    EXPECT_EQ(r.error, "cancelled");
  }
  EXPECT_TRUE(rt.journal().empty());
}

/**
 * @test Execute_SecondPass_IsEmpty
 * @brief Plan → Execute → Refresh twice: the second plan is empty.
 */
TEST(ReconciliationExecutor, Execute_SecondPass_IsEmpty) {
  SimulatedRuntime rt;
  const auto t = chain();
  const auto first = ReconciliationExecutor(rt).execute(plan_for(t, rt));
  for (const auto& r : first.results) ASSERT_EQ(r.outcome, ActionOutcome::Succeeded);
  EXPECT_TRUE(plan_for(t, rt).empty());
}
