#include "internal/reconcile/reconciliation_sweeper.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "internal/ledger/change_payload_codec.hpp"
#include "internal/util/content_hash.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "tests/support/test_runtime.hpp"

namespace {

using namespace std::chrono_literals;
using storykb::model::ChangeStatus;
using storykb::reconcile::ReconciliationSweeper;
using storykb::reconcile::SweeperOptions;
using storykb::testing::FaultScript;
using storykb::testing::Internal;
using storykb::testing::TestRuntime;

constexpr const char* kSarah = "Sarah is a 28-year-old software engineer";

std::unique_ptr<ReconciliationSweeper> MakeSweeper(TestRuntime& rt, std::chrono::milliseconds interval = 1h, std::size_t batch_size = 16) {
  SweeperOptions options;
  options.interval          = interval;
  options.batch_size        = batch_size;
  options.operation_timeout = 1s;
  return std::make_unique<ReconciliationSweeper>(rt.ledger, rt.graph, rt.vector, rt.coordinator, options);
}

// Leaves the entity with a committed graph node and no vector entry.
std::string PartiallyCommit(TestRuntime& rt, const std::string& content) {
  rt.vector->Script([](FaultScript& s) { s.commit.push_back(Internal("vector index crashed")); });
  try {
    rt.kb->UpdateStoryElement("character", content, {}, std::string("character:sarah"));
  } catch (const storykb::util::ReconciliationRequired& e) {
    return e.EntityId();
  }
  assert(false && "expected a partial commit");
  return {};
}

void TestSweepCompletesVectorUpsert() {
  TestRuntime rt;
  const auto  id      = PartiallyCommit(rt, kSarah);
  auto        sweeper = MakeSweeper(rt);
  assert(!rt.vector->FindEntry(id).has_value());

  const auto stats = sweeper->SweepOnce();
  assert(stats.examined == 1);
  assert(stats.converged == 1);

  assert(rt.vector->FindEntry(id)->content == kSarah);
  assert(rt.graph->Inner().NodeCount() == 1);
  assert(rt.graph->FindNode(id)->content_hash == storykb::util::ContentHash(kSarah));
  assert(rt.ledger->PendingReconciliation(0).empty());

  const auto history = rt.ledger->History(id);
  assert(history.back().status == ChangeStatus::kCommitted);
  assert(history.back().phase == "reconcile");
  assert(history.back().adapter == "vector");

  // sweeping again is a no-op
  assert(sweeper->SweepOnce().examined == 0);
}

void TestSupersededRepairIsClosedWithoutReapplying() {
  TestRuntime rt;
  const auto  id = PartiallyCommit(rt, kSarah);

  // a later write for the same entity lands in both stores
  rt.kb->UpdateStoryElement("character", "Sarah is 29 and lives in Lisbon", {}, std::string("character:sarah"));

  auto       sweeper = MakeSweeper(rt);
  const auto stats   = sweeper->SweepOnce();
  assert(stats.superseded == 1);
  assert(rt.vector->FindEntry(id)->content == "Sarah is 29 and lives in Lisbon");
  assert(rt.ledger->PendingReconciliation(0).empty());
  assert(rt.ledger->History(id).back().status == ChangeStatus::kCommitted);
}

void TestFailedRepairStaysOpen() {
  TestRuntime rt;
  const auto  id      = PartiallyCommit(rt, kSarah);
  auto        sweeper = MakeSweeper(rt);

  rt.vector->Script([](FaultScript& s) { s.prepare.push_back(Internal("still down")); });
  auto stats = sweeper->SweepOnce();
  assert(stats.failed == 1);
  assert(rt.ledger->PendingReconciliation(0).size() == 1);
  assert(!rt.vector->FindEntry(id).has_value());

  stats = sweeper->SweepOnce();
  assert(stats.converged == 1);
  assert(rt.vector->FindEntry(id).has_value());
}

void TestLockedEntityIsSkipped() {
  TestRuntime rt;
  const auto  id      = PartiallyCommit(rt, kSarah);
  auto        sweeper = MakeSweeper(rt);

  {
    auto held  = rt.coordinator->Locks().Acquire(id, storykb::lock::ConflictPolicy::kFailFast, 0ms);
    auto stats = sweeper->SweepOnce();
    assert(stats.skipped == 1);
    assert(rt.ledger->PendingReconciliation(0).size() == 1);
  }

  assert(sweeper->SweepOnce().converged == 1);
}

void TestLeftoverStageIsDiscarded() {
  TestRuntime rt;
  rt.vector->Script([](FaultScript& s) { s.prepare.push_back(Internal("rejected")); });
  rt.graph->Script([](FaultScript& s) { s.discard.push_back(Internal("graph unreachable")); });

  std::string id;
  try {
    rt.kb->UpdateStoryElement("character", kSarah);
  } catch (const storykb::util::ReconciliationRequired& e) {
    id = e.EntityId();
  }
  assert(!id.empty());
  assert(rt.graph->Inner().StagedCount() == 1);

  auto sweeper = MakeSweeper(rt);
  assert(sweeper->SweepOnce().converged == 1);
  assert(rt.graph->Inner().StagedCount() == 0);
  assert(!rt.graph->FindNode(id).has_value());
  assert(rt.ledger->History(id).back().status == ChangeStatus::kRolledBack);
}

void TestEveryLeftoverStageIsDiscarded() {
  TestRuntime rt;
  const auto  id     = storykb::util::NewId();
  auto        handle = rt.coordinator->Begin(id, storykb::model::ChangeType::kContent);
  rt.coordinator->StageVectorOp(*handle, storykb::store::VectorUpsert{id, kSarah, {}});
  rt.coordinator->StageGraphOp(*handle, storykb::store::GraphNodeUpsert{id, "character", storykb::util::ContentHash(kSarah), {}});
  rt.coordinator->Prepare(*handle, storykb::util::DeadlineAfter(1s));

  rt.graph->Script([](FaultScript& s) { s.discard.push_back(Internal("graph unreachable")); });
  rt.vector->Script([](FaultScript& s) { s.discard.push_back(Internal("vector unreachable")); });
  bool partial = false;
  try {
    rt.coordinator->Rollback(*handle);
  } catch (const storykb::util::ReconciliationRequired&) {
    partial = true;
  }
  assert(partial);
  assert(rt.graph->Inner().StagedCount() == 1);
  assert(rt.vector->Inner().StagedCount() == 1);

  auto sweeper = MakeSweeper(rt);
  assert(sweeper->SweepOnce().converged == 1);
  assert(rt.graph->Inner().StagedCount() == 0);
  assert(rt.vector->Inner().StagedCount() == 0);
  assert(!rt.graph->FindNode(id).has_value());
  assert(!rt.vector->FindEntry(id).has_value());
  assert(rt.ledger->Latest(handle->TransactionId())->status == ChangeStatus::kRolledBack);
}

// Appends a pending record and a reconciliation record carrying `payload_json`.
std::string RecordBrokenRepair(TestRuntime& rt, const std::string& payload_json) {
  storykb::model::ChangeEvent event;
  event.transaction_id = storykb::util::NewId();
  event.entity_id      = storykb::util::NewId();
  event.change_type    = storykb::model::ChangeType::kContent;
  event.status         = ChangeStatus::kPending;
  event.phase          = "prepare";
  rt.ledger->Record(event);

  event.status  = ChangeStatus::kReconciliationRequired;
  event.phase   = "commit";
  event.payload = payload_json;
  rt.ledger->Record(event);
  return event.transaction_id;
}

void TestUnrepairableRecordIsClosedAsFailed() {
  TestRuntime rt;

  storykb::ledger::v1::ChangePayload foreign;
  foreign.set_action(storykb::ledger::v1::RECONCILE_ACTION_DISCARD_STAGE);
  auto* stage = foreign.add_leftover_stages();
  stage->set_adapter("neo4j");
  stage->set_staging_token("tx-17");
  const auto foreign_tx = RecordBrokenRepair(rt, storykb::ledger::EncodePayload(foreign));
  const auto garbled_tx = RecordBrokenRepair(rt, "{\"action\": ");
  const auto no_action  = RecordBrokenRepair(rt, storykb::ledger::EncodePayload(storykb::ledger::v1::ChangePayload{}));
  const auto id         = PartiallyCommit(rt, kSarah);

  // one record per pass, broken ones first in ledger order
  auto sweeper = MakeSweeper(rt, 1h, 1);

  auto stats = sweeper->SweepOnce();
  assert(stats.unrepairable == 1);
  assert(stats.failed == 0);
  stats = sweeper->SweepOnce();
  assert(stats.unrepairable == 1);
  stats = sweeper->SweepOnce();
  assert(stats.unrepairable == 1);
  stats = sweeper->SweepOnce();
  assert(stats.converged == 1);

  assert(rt.vector->FindEntry(id)->content == kSarah);
  assert(rt.ledger->PendingReconciliation(0).empty());

  for (const auto& tx : {foreign_tx, garbled_tx, no_action}) {
    const auto latest = rt.ledger->Latest(tx);
    assert(latest->status == ChangeStatus::kFailed);
    assert(latest->phase == "reconcile");
    assert(latest->detail.find("unrepairable") != std::string::npos);
  }
  assert(rt.ledger->Latest(foreign_tx)->detail.find("neo4j") != std::string::npos);
  assert(sweeper->SweepOnce().examined == 0);
}

void TestBackgroundLoopConverges() {
  TestRuntime rt;
  const auto  id      = PartiallyCommit(rt, kSarah);
  auto        sweeper = MakeSweeper(rt, 10ms);

  sweeper->Start();
  const auto give_up = std::chrono::steady_clock::now() + 5s;
  while (!rt.ledger->PendingReconciliation(0).empty() && std::chrono::steady_clock::now() < give_up) {
    std::this_thread::sleep_for(5ms);
  }
  sweeper->Stop();
  sweeper->Stop();

  assert(rt.ledger->PendingReconciliation(0).empty());
  assert(rt.vector->FindEntry(id).has_value());
}

} // namespace

int main() {
  TestSweepCompletesVectorUpsert();
  TestSupersededRepairIsClosedWithoutReapplying();
  TestFailedRepairStaysOpen();
  TestLockedEntityIsSkipped();
  TestLeftoverStageIsDiscarded();
  TestEveryLeftoverStageIsDiscarded();
  TestUnrepairableRecordIsClosedAsFailed();
  TestBackgroundLoopConverges();

  std::cout << "storykb_unit_reconciliation_sweeper: pass\n";
  return 0;
}
