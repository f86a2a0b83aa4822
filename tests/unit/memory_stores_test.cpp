#include "internal/store/memory/memory_graph_store.hpp"
#include "internal/store/memory/memory_vector_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/store/merge.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;
using storykb::model::Relationship;
using storykb::store::GraphNodeUpsert;
using storykb::store::GraphOp;
using storykb::store::GraphRelationshipUpsert;
using storykb::store::StagingToken;
using storykb::store::StoreErrorCode;
using storykb::store::VectorUpsert;
using storykb::store::memory::MemoryGraphStore;
using storykb::store::memory::MemoryVectorStore;
using storykb::util::DeadlineAfter;

void TestGraphStageIsInvisibleUntilCommit() {
  MemoryGraphStore graph;

  StagingToken token;
  assert(graph.PrepareWrite({GraphNodeUpsert{"n1", "character", std::string("h1"), {}}}, DeadlineAfter(1s), &token));
  assert(!graph.FindNode("n1").has_value());
  assert(graph.StagedCount() == 1);

  assert(graph.Commit(token, DeadlineAfter(1s)));
  auto node = graph.FindNode("n1");
  assert(node.has_value());
  assert(node->content_hash == "h1");
  assert(node->version == 1);
  assert(graph.StagedCount() == 0);

  // a finished token is gone
  assert(graph.Commit(token, DeadlineAfter(1s)).code == StoreErrorCode::kNotFound);
  assert(graph.Discard(token));
}

void TestGraphDiscardDropsStage() {
  MemoryGraphStore graph;

  StagingToken token;
  assert(graph.PrepareWrite({GraphNodeUpsert{"n1", "character", std::string("h1"), {}}}, DeadlineAfter(1s), &token));
  assert(graph.Discard(token));
  assert(graph.Discard(token));
  assert(!graph.FindNode("n1").has_value());
  assert(graph.NodeCount() == 0);
}

void TestGraphCommitAfterDeadlineKeepsStage() {
  MemoryGraphStore graph;

  StagingToken token;
  assert(graph.PrepareWrite({GraphNodeUpsert{"n1", "character", std::string("h1"), {}}}, DeadlineAfter(1s), &token));
  const auto late = graph.Commit(token, storykb::util::SteadyClock::now() - 1ms);
  assert(late.code == StoreErrorCode::kDeadlineExceeded);
  assert(late.IsTransient());
  assert(graph.StagedCount() == 1);
  assert(graph.Discard(token));
}

void TestEdgesAreDeduplicated() {
  MemoryGraphStore graph;
  const std::vector<GraphOp> ops = {
      GraphRelationshipUpsert{Relationship{"a", "b", "KNOWS"}},
      GraphRelationshipUpsert{Relationship{"a", "b", "KNOWS"}},
      GraphRelationshipUpsert{Relationship{"a", "c", "KNOWS"}},
  };

  for (int i = 0; i < 2; ++i) {
    StagingToken token;
    assert(graph.PrepareWrite(ops, DeadlineAfter(1s), &token));
    assert(graph.Commit(token, DeadlineAfter(1s)));
  }
  assert(graph.EdgeCount() == 2);
  assert(graph.FindRelationships("a").size() == 2);
  assert(graph.FindRelationships("b").empty());
}

void TestNodeMergeIsLastWriteWinsPerField() {
  MemoryGraphStore graph;

  auto apply = [&](const GraphNodeUpsert& upsert) {
    StagingToken token;
    assert(graph.PrepareWrite({upsert}, DeadlineAfter(1s), &token));
    assert(graph.Commit(token, DeadlineAfter(1s)));
  };

  apply(GraphNodeUpsert{"n1", "character", std::string("h1"), {{"age", "28"}}});
  apply(GraphNodeUpsert{"n1", "character", std::nullopt, {{"role", "engineer"}}});
  auto node = graph.FindNode("n1");
  assert(node->content_hash == "h1");
  assert(node->properties.at("age") == "28");
  assert(node->properties.at("role") == "engineer");
  assert(node->version == 2);

  // an identical upsert leaves the version alone
  apply(GraphNodeUpsert{"n1", "character", std::string("h1"), {{"age", "28"}}});
  assert(graph.FindNode("n1")->version == 2);

  apply(GraphNodeUpsert{"n1", "character", std::string("h2"), {{"age", "29"}}});
  node = graph.FindNode("n1");
  assert(node->content_hash == "h2");
  assert(node->properties.at("age") == "29");
  assert(node->version == 3);
}

void TestInvalidOpsAreRejected() {
  MemoryGraphStore graph;
  StagingToken     token;
  assert(graph.PrepareWrite({GraphRelationshipUpsert{Relationship{"a", "", "KNOWS"}}}, DeadlineAfter(1s), &token).code ==
         StoreErrorCode::kInvalidArgument);
  assert(graph.PrepareWrite({GraphNodeUpsert{"n1", "character", std::string(""), {}}}, DeadlineAfter(1s), &token).code ==
         StoreErrorCode::kInvalidArgument);
  assert(graph.PrepareWrite({GraphNodeUpsert{"n1", "character", std::nullopt, {}}}, DeadlineAfter(1s), nullptr).code ==
         StoreErrorCode::kInvalidArgument);
  assert(graph.StagedCount() == 0);
}

void TestVectorStageAndMerge() {
  MemoryVectorStore vector;

  StagingToken token;
  assert(vector.PrepareUpsert(VectorUpsert{"n1", "first text", {{"type", "character"}}}, DeadlineAfter(1s), &token));
  assert(!vector.FindEntry("n1").has_value());
  assert(vector.Commit(token, DeadlineAfter(1s)));

  auto entry = vector.FindEntry("n1");
  assert(entry->content == "first text");
  assert(entry->metadata.at("type") == "character");
  assert(entry->version == 1);

  assert(vector.PrepareUpsert(VectorUpsert{"n1", "first text", {{"type", "character"}}}, DeadlineAfter(1s), &token));
  assert(vector.Commit(token, DeadlineAfter(1s)));
  assert(vector.FindEntry("n1")->version == 1);

  assert(vector.PrepareUpsert(VectorUpsert{"n1", "second text", {}}, DeadlineAfter(1s), &token));
  assert(vector.Discard(token));
  assert(vector.FindEntry("n1")->content == "first text");
  assert(vector.EntryCount() == 1);
  assert(vector.StagedCount() == 0);

  assert(vector.PrepareUpsert(VectorUpsert{"", "x", {}}, DeadlineAfter(1s), &token).code == StoreErrorCode::kInvalidArgument);
  assert(vector.PrepareUpsert(VectorUpsert{"n2", "x", {}}, storykb::util::SteadyClock::now() - 1ms, &token).code ==
         StoreErrorCode::kDeadlineExceeded);
}

} // namespace

int main() {
  TestGraphStageIsInvisibleUntilCommit();
  TestGraphDiscardDropsStage();
  TestGraphCommitAfterDeadlineKeepsStage();
  TestEdgesAreDeduplicated();
  TestNodeMergeIsLastWriteWinsPerField();
  TestInvalidOpsAreRejected();
  TestVectorStageAndMerge();

  std::cout << "storykb_unit_memory_stores: pass\n";
  return 0;
}
