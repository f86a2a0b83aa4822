#include "internal/kb/unified_knowledge_base.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/content_hash.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "tests/support/test_runtime.hpp"

namespace {

using storykb::model::ChangeStatus;
using storykb::model::RelationshipSpec;
using storykb::testing::FaultScript;
using storykb::testing::Internal;
using storykb::testing::TestRuntime;
using storykb::util::ContentHash;

constexpr const char* kSarah = "Sarah is a 28-year-old software engineer";

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestSarahScenario() {
  TestRuntime rt;

  const auto id = rt.kb->UpdateStoryElement("character", kSarah);
  assert(storykb::util::IsCanonicalUUID(id));

  auto node  = rt.graph->FindNode(id);
  auto entry = rt.vector->FindEntry(id);
  assert(node.has_value());
  assert(node->type == "character");
  assert(node->content_hash == ContentHash(kSarah));
  assert(entry.has_value());
  assert(entry->content == kSarah);
  assert(entry->metadata.at("type") == "character");

  // repeating the write resolves the same id and changes nothing
  const auto again = rt.kb->UpdateStoryElement("character", kSarah);
  assert(again == id);
  assert(rt.graph->FindNode(id)->version == node->version);
  assert(rt.vector->FindEntry(id)->version == entry->version);
  assert(rt.graph->Inner().NodeCount() == 1);
  assert(rt.vector->Inner().EntryCount() == 1);

  const auto timeline = rt.kb->Timeline(id);
  assert(timeline.size() == 4);
  assert(timeline[1].status == ChangeStatus::kCommitted);
  assert(timeline[3].status == ChangeStatus::kCommitted);
}

void TestNaturalKeyKeepsIdentityAcrossContentChanges() {
  TestRuntime rt;

  const auto first  = rt.kb->UpdateStoryElement("character", kSarah, {}, std::string("character:sarah"));
  const auto second = rt.kb->UpdateStoryElement("character", "Sarah is now 29", {}, std::string("character:sarah"));
  assert(first == second);
  assert(rt.graph->FindNode(first)->content_hash == ContentHash("Sarah is now 29"));
  assert(rt.vector->FindEntry(first)->content == "Sarah is now 29");
  assert(rt.vector->FindEntry(first)->version == 2);
}

void TestDuplicateRelationshipIsStoredOnce() {
  TestRuntime rt;
  const auto  tom   = rt.kb->UpdateStoryElement("character", "Tom is Sarah's brother");
  const auto  sarah = rt.kb->UpdateStoryElement("character", kSarah, {{tom, "SIBLING_OF"}, {tom, "SIBLING_OF"}});
  rt.kb->LinkElements(sarah, {{tom, "SIBLING_OF"}});

  const auto edges = rt.graph->FindRelationships(sarah);
  assert(edges.size() == 1);
  assert(edges[0].target_id == tom);
  assert(edges[0].type == "SIBLING_OF");
}

void TestConcurrentWritesOfOneKeyShareAnId() {
  TestRuntime rt;

  constexpr int            kThreads = 6;
  std::vector<std::string> ids(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      ids[i] = rt.kb->UpdateStoryElement("location", "Harbor, draft " + std::to_string(i), {}, std::string("location:harbor"));
    });
  }
  for (auto& t : threads) t.join();

  assert(std::set<std::string>(ids.begin(), ids.end()).size() == 1);
  assert(rt.graph->Inner().NodeCount() == 1);
  assert(rt.vector->Inner().EntryCount() == 1);

  // writes were linearized: the stores agree on the last one
  const auto content = rt.vector->FindEntry(ids[0])->content;
  assert(rt.graph->FindNode(ids[0])->content_hash == ContentHash(content));

  std::size_t committed = 0;
  for (const auto& event : rt.kb->Timeline(ids[0])) {
    if (event.status == ChangeStatus::kCommitted) ++committed;
  }
  assert(committed == kThreads);
}

void TestPropertyUpdatesMergeIntoTheNode() {
  TestRuntime rt;
  const auto  id = rt.kb->UpdateStoryElement("character", kSarah);

  rt.kb->UpdateElementProperties(id, "character", {{"age", "28"}, {"occupation", "software engineer"}});
  rt.kb->UpdateElementProperties(id, "character", {{"mood", "determined"}});

  auto node = rt.graph->FindNode(id);
  assert(node->content_hash == ContentHash(kSarah));
  assert(node->properties.size() == 3);
  assert(node->properties.at("age") == "28");
  assert(node->properties.at("mood") == "determined");
  // graph-only write: the vector entry is untouched
  assert(rt.vector->FindEntry(id)->version == 1);

  assert(Throws<storykb::util::NotFound>(
      [&] { rt.kb->UpdateElementProperties(storykb::util::NewId(), "character", {{"age", "1"}}); }));
  assert(Throws<storykb::util::ValidationError>([&] { rt.kb->UpdateElementProperties(id, "character", {}); }));
}

void TestInvalidInputIsRejectedBeforeAnyWrite() {
  TestRuntime rt;
  assert(Throws<storykb::util::ValidationError>([&] { rt.kb->UpdateStoryElement("", kSarah); }));
  assert(Throws<storykb::util::ValidationError>([&] { rt.kb->UpdateStoryElement("character", kSarah, {{"tom", "KNOWS"}}); }));
  assert(Throws<storykb::util::ValidationError>(
      [&] { rt.kb->UpdateStoryElement("character", kSarah, {{storykb::util::NewId(), ""}}); }));
  assert(Throws<storykb::util::NotFound>(
      [&] { rt.kb->LinkElements(storykb::util::NewId(), {{storykb::util::NewId(), "KNOWS"}}); }));
  assert(rt.graph->Snapshot().prepare_calls == 0);
  assert(rt.vector->Snapshot().prepare_calls == 0);
}

void TestFailedWriteLeavesBothStoresUnchanged() {
  TestRuntime rt;
  const auto  id = rt.kb->UpdateStoryElement("character", kSarah, {}, std::string("character:sarah"));

  rt.vector->Script([](FaultScript& s) { s.prepare.push_back(Internal("embedding failed")); });
  assert(Throws<storykb::util::AbortedError>(
      [&] { rt.kb->UpdateStoryElement("character", "Sarah moved to Lisbon", {}, std::string("character:sarah")); }));

  assert(rt.graph->FindNode(id)->content_hash == ContentHash(kSarah));
  assert(rt.vector->FindEntry(id)->content == kSarah);

  // retrying from scratch is safe
  rt.kb->UpdateStoryElement("character", "Sarah moved to Lisbon", {}, std::string("character:sarah"));
  assert(rt.vector->FindEntry(id)->content == "Sarah moved to Lisbon");
}

} // namespace

int main() {
  TestSarahScenario();
  TestNaturalKeyKeepsIdentityAcrossContentChanges();
  TestDuplicateRelationshipIsStoredOnce();
  TestConcurrentWritesOfOneKeyShareAnId();
  TestPropertyUpdatesMergeIntoTheNode();
  TestInvalidInputIsRejectedBeforeAnyWrite();
  TestFailedWriteLeavesBothStoresUnchanged();

  std::cout << "storykb_unit_unified_knowledge_base: pass\n";
  return 0;
}
