#include "internal/worker/update_executor.hpp"

#include <cassert>
#include <future>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "internal/worker/update_queue.hpp"
#include "tests/support/test_runtime.hpp"

namespace {

using storykb::testing::TestRuntime;
using storykb::worker::UpdateExecutor;
using storykb::worker::UpdateQueue;
using storykb::worker::UpdateTask;

void TestQueueDrainsAfterShutdown() {
  UpdateQueue queue(4);
  int         ran = 0;
  assert(queue.Enqueue(UpdateTask{"a", [&] { ++ran; }}));
  assert(queue.Enqueue(UpdateTask{"b", [&] { ++ran; }}));
  assert(queue.Size() == 2);

  queue.Shutdown();
  assert(!queue.Enqueue(UpdateTask{"c", [&] { ++ran; }}));

  while (auto task = queue.Dequeue()) task->run();
  assert(ran == 2);
  assert(queue.Size() == 0);
}

void TestWritesRunOnWorkers() {
  TestRuntime    rt;
  UpdateExecutor executor(rt.kb, 4, 16);
  executor.Start();
  assert(executor.ThreadCount() == 4);

  std::vector<std::future<std::string>> pending;
  for (int i = 0; i < 12; ++i) {
    pending.push_back(executor.SubmitStoryElement("event", "Chapter " + std::to_string(i) + ": the storm breaks"));
  }

  std::set<std::string> ids;
  for (auto& f : pending) ids.insert(f.get());
  assert(ids.size() == 12);
  assert(rt.graph->Inner().NodeCount() == 12);
  assert(rt.vector->Inner().EntryCount() == 12);

  const auto source = *ids.begin();
  const auto target = *ids.rbegin();
  executor.SubmitLink(source, {{target, "PRECEDES"}}).get();
  executor.SubmitElementProperties(source, "event", {{"chapter", "1"}}).get();
  assert(rt.graph->FindRelationships(source).size() == 1);
  assert(rt.graph->FindNode(source)->properties.at("chapter") == "1");

  executor.Stop();
}

void TestErrorsReachTheFuture() {
  TestRuntime    rt;
  UpdateExecutor executor(rt.kb, 2);
  executor.Start();

  auto missing = executor.SubmitElementProperties(storykb::util::NewId(), "character", {{"age", "28"}});
  bool threw   = false;
  try {
    missing.get();
  } catch (const storykb::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  auto invalid = executor.SubmitStoryElement("", "no type");
  threw        = false;
  try {
    invalid.get();
  } catch (const storykb::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  // a failed task does not take a worker down
  assert(!executor.SubmitStoryElement("character", "Tom").get().empty());
  executor.Stop();
}

void TestSubmitAfterStopThrows() {
  TestRuntime    rt;
  UpdateExecutor executor(rt.kb, 1);
  executor.Start();
  auto queued = executor.SubmitStoryElement("character", "Sarah");
  executor.Stop();

  // queued work still ran before the workers exited
  assert(!queued.get().empty());

  bool threw = false;
  try {
    executor.SubmitStoryElement("character", "Tom");
  } catch (const storykb::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestQueueDrainsAfterShutdown();
  TestWritesRunOnWorkers();
  TestErrorsReachTheFuture();
  TestSubmitAfterStopThrows();

  std::cout << "storykb_unit_update_executor: pass\n";
  return 0;
}
