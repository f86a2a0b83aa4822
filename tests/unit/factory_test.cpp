#include "internal/factory.hpp"

#include <cassert>
#include <iostream>

#include "internal/config/config_loader.hpp"

namespace {

using storykb::config::ConfigLoader;
using storykb::factory::Build;
using storykb::factory::StartReconciler;

void TestMemoryRuntimeIsWired() {
  auto app = Build(ConfigLoader::LoadFromYamlString(""));
  assert(app.repository && app.registry && app.ledger);
  assert(app.graph_store->Name() == "graph");
  assert(app.vector_store->Name() == "vector");
  assert(app.coordinator && app.knowledge_base);

  // built, not started
  assert(!app.executor->Running());
  assert(!app.sweeper->Running());
}

void TestDaemonStartsOnlyTheSweeper() {
  auto config = ConfigLoader::LoadFromYamlString("reconciler:\n  enabled: true\n  interval_ms: 3600000\n");
  auto app    = Build(config);

  assert(StartReconciler(app, config));
  assert(app.sweeper->Running());
  assert(!app.executor->Running());

  app.sweeper->Stop();
  assert(!app.sweeper->Running());
}

void TestDisabledReconcilerStartsNothing() {
  auto config = ConfigLoader::LoadFromYamlString("");
  auto app    = Build(config);

  assert(!StartReconciler(app, config));
  assert(!app.sweeper->Running());
  assert(!app.executor->Running());
}

} // namespace

int main() {
  TestMemoryRuntimeIsWired();
  TestDaemonStartsOnlyTheSweeper();
  TestDisabledReconcilerStartsNothing();

  std::cout << "storykb_unit_factory: pass\n";
  return 0;
}
