#include "internal/registry/entity_registry.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using storykb::db::memory::MemoryRepository;
using storykb::registry::EntityRegistry;

void TestSameKeySameId() {
  auto           repo = std::make_shared<MemoryRepository>();
  EntityRegistry registry(repo);

  const auto first  = registry.ResolveOrCreate("character:sarah");
  const auto second = registry.ResolveOrCreate("character:sarah");
  assert(first == second);
  assert(storykb::util::IsCanonicalUUID(first));

  const auto other = registry.ResolveOrCreate("character:tom");
  assert(other != first);

  assert(registry.Find("character:sarah") == first);
  assert(!registry.Find("character:nobody").has_value());
  assert(registry.Contains(first));
  assert(!registry.Contains(storykb::util::NewId()));
}

void TestMappingSurvivesNewRegistryInstance() {
  auto repo = std::make_shared<MemoryRepository>();

  std::string id;
  {
    EntityRegistry registry(repo);
    id = registry.ResolveOrCreate("location:harbor");
  }

  EntityRegistry reopened(repo);
  assert(reopened.Find("location:harbor") == id);
  assert(reopened.Contains(id));
  assert(reopened.ResolveOrCreate("location:harbor") == id);
}

void TestConcurrentFirstResolutionCreatesOneId() {
  auto repo = std::make_shared<MemoryRepository>();

  // two registries over one repository stand in for two processes
  EntityRegistry left(repo);
  EntityRegistry right(repo);

  constexpr int            kThreads = 8;
  std::vector<std::string> ids(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] { ids[i] = (i % 2 == 0 ? left : right).ResolveOrCreate("event:storm"); });
  }
  for (auto& t : threads) t.join();

  const std::set<std::string> distinct(ids.begin(), ids.end());
  assert(distinct.size() == 1);
}

void TestManyKeysResolveConsistently() {
  EntityRegistry registry(std::make_shared<MemoryRepository>());

  // more keys than lock stripes, resolved from two threads in the same order
  constexpr int            kKeys = 300;
  std::vector<std::string> left(kKeys);
  std::vector<std::string> right(kKeys);
  std::thread              a([&] {
    for (int i = 0; i < kKeys; ++i) left[i] = registry.ResolveOrCreate("scene:" + std::to_string(i));
  });
  std::thread b([&] {
    for (int i = 0; i < kKeys; ++i) right[i] = registry.ResolveOrCreate("scene:" + std::to_string(i));
  });
  a.join();
  b.join();

  assert(left == right);
  const std::set<std::string> distinct(left.begin(), left.end());
  assert(distinct.size() == kKeys);
  assert(registry.Find("scene:17") == left[17]);
}

void TestEmptyKeyIsRejected() {
  EntityRegistry registry(std::make_shared<MemoryRepository>());
  bool           threw = false;
  try {
    registry.ResolveOrCreate("");
  } catch (const storykb::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSameKeySameId();
  TestMappingSurvivesNewRegistryInstance();
  TestConcurrentFirstResolutionCreatesOneId();
  TestManyKeysResolveConsistently();
  TestEmptyKeyIsRejected();

  std::cout << "storykb_unit_entity_registry: pass\n";
  return 0;
}
