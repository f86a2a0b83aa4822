#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"
#include "internal/model/story_element.hpp"

namespace storykb::registry {

/*
  Maps natural keys to canonical entity identifiers.

  The same key always resolves to the same id. Concurrent first-time
  resolutions of one key produce exactly one id: callers in this process
  serialize on the key's lock stripe, and a racing writer in another process is
  caught by the repository's unique key (the loser re-reads the winner).
  Mappings are never removed.
*/
class EntityRegistry {
 public:
  explicit EntityRegistry(std::shared_ptr<db::Repository> repository);

  // ValidationError on an empty key.
  model::EntityIdentifier ResolveOrCreate(const std::string& natural_key);

  std::optional<model::EntityIdentifier> Find(const std::string& natural_key);

  bool Contains(const model::EntityIdentifier& entity_id);

 private:
  std::mutex& KeyStripe(const std::string& natural_key);
  std::optional<model::EntityIdentifier> Cached(const std::string& natural_key) const;
  void Remember(const std::string& natural_key, const model::EntityIdentifier& entity_id);

  std::shared_ptr<db::Repository> repository_;

  // Read-through cache. Safe because mappings are immutable once written.
  mutable std::shared_mutex                                cache_mutex_;
  std::unordered_map<std::string, model::EntityIdentifier> by_key_;
  std::unordered_map<model::EntityIdentifier, std::string> by_id_;

  // Distinct keys may share a stripe; that only serializes them.
  static constexpr std::size_t         kKeyStripes = 64;
  std::array<std::mutex, kKeyStripes> key_stripes_;
};

} // namespace storykb::registry
