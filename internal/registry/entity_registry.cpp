#include "entity_registry.hpp"

#include <functional>
#include <stdexcept>

#include "internal/db/api/transaction_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace storykb::registry {

namespace {

// An id collision on insert is retried with a fresh id this many times.
constexpr int kMaxIdAttempts = 4;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::Busy:
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
      throw util::TransientStoreError(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace

EntityRegistry::EntityRegistry(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("EntityRegistry: repository is null");
  }
}

std::mutex& EntityRegistry::KeyStripe(const std::string& natural_key) {
  return key_stripes_[std::hash<std::string>{}(natural_key) % kKeyStripes];
}

std::optional<model::EntityIdentifier> EntityRegistry::Cached(const std::string& natural_key) const {
  std::shared_lock lock(cache_mutex_);
  auto             it = by_key_.find(natural_key);
  if (it == by_key_.end()) return std::nullopt;
  return it->second;
}

void EntityRegistry::Remember(const std::string& natural_key, const model::EntityIdentifier& entity_id) {
  std::unique_lock lock(cache_mutex_);
  by_key_.emplace(natural_key, entity_id);
  by_id_.emplace(entity_id, natural_key);
}

model::EntityIdentifier EntityRegistry::ResolveOrCreate(const std::string& natural_key) {
  if (natural_key.empty()) {
    throw util::ValidationError("resolve entity: natural key must not be empty");
  }

  if (auto cached = Cached(natural_key)) {
    return *cached;
  }

  std::lock_guard key_lock(KeyStripe(natural_key));

  // another caller may have created it while we waited
  if (auto cached = Cached(natural_key)) {
    return *cached;
  }

  bool created = false;
  auto entity_id = db::RunInTransaction(*repository_, "resolve entity", [&](db::Transaction& tx) -> model::EntityIdentifier {
    created = false;
    if (auto existing = repository_->GetIdentityByKey(tx, natural_key)) {
      return existing->entity_id;
    }

    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
      db::model::IdentityRecord record;
      record.natural_key   = natural_key;
      record.entity_id     = util::NewId();
      record.created_at_ms = util::NowMillis();

      auto result = repository_->InsertIdentity(tx, record);
      if (result) {
        created = true;
        return record.entity_id;
      }
      if (result.code != db::ErrorCode::AlreadyExists) {
        ThrowIfDbError(result, "resolve entity");
      }

      // lost the race for the key: the winner's mapping is authoritative
      if (auto winner = repository_->GetIdentityByKey(tx, natural_key)) {
        return winner->entity_id;
      }
    }
    throw std::runtime_error("resolve entity: could not allocate a unique id for key " + natural_key);
  });

  if (created) {
    STORYKB_LOG_INFO("registered entity", {observability::StringField("natural_key", natural_key),
                                           observability::StringField("entity_id", entity_id)});
  }

  Remember(natural_key, entity_id);
  return entity_id;
}

std::optional<model::EntityIdentifier> EntityRegistry::Find(const std::string& natural_key) {
  if (auto cached = Cached(natural_key)) {
    return cached;
  }

  auto record = db::RunInTransaction(*repository_, "find entity",
                                     [&](db::Transaction& tx) { return repository_->GetIdentityByKey(tx, natural_key); });
  if (!record) return std::nullopt;

  Remember(record->natural_key, record->entity_id);
  return record->entity_id;
}

bool EntityRegistry::Contains(const model::EntityIdentifier& entity_id) {
  {
    std::shared_lock lock(cache_mutex_);
    if (by_id_.contains(entity_id)) return true;
  }

  auto record = db::RunInTransaction(*repository_, "lookup entity",
                                     [&](db::Transaction& tx) { return repository_->GetIdentityById(tx, entity_id); });
  if (!record) return false;

  Remember(record->natural_key, record->entity_id);
  return true;
}

} // namespace storykb::registry
