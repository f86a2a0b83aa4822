#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/story_element.hpp"
#include "internal/store/graph_store_adapter.hpp"
#include "internal/store/store_status.hpp"
#include "internal/util/time.hpp"

namespace storykb::store {

struct VectorUpsert {
  model::EntityIdentifier id;
  std::string             content;
  model::Properties       metadata;
};

/*
  Vector store seen by the coordinator. Same staging contract as
  GraphStoreAdapter; embedding the content is the store's business.
*/
class VectorStoreAdapter {
 public:
  virtual ~VectorStoreAdapter() = default;

  virtual std::string_view Name() const = 0;

  virtual StoreStatus PrepareUpsert(const VectorUpsert& upsert, util::Deadline deadline, StagingToken* token) = 0;
  virtual StoreStatus Commit(const StagingToken& token, util::Deadline deadline)                              = 0;
  virtual StoreStatus Discard(const StagingToken& token)                                                      = 0;

  virtual std::optional<model::VectorEntry> FindEntry(const model::EntityIdentifier& id) = 0;
};

} // namespace storykb::store
