#pragma once

#include "internal/model/story_element.hpp"
#include "internal/store/graph_store_adapter.hpp"
#include "internal/store/vector_store_adapter.hpp"

namespace storykb::store {

/*
  Last-write-wins field merge shared by the reference stores.

  Both return true when a stored field changed, in which case the version
  was bumped. A brand-new record starts at version 1.
*/
bool MergeNode(model::GraphNode& stored, const GraphNodeUpsert& upsert);
bool MergeEntry(model::VectorEntry& stored, const VectorUpsert& upsert);

// Empty string when the op is well formed.
std::string ValidateGraphOp(const GraphOp& op);
std::string ValidateVectorUpsert(const VectorUpsert& upsert);

} // namespace storykb::store
