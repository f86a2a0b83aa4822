#include "merge.hpp"

namespace storykb::store {

namespace {

bool MergeProperties(model::Properties& stored, const model::Properties& incoming) {
  bool changed = false;
  for (const auto& [key, value] : incoming) {
    auto it = stored.find(key);
    if (it == stored.end()) {
      stored.emplace(key, value);
      changed = true;
    } else if (it->second != value) {
      it->second = value;
      changed    = true;
    }
  }
  return changed;
}

} // namespace

bool MergeNode(model::GraphNode& stored, const GraphNodeUpsert& upsert) {
  bool changed = false;
  if (stored.id.empty()) {
    stored.id = upsert.id;
    changed   = true;
  }
  if (!upsert.type.empty() && stored.type != upsert.type) {
    stored.type = upsert.type;
    changed     = true;
  }
  if (upsert.content_hash && stored.content_hash != *upsert.content_hash) {
    stored.content_hash = *upsert.content_hash;
    changed             = true;
  }
  changed = MergeProperties(stored.properties, upsert.properties) || changed;

  if (changed) {
    ++stored.version;
  }
  return changed;
}

bool MergeEntry(model::VectorEntry& stored, const VectorUpsert& upsert) {
  bool changed = false;
  if (stored.id.empty()) {
    stored.id = upsert.id;
    changed   = true;
  }
  if (stored.content != upsert.content) {
    stored.content = upsert.content;
    changed        = true;
  }
  changed = MergeProperties(stored.metadata, upsert.metadata) || changed;

  if (changed) {
    ++stored.version;
  }
  return changed;
}

std::string ValidateGraphOp(const GraphOp& op) {
  if (const auto* node = std::get_if<GraphNodeUpsert>(&op)) {
    if (node->id.empty()) return "node upsert without id";
    if (node->content_hash && node->content_hash->empty()) return "node upsert with empty content_hash";
    return {};
  }

  const auto& rel = std::get<GraphRelationshipUpsert>(op).relationship;
  if (rel.source_id.empty()) return "relationship without source_id";
  if (rel.target_id.empty()) return "relationship without target_id";
  if (rel.type.empty()) return "relationship without type";
  return {};
}

std::string ValidateVectorUpsert(const VectorUpsert& upsert) {
  if (upsert.id.empty()) return "vector upsert without id";
  return {};
}

} // namespace storykb::store
