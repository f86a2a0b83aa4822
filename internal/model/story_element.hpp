#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <tuple>

namespace storykb::model {

using EntityIdentifier = std::string;
using Properties       = std::map<std::string, std::string>;

/*
  Directed typed edge. The (source, target, type) triple is the edge
  identity: stores keep at most one edge per triple.
*/
struct Relationship {
  EntityIdentifier source_id;
  EntityIdentifier target_id;
  std::string      type;

  auto Key() const {
    return std::tie(source_id, target_id, type);
  }

  bool operator==(const Relationship& other) const {
    return Key() == other.Key();
  }
  bool operator<(const Relationship& other) const {
    return Key() < other.Key();
  }
};

/*
  Relationship as submitted by a caller; the source is the element being
  written.
*/
struct RelationshipSpec {
  EntityIdentifier target_id;
  std::string      type;
};

/*
  Graph node schema.

  Merge rule: last-write-wins per field. An upsert that does not carry a
  content_hash keeps the stored one; properties not named by an upsert
  survive. `version` moves only when a stored field changes.
*/
struct GraphNode {
  EntityIdentifier id;
  std::string      type;
  std::string      content_hash;
  Properties       properties;
  std::uint64_t    version = 0;
};

struct VectorEntry {
  EntityIdentifier id;
  std::string      content;
  Properties       metadata;
  std::uint64_t    version = 0;
};

} // namespace storykb::model
