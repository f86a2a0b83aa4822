#pragma once

#include <cstdint>
#include <string>

namespace storykb::db::model {

/*
  Persistent correlation row: one logical entity, one canonical id.

  Rows are never updated or deleted.
*/

struct IdentityRecord {
  std::string natural_key;
  std::string entity_id;

  uint64_t created_at_ms = 0;
};

} // namespace storykb::db::model
