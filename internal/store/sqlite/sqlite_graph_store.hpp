#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/store/graph_store_adapter.hpp"
#include "internal/store/sqlite/sqlite_connection_pool.hpp"

namespace storykb::store::sqlite {

/*
  Graph store on a sqlite file.

  PrepareWrite takes a pooled connection, opens BEGIN IMMEDIATE and applies
  the upserts; the native transaction stays open until Commit or Discard.
  Reads go through a separate connection and, with WAL, only ever see
  committed rows.

  Tables:
    graph_node(id PK, type, content_hash, version)
    graph_node_property(node_id, key, value)  PK(node_id, key)
    graph_edge(source_id, target_id, type)     PK(source_id, target_id, type)

  sqlite admits one writer at a time, so a second PrepareWrite waits for the
  first transaction to finish (bounded by its deadline) and reports
  UNAVAILABLE when it cannot get the write lock.

  A stage whose COMMIT and ROLLBACK both fail keeps its token, so a later
  Discard can finish the rollback.
*/
class SqliteGraphStore final : public GraphStoreAdapter {
 public:
  SqliteGraphStore(std::string path, std::size_t max_connections, int busy_timeout_ms = 5000);
  ~SqliteGraphStore() override;

  std::string_view Name() const override {
    return "graph";
  }

  StoreStatus PrepareWrite(const std::vector<GraphOp>& ops, util::Deadline deadline, StagingToken* token) override;
  StoreStatus Commit(const StagingToken& token, util::Deadline deadline) override;
  StoreStatus Discard(const StagingToken& token) override;

  std::optional<model::GraphNode>  FindNode(const model::EntityIdentifier& id) override;
  std::vector<model::Relationship> FindRelationships(const model::EntityIdentifier& source_id) override;

  std::size_t StagedCount() const;

 private:
  std::shared_ptr<db::sqlite::SqliteDB> TakeStaged(const StagingToken& token);
  void                                  Restage(const StagingToken& token, std::shared_ptr<db::sqlite::SqliteDB> conn);

  int busy_timeout_ms_;

  std::shared_ptr<SqliteConnectionPool> pool_;

  std::mutex                            reader_mutex_;
  std::unique_ptr<db::sqlite::SqliteDB> reader_;

  mutable std::mutex                                                    staged_mutex_;
  std::unordered_map<StagingToken, std::shared_ptr<db::sqlite::SqliteDB>> staged_;
};

} // namespace storykb::store::sqlite
