#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/memory/memory_graph_store.hpp"
#include "internal/store/memory/memory_vector_store.hpp"
#include "internal/store/sqlite/sqlite_graph_store.hpp"

namespace storykb::factory {

namespace cfg = storykb::runtime::config;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const cfg::LedgerConfig& ledger) {
  if (ledger.backend() == cfg::LedgerConfig::LEDGER_BACKEND_SQLITE) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(ledger.sqlite().path(), static_cast<int>(ledger.sqlite().busy_timeout_ms()));
    db::sqlite::BootstrapLedgerSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<store::GraphStoreAdapter> BuildGraphStore(const cfg::GraphStoreConfig& graph) {
  if (graph.backend() == cfg::GraphStoreConfig::GRAPH_BACKEND_SQLITE) {
    return std::make_shared<store::sqlite::SqliteGraphStore>(graph.sqlite().path(), graph.sqlite().max_connections(),
                                                             static_cast<int>(graph.sqlite().busy_timeout_ms()));
  }

  return std::make_shared<store::memory::MemoryGraphStore>();
}

std::shared_ptr<store::VectorStoreAdapter> BuildVectorStore(const cfg::VectorStoreConfig& vector) {
  switch (vector.backend()) {
    case cfg::VectorStoreConfig::VECTOR_BACKEND_UNSPECIFIED:
    case cfg::VectorStoreConfig::VECTOR_BACKEND_MEMORY:
      return std::make_shared<store::memory::MemoryVectorStore>();
    default:
      throw std::runtime_error("unsupported vector store backend");
  }
}

} // namespace

coordinator::CoordinatorOptions CoordinatorOptionsFrom(const cfg::RuntimeConfig& config) {
  const auto& coordinator = config.coordinator();

  coordinator::CoordinatorOptions options;
  options.conflict_policy =
      coordinator.conflict_policy() == cfg::CONFLICT_POLICY_FAIL_FAST ? lock::ConflictPolicy::kFailFast : lock::ConflictPolicy::kWait;
  options.lock_wait_timeout = std::chrono::milliseconds(coordinator.lock_wait_timeout_ms());

  options.retry.max_attempts    = coordinator.retry().max_attempts();
  options.retry.initial_backoff = std::chrono::milliseconds(coordinator.retry().initial_backoff_ms());
  options.retry.max_backoff     = std::chrono::milliseconds(coordinator.retry().max_backoff_ms());
  options.retry.multiplier      = coordinator.retry().multiplier();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const cfg::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config.ledger());
  app.registry   = std::make_shared<registry::EntityRegistry>(app.repository);
  app.ledger     = std::make_shared<ledger::ChangeLedger>(app.repository);

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  app.graph_store  = BuildGraphStore(config.graph_store());
  app.vector_store = BuildVectorStore(config.vector_store());

  // ------------------------------------------------------------------
  // Coordination
  // ------------------------------------------------------------------
  app.coordinator = std::make_shared<coordinator::TransactionCoordinator>(app.graph_store, app.vector_store, app.ledger,
                                                                         CoordinatorOptionsFrom(config));

  kb::KnowledgeBaseOptions kb_options;
  kb_options.prepare_timeout = std::chrono::milliseconds(config.coordinator().prepare_timeout_ms());
  kb_options.commit_timeout  = std::chrono::milliseconds(config.coordinator().commit_timeout_ms());
  app.knowledge_base         = std::make_shared<kb::UnifiedKnowledgeBase>(app.registry, app.coordinator, app.ledger, kb_options);

  // ------------------------------------------------------------------
  // Background work
  // ------------------------------------------------------------------
  app.executor = std::make_shared<worker::UpdateExecutor>(app.knowledge_base, config.workers().threads(), config.workers().queue_capacity());

  reconcile::SweeperOptions sweeper_options;
  sweeper_options.interval          = std::chrono::milliseconds(config.reconciler().interval_ms());
  sweeper_options.batch_size        = config.reconciler().batch_size();
  sweeper_options.operation_timeout = std::chrono::milliseconds(config.coordinator().commit_timeout_ms());
  app.sweeper = std::make_shared<reconcile::ReconciliationSweeper>(app.ledger, app.graph_store, app.vector_store, app.coordinator, sweeper_options);

  STORYKB_LOG_INFO("storykb runtime built",
                   {observability::StringField("ledger", cfg::LedgerConfig::Backend_Name(config.ledger().backend())),
                    observability::StringField("graph_store", cfg::GraphStoreConfig::Backend_Name(config.graph_store().backend())),
                    observability::StringField("vector_store", cfg::VectorStoreConfig::Backend_Name(config.vector_store().backend())),
                    observability::IntField("workers", config.workers().threads())});
  return app;
}

bool StartReconciler(Application& app, const cfg::RuntimeConfig& config) {
  if (!config.reconciler().enabled()) {
    STORYKB_LOG_WARN("reconciler disabled, nothing to run");
    return false;
  }
  app.sweeper->Start();
  return true;
}

} // namespace storykb::factory
