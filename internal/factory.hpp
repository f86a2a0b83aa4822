#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/coordinator/transaction_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/kb/unified_knowledge_base.hpp"
#include "internal/ledger/change_ledger.hpp"
#include "internal/reconcile/reconciliation_sweeper.hpp"
#include "internal/registry/entity_registry.hpp"
#include "internal/store/graph_store_adapter.hpp"
#include "internal/store/vector_store_adapter.hpp"
#include "internal/worker/update_executor.hpp"

namespace storykb::factory {

/*
  Application

  Owns all long-lived components. Everything here lives for the lifetime
  of the process; the executor and sweeper are built but not started.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<registry::EntityRegistry>             registry;
  std::shared_ptr<ledger::ChangeLedger>                 ledger;
  std::shared_ptr<store::GraphStoreAdapter>             graph_store;
  std::shared_ptr<store::VectorStoreAdapter>            vector_store;
  std::shared_ptr<coordinator::TransactionCoordinator> coordinator;
  std::shared_ptr<kb::UnifiedKnowledgeBase>             knowledge_base;

  std::shared_ptr<worker::UpdateExecutor>           executor;
  std::shared_ptr<reconcile::ReconciliationSweeper> sweeper;
};

coordinator::CoordinatorOptions CoordinatorOptionsFrom(const storykb::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the whole dependency graph from a validated runtime config.
  This is the composition root: the only place that knows concrete store
  and repository types.
*/
Application Build(const storykb::runtime::config::RuntimeConfig& config);

/*
  StartReconciler

  Starts the background work of the reconciler daemon: the sweeper when
  `reconciler.enabled` is set. The executor is left for library embedders.
  Returns whether anything was started.
*/
bool StartReconciler(Application& app, const storykb::runtime::config::RuntimeConfig& config);

} // namespace storykb::factory
