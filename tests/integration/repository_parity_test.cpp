#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/transaction_runner.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/uuid.hpp"

namespace {

using storykb::db::ErrorCode;
using storykb::db::Repository;
using storykb::db::memory::MemoryRepository;
using storykb::db::model::ChangeEventRecord;
using storykb::db::model::ChangeStatus;
using storykb::db::model::ChangeType;
using storykb::db::model::IdentityRecord;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

ChangeEventRecord MakeEvent(const std::string& tx, const std::string& entity, ChangeStatus status, std::uint64_t ts) {
  ChangeEventRecord record;
  record.transaction_id = tx;
  record.entity_id      = entity;
  record.timestamp_ms   = ts;
  record.change_type    = ChangeType::kContent;
  record.status         = status;
  record.payload        = R"({"entity_id":")" + entity + R"("})";
  record.phase          = "prepare";
  return record;
}

void VerifyIdentityReadWrite(Repository& repo, const std::string& prefix) {
  const auto id = storykb::util::NewId();
  {
    auto           tx = repo.Begin();
    IdentityRecord record{.natural_key = prefix + ":sarah", .entity_id = id, .created_at_ms = 1000};
    assert(repo.InsertIdentity(*tx, record));

    auto by_key = repo.GetIdentityByKey(*tx, prefix + ":sarah");
    assert(by_key.has_value());
    assert(by_key->entity_id == id);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();

    IdentityRecord same_key{.natural_key = prefix + ":sarah", .entity_id = storykb::util::NewId(), .created_at_ms = 2000};
    assert(repo.InsertIdentity(*tx, same_key).code == ErrorCode::AlreadyExists);

    IdentityRecord same_id{.natural_key = prefix + ":other", .entity_id = id, .created_at_ms = 2000};
    assert(repo.InsertIdentity(*tx, same_id).code == ErrorCode::AlreadyExists);

    auto by_id = repo.GetIdentityById(*tx, id);
    assert(by_id.has_value());
    assert(by_id->natural_key == prefix + ":sarah");
    assert(by_id->created_at_ms == 1000);
    assert(!repo.GetIdentityByKey(*tx, prefix + ":missing").has_value());
    tx->Commit();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto           tx = repo.Begin();
    IdentityRecord record{.natural_key = prefix + ":ghost", .entity_id = storykb::util::NewId(), .created_at_ms = 1};
    assert(repo.InsertIdentity(*tx, record));
    auto event = MakeEvent(prefix + "-tx", prefix + "-entity", ChangeStatus::kPending, 1);
    assert(repo.AppendChangeEvent(*tx, event));
    tx->Rollback();
  }

  // destructor rolls back as well
  {
    auto           tx = repo.Begin();
    IdentityRecord record{.natural_key = prefix + ":ghost2", .entity_id = storykb::util::NewId(), .created_at_ms = 1};
    assert(repo.InsertIdentity(*tx, record));
  }

  auto tx = repo.Begin();
  assert(!repo.GetIdentityByKey(*tx, prefix + ":ghost").has_value());
  assert(!repo.GetIdentityByKey(*tx, prefix + ":ghost2").has_value());
  assert(repo.ListChangeEventsByTransaction(*tx, prefix + "-tx").empty());
  tx->Commit();
}

void VerifyChangeEventQueries(Repository& repo, const std::string& prefix) {
  const auto entity = prefix + "-ledger-entity";
  const auto tx_a   = prefix + "-a";
  const auto tx_b   = prefix + "-b";
  const auto tx_c   = prefix + "-c";

  std::vector<std::uint64_t> sequences;
  {
    auto tx = repo.Begin();
    for (auto event : {MakeEvent(tx_a, entity, ChangeStatus::kPending, 10), MakeEvent(tx_b, entity, ChangeStatus::kPending, 11),
                       MakeEvent(tx_a, entity, ChangeStatus::kReconciliationRequired, 12),
                       MakeEvent(tx_b, entity, ChangeStatus::kReconciliationRequired, 13), MakeEvent(tx_c, entity, ChangeStatus::kPending, 14),
                       MakeEvent(tx_c, entity, ChangeStatus::kReconciliationRequired, 15), MakeEvent(tx_b, entity, ChangeStatus::kCommitted, 16)}) {
      assert(repo.AppendChangeEvent(*tx, event));
      assert(event.sequence > 0);
      sequences.push_back(event.sequence);
    }
    tx->Commit();
  }
  for (std::size_t i = 1; i < sequences.size(); ++i) {
    assert(sequences[i] > sequences[i - 1]);
  }

  auto tx = repo.Begin();

  const auto history = repo.ListChangeEventsByEntity(*tx, entity);
  assert(history.size() == 7);
  assert(history.front().transaction_id == tx_a);
  assert(history.back().status == ChangeStatus::kCommitted);
  assert(history[2].payload == R"({"entity_id":")" + entity + R"("})");
  assert(history[2].phase == "prepare");
  assert(history[2].timestamp_ms == 12);

  const auto of_b = repo.ListChangeEventsByTransaction(*tx, tx_b);
  assert(of_b.size() == 3);
  assert(of_b[0].status == ChangeStatus::kPending);
  assert(of_b[2].status == ChangeStatus::kCommitted);

  const auto latest_b = repo.GetLatestChangeEvent(*tx, tx_b);
  assert(latest_b.has_value());
  assert(latest_b->status == ChangeStatus::kCommitted);
  assert(!repo.GetLatestChangeEvent(*tx, prefix + "-missing").has_value());

  // b is closed; a and c stay open, oldest first
  std::vector<ChangeEventRecord> open;
  for (const auto& record : repo.ListLatestByStatus(*tx, ChangeStatus::kReconciliationRequired, 0)) {
    if (record.entity_id == entity) open.push_back(record);
  }
  assert(open.size() == 2);
  assert(open[0].transaction_id == tx_a);
  assert(open[1].transaction_id == tx_c);

  assert(repo.ListLatestByStatus(*tx, ChangeStatus::kReconciliationRequired, 1).size() == 1);
  tx->Commit();
}

void VerifyConcurrentAppends(Repository& repo, const std::string& prefix) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 10;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        storykb::db::RunInTransaction(repo, "append", [&](storykb::db::Transaction& tx) {
          auto event = MakeEvent(prefix + "-concurrent-" + std::to_string(t) + "-" + std::to_string(i), prefix + "-concurrent",
                                 ChangeStatus::kPending, 1);
          if (!repo.AppendChangeEvent(tx, event)) throw std::runtime_error("append failed");
        }, 64);
      }
    });
  }
  for (auto& thread : threads) thread.join();

  auto       tx      = repo.Begin();
  const auto history = repo.ListChangeEventsByEntity(*tx, prefix + "-concurrent");
  tx->Commit();

  std::set<std::uint64_t> sequences;
  for (const auto& record : history) sequences.insert(record.sequence);
  assert(history.size() == kThreads * kPerThread);
  assert(sequences.size() == history.size());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       repo = backend.make_repository();
  const auto id   = storykb::util::NewId();
  {
    auto           tx = repo->Begin();
    IdentityRecord record{.natural_key = prefix + ":durable", .entity_id = id, .created_at_ms = 5};
    assert(repo->InsertIdentity(*tx, record));
    auto event = MakeEvent(prefix + "-durable-tx", id, ChangeStatus::kPending, 5);
    assert(repo->AppendChangeEvent(*tx, event));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto identity = repo->GetIdentityByKey(*tx, prefix + ":durable");
  assert(identity.has_value());
  assert(identity->entity_id == id);
  assert(repo->ListChangeEventsByEntity(*tx, id).size() == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  const auto dir = std::filesystem::temp_directory_path() / "storykb_repository_parity";
  std::filesystem::create_directories(dir);
  const auto path = (dir / ("ledger-" + storykb::util::NewId() + ".db")).string();

  auto make_repo = [path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<storykb::db::sqlite::SqliteDB>(path);
    storykb::db::sqlite::BootstrapLedgerSchema(*db);
    return std::make_shared<storykb::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [path]() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
      },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyIdentityReadWrite(*repo, backend.name + "-identity");
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  VerifyChangeEventQueries(*repo, backend.name + "-events");
  VerifyConcurrentAppends(*repo, backend.name);

  repo.reset();
  VerifyRestartDurability(backend, backend.name);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "storykb_integration_repository_parity: pass\n";
  return 0;
}
