#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"

#if TIERBRIDGE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if TIERBRIDGE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using tierbridge::db::ErrorCode;
using tierbridge::db::Repository;
using tierbridge::db::memory::MemoryRepository;
using tierbridge::db::model::FileTierRecord;
using tierbridge::db::model::OperationRecord;
using tierbridge::db::model::TransferRecord;
using tierbridge::vfs::core::v1::OPERATION_STATUS_COMPLETED;
using tierbridge::vfs::core::v1::OPERATION_STATUS_IN_PROGRESS;
using tierbridge::vfs::core::v1::OPERATION_TYPE_COPY;
using tierbridge::vfs::core::v1::OPERATION_TYPE_UPLOAD;
using tierbridge::vfs::core::v1::SOURCE_CATEGORY_CLOUD;
using tierbridge::vfs::core::v1::SOURCE_CATEGORY_LOCAL;
using tierbridge::vfs::core::v1::TIER_STATUS_ARCHIVE;
using tierbridge::vfs::core::v1::TIER_STATUS_COLD;
using tierbridge::vfs::core::v1::TIER_STATUS_HOT;
using tierbridge::vfs::core::v1::TRANSFER_KIND_UPLOAD;
using tierbridge::vfs::core::v1::TRANSFER_STATUS_IN_PROGRESS;
using tierbridge::vfs::core::v1::TRANSFER_STATUS_PAUSED;
using tierbridge::vfs::core::v1::TRANSFER_STATUS_PENDING;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

TransferRecord MakeTransfer(const std::string& id, uint64_t created_at_ms) {
  TransferRecord record;
  record.id            = id;
  record.kind          = TRANSFER_KIND_UPLOAD;
  record.source_id     = "s3";
  record.local_path    = "/tmp/" + id + ".bin";
  record.remote_path   = "/bucket/" + id + ".bin";
  record.total_size    = 12 * 1024 * 1024;
  record.part_size     = 5 * 1024 * 1024;
  record.total_parts   = 3;
  record.status        = TRANSFER_STATUS_PENDING;
  record.created_at_ms = created_at_ms;
  record.updated_at_ms = created_at_ms;
  return record;
}

OperationRecord MakeOperation(const std::string& id, uint64_t seq) {
  OperationRecord record;
  record.id              = id;
  record.type            = OPERATION_TYPE_COPY;
  record.source_id       = "local";
  record.source_category = SOURCE_CATEGORY_LOCAL;
  record.source_path     = "/src/" + id;
  record.dest_path       = "/dst/" + id;
  record.file_size       = 100;
  record.status          = OPERATION_STATUS_IN_PROGRESS;
  record.started_at_ms   = 1000;
  record.seq             = seq;
  return record;
}

void VerifyTransferLifecycle(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  auto record = MakeTransfer(id, NowMs());
  assert(repo.InsertTransfer(*tx, record));

  auto duplicate = repo.InsertTransfer(*tx, record);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto loaded = repo.GetTransfer(*tx, id);
  assert(loaded.has_value());
  assert(loaded->kind == TRANSFER_KIND_UPLOAD);
  assert(loaded->remote_path == "/bucket/" + id + ".bin");
  assert(loaded->total_parts == 3);

  // Part checkpoint.
  loaded->status            = TRANSFER_STATUS_IN_PROGRESS;
  loaded->part_index        = 1;
  loaded->bytes_transferred = loaded->part_size;
  assert(repo.UpdateTransfer(*tx, *loaded));

  auto checkpoint = repo.GetTransfer(*tx, id);
  assert(checkpoint.has_value());
  assert(checkpoint->part_index == 1);
  assert(checkpoint->bytes_transferred == 5 * 1024 * 1024);
  assert(checkpoint->status == TRANSFER_STATUS_IN_PROGRESS);

  bool listed = false;
  for (const auto& t : repo.ListTransfers(*tx)) {
    listed = listed || t.id == id;
  }
  assert(listed);

  assert(repo.DeleteTransfer(*tx, id));
  assert(!repo.GetTransfer(*tx, id).has_value());

  auto missing = repo.UpdateTransfer(*tx, record);
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyOperationOrdering(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  // Inserted out of order; listing follows seq.
  assert(repo.InsertOperation(*tx, MakeOperation(prefix + "-b", 20)));
  assert(repo.InsertOperation(*tx, MakeOperation(prefix + "-a", 10)));
  assert(repo.InsertOperation(*tx, MakeOperation(prefix + "-c", 30)));

  std::vector<std::string> ids;
  for (const auto& op : repo.ListOperations(*tx)) {
    if (op.id.rfind(prefix, 0) == 0) {
      ids.push_back(op.id);
    }
  }
  assert(ids.size() == 3);
  assert(ids[0] == prefix + "-a");
  assert(ids[1] == prefix + "-b");
  assert(ids[2] == prefix + "-c");

  auto op = repo.GetOperation(*tx, prefix + "-b");
  assert(op.has_value());
  assert(op->source_category == SOURCE_CATEGORY_LOCAL);
  op->status          = OPERATION_STATUS_COMPLETED;
  op->bytes_processed = 100;
  op->completed_at_ms = 2000;
  assert(repo.UpdateOperation(*tx, *op));

  auto done = repo.GetOperation(*tx, prefix + "-b");
  assert(done.has_value());
  assert(done->status == OPERATION_STATUS_COMPLETED);
  assert(done->completed_at_ms == 2000);

  for (const auto& suffix : {"-a", "-b", "-c"}) {
    assert(repo.DeleteOperation(*tx, prefix + suffix));
  }
  assert(!repo.GetOperation(*tx, prefix + "-a").has_value());

  tx->Commit();
}

void VerifyFileTierUpsert(Repository& repo, const std::string& source_id) {
  auto tx = repo.Begin();

  assert(!repo.GetFileTier(*tx, source_id, "/a.bin").has_value());

  assert(repo.UpsertFileTier(*tx, FileTierRecord{.source_id = source_id, .path = "/b.bin", .tier = TIER_STATUS_COLD, .updated_at_ms = 1}));
  assert(repo.UpsertFileTier(*tx, FileTierRecord{.source_id = source_id, .path = "/a.bin", .tier = TIER_STATUS_ARCHIVE, .updated_at_ms = 2}));
  assert(repo.UpsertFileTier(*tx, FileTierRecord{.source_id = source_id, .path = "/a.bin", .tier = TIER_STATUS_HOT, .updated_at_ms = 3}));

  auto a = repo.GetFileTier(*tx, source_id, "/a.bin");
  assert(a.has_value());
  assert(a->tier == TIER_STATUS_HOT);
  assert(a->updated_at_ms == 3);

  auto rows = repo.ListFileTiers(*tx, source_id);
  assert(rows.size() == 2);
  assert(rows[0].path == "/a.bin");
  assert(rows[1].path == "/b.bin");

  // Rows are scoped per source.
  assert(repo.ListFileTiers(*tx, source_id + "-other").empty());

  assert(repo.DeleteFileTier(*tx, source_id, "/a.bin"));
  assert(repo.DeleteFileTier(*tx, source_id, "/b.bin"));
  assert(repo.ListFileTiers(*tx, source_id).empty());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertTransfer(*tx, MakeTransfer(id, NowMs())));
    assert(repo.InsertOperation(*tx, MakeOperation(id, 1)));
    tx->Rollback();
  }

  auto verify_tx = repo.Begin();
  assert(!repo.GetTransfer(*verify_tx, id).has_value());
  assert(!repo.GetOperation(*verify_tx, id).has_value());
  verify_tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertTransfer(*tx, MakeTransfer(id, NowMs())));
    tx->Commit();
  }

  auto tx1 = repo.Begin();

  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();

  auto r1 = repo.GetTransfer(*tx1, id);
  auto r2 = repo.GetTransfer(*tx2, id);
  assert(r1.has_value() && r2.has_value());

  r1->part_index = 1;
  r2->part_index = 2;
  r2->status     = TRANSFER_STATUS_PAUSED;

  assert(repo.UpdateTransfer(*tx1, *r1));
  tx1->Commit();

  assert(repo.UpdateTransfer(*tx2, *r2));
  tx2->Commit();

  auto verify_tx = repo.Begin();
  auto final     = repo.GetTransfer(*verify_tx, id);
  assert(final.has_value());
  assert(final->part_index == 2);
  assert(final->status == TRANSFER_STATUS_PAUSED);
  assert(repo.DeleteTransfer(*verify_tx, id));
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();

    auto transfer              = MakeTransfer(id, NowMs());
    transfer.status            = TRANSFER_STATUS_PAUSED;
    transfer.part_index        = 2;
    transfer.bytes_transferred = 10 * 1024 * 1024;
    assert(repo->InsertTransfer(*tx, transfer));

    auto op            = MakeOperation(id, 7);
    op.type            = OPERATION_TYPE_UPLOAD;
    op.source_category = SOURCE_CATEGORY_CLOUD;
    assert(repo->InsertOperation(*tx, op));

    assert(repo->UpsertFileTier(*tx, FileTierRecord{.source_id = id, .path = "/cold.bin", .tier = TIER_STATUS_COLD, .updated_at_ms = 5}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();

  auto transfer = repo->GetTransfer(*tx, id);
  assert(transfer.has_value());
  assert(transfer->status == TRANSFER_STATUS_PAUSED);
  assert(transfer->part_index == 2);
  assert(transfer->bytes_transferred == 10 * 1024 * 1024);

  auto op = repo->GetOperation(*tx, id);
  assert(op.has_value());
  assert(op->type == OPERATION_TYPE_UPLOAD);
  assert(op->source_category == SOURCE_CATEGORY_CLOUD);
  assert(op->seq == 7);

  auto tier = repo->GetFileTier(*tx, id, "/cold.bin");
  assert(tier.has_value());
  assert(tier->tier == TIER_STATUS_COLD);

  assert(repo->DeleteTransfer(*tx, id));
  assert(repo->DeleteOperation(*tx, id));
  assert(repo->DeleteFileTier(*tx, id, "/cold.bin"));
  tx->Commit();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if TIERBRIDGE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("tierbridge_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<tierbridge::db::sqlite::SqliteDB>(tierbridge::db::sqlite::SqliteOptions{db_path, 2000});
    assert(db->SchemaVersion() == tierbridge::db::sqlite::kSchemaVersion);
    return std::make_shared<tierbridge::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if TIERBRIDGE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("TIERBRIDGE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("TIERBRIDGE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<tierbridge::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      for (const auto* sql : tierbridge::db::sql::POSTGRES_SCHEMA) {
        tx.exec(sql);
      }
      tx.commit();
    }
    return std::make_shared<tierbridge::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  // Unique per run so a persistent postgres database can be reused.
  const auto run = backend.name + "-" + std::to_string(NowMs());
  auto       repo = backend.make_repository();

  VerifyTransferLifecycle(*repo, run + "-transfer");
  VerifyOperationOrdering(*repo, run + "-op");
  VerifyFileTierUpsert(*repo, run + "-tiers");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyConcurrentUpdates(*repo, run + "-concurrency", backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if TIERBRIDGE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if TIERBRIDGE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "tierbridge_integration_repository_parity: pass\n";
  return 0;
}
