#include "internal/ledger/operation_ledger.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/transfer_journal.hpp"
#include "internal/source/source_registry.hpp"
#include "internal/transfer/transfer_engine.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_sources.hpp"

namespace {

using namespace tierbridge::vfs::core::v1;
using tierbridge::db::memory::MemoryRepository;
using tierbridge::ledger::OperationLedger;
using tierbridge::ledger::TransferJournal;
using tierbridge::source::SourceRegistry;
using tierbridge::testing::BucketDriver;

struct Fixture {
  Fixture() {
    repository = std::make_shared<MemoryRepository>();
    registry   = std::make_shared<SourceRegistry>();
    tierbridge::testing::Mount(*registry, "s3", SOURCE_CATEGORY_CLOUD, BucketDriver());
    tierbridge::testing::Mount(*registry, "disk", SOURCE_CATEGORY_LOCAL, BucketDriver());
    config.set_retention_per_category(2);
  }

  std::shared_ptr<OperationLedger> MakeLedger() const {
    return std::make_shared<OperationLedger>(repository, registry, config);
  }

  std::shared_ptr<MemoryRepository>         repository;
  std::shared_ptr<SourceRegistry>           registry;
  tierbridge::runtime::config::LedgerConfig config;
};

void TestLifecycleAndImmutability() {
  Fixture f;
  auto    ledger = f.MakeLedger();

  const auto id = ledger->Begin(OPERATION_TYPE_COPY, "s3", "/a.bin", "/b.bin", 100);
  auto       op = ledger->Get(id);
  assert(op.status() == OPERATION_STATUS_IN_PROGRESS);
  assert(op.source_category() == SOURCE_CATEGORY_CLOUD);
  assert(!op.has_completed_at());

  ledger->Progress(id, 40);
  assert(ledger->Get(id).bytes_processed() == 40);
  assert(ledger->Active().size() == 1);

  const auto done = ledger->Complete(id);
  assert(done.status() == OPERATION_STATUS_COMPLETED);
  assert(done.bytes_processed() == 100);
  assert(done.has_completed_at());
  assert(ledger->Active().empty());

  bool threw = false;
  try {
    ledger->Fail(id, "late");
  } catch (const tierbridge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ledger->Progress(id, 1);
  } catch (const tierbridge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ledger->Begin(OPERATION_TYPE_COPY, "unknown", "/a", "/b", 1);
  } catch (const tierbridge::util::SourceNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestListKeepsNewestPerCategory() {
  Fixture f;
  auto    ledger = f.MakeLedger();

  std::vector<std::string> cloud;
  for (int i = 0; i < 4; ++i) {
    cloud.push_back(ledger->Begin(OPERATION_TYPE_UPLOAD, "s3", "/f" + std::to_string(i), "", 1));
    ledger->Complete(cloud.back());
  }
  const auto local = ledger->Begin(OPERATION_TYPE_DELETE, "disk", "/old", "", 0);
  ledger->Fail(local, "permission denied");

  const auto all = ledger->List({});
  assert(all.size() == 3);
  // Newest first.
  assert(all[0].id() == local);
  assert(all[1].id() == cloud[3]);
  assert(all[2].id() == cloud[2]);

  const auto only_cloud = ledger->List({.categories = {SOURCE_CATEGORY_CLOUD}});
  assert(only_cloud.size() == 2);
  assert(only_cloud[0].id() == cloud[3]);

  assert(ledger->Prune() == 2);
  assert(ledger->List({}).size() == 3);
}

void TestPruneKeepsInProgressEntries() {
  Fixture f;
  auto    ledger = f.MakeLedger();

  const auto running = ledger->Begin(OPERATION_TYPE_MOVE, "s3", "/big", "/dst", 1);
  for (int i = 0; i < 3; ++i) {
    ledger->Cancel(ledger->Begin(OPERATION_TYPE_COPY, "s3", "/x", "/y", 1));
  }

  assert(ledger->Prune() == 1);
  assert(ledger->Get(running).status() == OPERATION_STATUS_IN_PROGRESS);
}

void TestLoadFailsInterruptedEntriesAndKeepsSequence() {
  Fixture    f;
  const auto first = f.MakeLedger();

  const auto interrupted = first->Begin(OPERATION_TYPE_UPLOAD, "s3", "/a", "/b", 5);
  const auto finished    = first->Begin(OPERATION_TYPE_UPLOAD, "s3", "/c", "/d", 5);
  first->Complete(finished);

  const auto second = f.MakeLedger();
  second->Load();

  const auto restored = second->Get(interrupted);
  assert(restored.status() == OPERATION_STATUS_FAILED);
  assert(restored.error() == "interrupted by restart");
  assert(second->Get(finished).status() == OPERATION_STATUS_COMPLETED);

  // New entries sort after the persisted ones.
  const auto next = second->Begin(OPERATION_TYPE_COPY, "s3", "/e", "/f", 1);
  assert(second->List({})[0].id() == next);
}

void TestAppendRequiresFinishedEntry() {
  Fixture f;
  auto    ledger = f.MakeLedger();

  tierbridge::db::model::OperationRecord record;
  record.type        = OPERATION_TYPE_DELETE;
  record.source_id   = "disk";
  record.source_path = "/tmp/x";
  record.status      = OPERATION_STATUS_IN_PROGRESS;

  bool threw = false;
  try {
    ledger->Append(record);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  record.status       = OPERATION_STATUS_COMPLETED;
  const auto appended = ledger->Append(record);
  assert(!appended.id().empty());
  assert(appended.source_category() == SOURCE_CATEGORY_LOCAL);
}

void TestJournalMirrorsTransferOutcome() {
  Fixture                      f;
  tierbridge::testing::TempDir dir;

  auto host = tierbridge::testing::HostDriver();
  tierbridge::testing::Put(*host, dir / "up.bin", "payload");

  tierbridge::runtime::config::TransferConfig config;
  config.set_part_size_bytes(4);
  auto transfers = std::make_shared<tierbridge::transfer::TransferEngine>(f.repository, f.registry, host, config);
  auto ledger    = f.MakeLedger();

  TransferJournal journal(transfers, ledger);

  // Canceled before the engine starts.
  const auto canceled = transfers->EnqueueUpload("s3", dir / "up.bin", "/canceled.bin");
  journal.Track(canceled);
  assert(journal.Tracked() == 1);
  transfers->Cancel(canceled.id());
  assert(journal.Tracked() == 0);

  const auto uploaded = transfers->EnqueueUpload("s3", dir / "up.bin", "/up.bin");
  journal.Track(uploaded);
  transfers->Start();
  assert(transfers->Wait(uploaded.id(), std::chrono::seconds(10)).status() == TRANSFER_STATUS_COMPLETED);

  // The journal settles on the publishing thread right after the terminal state.
  for (int i = 0; i < 100 && journal.Tracked() > 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  assert(journal.Tracked() == 0);
  transfers->Stop();

  const auto history = ledger->List({});
  assert(history.size() == 2);
  assert(history[0].type() == OPERATION_TYPE_UPLOAD);
  assert(history[0].status() == OPERATION_STATUS_COMPLETED);
  assert(history[0].source_path() == dir / "up.bin");
  assert(history[0].dest_path() == "/up.bin");
  assert(history[0].bytes_processed() == 7);
  assert(history[1].status() == OPERATION_STATUS_CANCELED);
}

} // namespace

int main() {
  TestLifecycleAndImmutability();
  TestListKeepsNewestPerCategory();
  TestPruneKeepsInProgressEntries();
  TestLoadFailsInterruptedEntriesAndKeepsSequence();
  TestAppendRequiresFinishedEntry();
  TestJournalMirrorsTransferOutcome();

  std::cout << "tierbridge_unit_operation_ledger: pass\n";
  return 0;
}
