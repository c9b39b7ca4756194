#include "internal/transfer/transfer_engine.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/source/source_registry.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_sources.hpp"

namespace {

using namespace tierbridge::vfs::core::v1;
using tierbridge::db::memory::MemoryRepository;
using tierbridge::events::EventQueue;
using tierbridge::source::SourceRegistry;
using tierbridge::testing::BucketDriver;
using tierbridge::testing::FaultyDriver;
using tierbridge::testing::HostDriver;
using tierbridge::testing::Put;
using tierbridge::testing::Slurp;
using tierbridge::testing::TempDir;
using tierbridge::transfer::TransferEngine;
using tierbridge::transfer::TransferTopic;

constexpr auto kWait = std::chrono::seconds(10);

struct Fixture {
  Fixture() {
    repository = std::make_shared<MemoryRepository>();
    registry   = std::make_shared<SourceRegistry>();
    bucket     = BucketDriver();
    host       = HostDriver();
    tierbridge::testing::Mount(*registry, "bucket", SOURCE_CATEGORY_CLOUD, bucket, {CAPABILITY_MULTIPART_UPLOAD});

    config.set_part_size_bytes(4);
    config.set_workers(2);
    config.set_per_source_concurrency(2);
    config.set_max_part_attempts(2);
    config.set_retry_backoff_ms(10);
    config.set_progress_interval_ms(50);
  }

  std::unique_ptr<TransferEngine> MakeEngine() const {
    return std::make_unique<TransferEngine>(repository, registry, host, config);
  }

  TempDir                                     dir;
  std::shared_ptr<MemoryRepository>           repository;
  std::shared_ptr<SourceRegistry>             registry;
  tierbridge::storage::SourceDriverPtr        bucket;
  tierbridge::storage::SourceDriverPtr        host;
  tierbridge::runtime::config::TransferConfig config;
};

void TestMultipartUploadPublishesEachPart() {
  Fixture f;
  Put(*f.host, f.dir / "clip.bin", "hello multipart!"); // 16 bytes, 4 parts

  auto engine = f.MakeEngine();
  auto queued = engine->EnqueueUpload("bucket", f.dir / "clip.bin", "/up/clip.bin");
  assert(queued.status() == TRANSFER_STATUS_PENDING);
  assert(queued.total_parts() == 4);
  assert(queued.total_size() == 16);

  EventQueue<TransferEngine::Record> events(engine->Events(), TransferTopic(queued.id()));
  engine->Start();

  uint32_t last_part = 0;
  bool     completed = false;
  while (!completed) {
    auto event = events.Pop(kWait);
    assert(event.has_value());
    assert(event->part_index() >= last_part);
    last_part = event->part_index();
    completed = event->status() == TRANSFER_STATUS_COMPLETED;
  }
  assert(last_part == 4);

  const auto done = engine->Get(queued.id());
  assert(done.bytes_transferred() == 16);
  assert(done.has_completed_at());
  assert(Slurp(*f.bucket, "/up/clip.bin") == "hello multipart!");

  // No part directory is left behind.
  assert(f.bucket->List("/up", false).size() == 1);
  engine->Stop();
}

void TestDownloadToHost() {
  Fixture f;
  Put(*f.bucket, "/reports/q1.csv", "a,b\n1,2\n");

  auto engine = f.MakeEngine();
  engine->Start();

  auto queued = engine->EnqueueDownload("bucket", "/reports/q1.csv", f.dir / "out/q1.csv");
  auto done   = engine->Wait(queued.id(), kWait);
  assert(done.status() == TRANSFER_STATUS_COMPLETED);
  assert(done.kind() == TRANSFER_KIND_DOWNLOAD);
  assert(Slurp(*f.host, f.dir / "out/q1.csv") == "a,b\n1,2\n");
  engine->Stop();
}

void TestEmptyFileCompletes() {
  Fixture f;
  Put(*f.host, f.dir / "empty", "");

  auto engine = f.MakeEngine();
  engine->Start();
  auto done = engine->Wait(engine->EnqueueUpload("bucket", f.dir / "empty", "/empty").id(), kWait);
  assert(done.status() == TRANSFER_STATUS_COMPLETED);
  assert(done.total_parts() == 0);
  assert(f.bucket->Stat("/empty").has_value());
  engine->Stop();
}

void TestPauseResumeCancelTransitions() {
  Fixture f;
  Put(*f.host, f.dir / "big.bin", "0123456789");

  // Not started: the transfer stays queued.
  auto       engine = f.MakeEngine();
  const auto id     = engine->EnqueueUpload("bucket", f.dir / "big.bin", "/big.bin").id();

  engine->Pause(id);
  assert(engine->Get(id).status() == TRANSFER_STATUS_PAUSED);
  engine->Pause(id);
  assert(engine->Get(id).status() == TRANSFER_STATUS_PAUSED);

  bool threw = false;
  try {
    engine->Resume(id, "other");
  } catch (const tierbridge::util::SourceNotFound&) {
    threw = true;
  }
  assert(threw);

  engine->Resume(id, "bucket");
  assert(engine->Get(id).status() == TRANSFER_STATUS_PENDING);

  engine->Cancel(id);
  assert(engine->Get(id).status() == TRANSFER_STATUS_CANCELED);
  engine->Cancel(id);
  engine->Resume(id, "bucket");
  assert(engine->Get(id).status() == TRANSFER_STATUS_CANCELED);

  auto tx  = f.repository->Begin();
  auto row = f.repository->GetTransfer(*tx, id);
  tx->Commit();
  assert(row.has_value());
  assert(row->status == TRANSFER_STATUS_CANCELED);
  assert(row->completed_at_ms != 0);

  // A canceled transfer never runs.
  engine->Start();
  assert(engine->Wait(id, std::chrono::milliseconds(100)).status() == TRANSFER_STATUS_CANCELED);
  assert(!f.bucket->Stat("/big.bin").has_value());
  engine->Stop();
}

void TestRestartResumesFromPersistedPart() {
  Fixture f;
  Put(*f.host, f.dir / "resume.bin", "AAAABBBBCCCC");

  // State a previous run left behind: parts 0 and 1 landed, then the process died.
  tierbridge::db::model::TransferRecord row;
  row.id                = "resume-1";
  row.kind              = TRANSFER_KIND_UPLOAD;
  row.source_id         = "bucket";
  row.local_path        = f.dir / "resume.bin";
  row.remote_path       = "/resume.bin";
  row.total_size        = 12;
  row.part_size         = 4;
  row.total_parts       = 3;
  row.part_index        = 2;
  row.bytes_transferred = 8;
  row.status            = TRANSFER_STATUS_IN_PROGRESS;
  row.created_at_ms     = 1;
  row.updated_at_ms     = 1;
  {
    auto tx = f.repository->Begin();
    assert(f.repository->InsertTransfer(*tx, row));
    tx->Commit();
  }
  f.bucket->WritePart("/resume.bin", 0, arrow::Buffer::FromString("AAAA"));
  f.bucket->WritePart("/resume.bin", 1, arrow::Buffer::FromString("BBBB"));

  auto engine = f.MakeEngine();
  engine->Start();

  auto done = engine->Wait("resume-1", kWait);
  assert(done.status() == TRANSFER_STATUS_COMPLETED);
  assert(done.bytes_transferred() == 12);
  assert(Slurp(*f.bucket, "/resume.bin") == "AAAABBBBCCCC");
  engine->Stop();
}

void TestPendingTransferSurvivesRestart() {
  Fixture f;
  Put(*f.host, f.dir / "later.bin", "later");

  std::string id;
  {
    auto engine = f.MakeEngine();
    id          = engine->EnqueueUpload("bucket", f.dir / "later.bin", "/later.bin").id();
  }

  auto engine = f.MakeEngine();
  engine->Start();
  assert(engine->Wait(id, kWait).status() == TRANSFER_STATUS_COMPLETED);
  assert(Slurp(*f.bucket, "/later.bin") == "later");
  engine->Stop();
}

void TestEnqueueValidation() {
  Fixture f;
  auto    engine = f.MakeEngine();

  bool threw = false;
  try {
    engine->EnqueueUpload("bucket", f.dir / "missing", "/x");
  } catch (const tierbridge::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    engine->EnqueueUpload("bucket", f.dir.path(), "/x");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    engine->EnqueueDownload("nowhere", "/x", f.dir / "x");
  } catch (const tierbridge::util::SourceNotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    engine->Get("no-such-transfer");
  } catch (const tierbridge::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestListFiltersAndPrune() {
  Fixture f;
  Put(*f.host, f.dir / "a", "a");
  Put(*f.host, f.dir / "b", "b");

  auto engine = f.MakeEngine();
  auto a      = engine->EnqueueUpload("bucket", f.dir / "a", "/a").id();
  auto b      = engine->EnqueueUpload("bucket", f.dir / "b", "/b").id();
  engine->Cancel(a);

  assert(engine->List({}).size() == 2);
  assert(engine->List({.source_id = std::string("bucket"), .active_only = true}).size() == 1);
  assert(engine->List({.source_id = std::string("other"), .active_only = false}).empty());

  assert(engine->Prune(0) == 1);
  assert(engine->List({}).size() == 1);
  assert(engine->Get(b).status() == TRANSFER_STATUS_PENDING);
}

// Mounts "flaky" as a bucket whose part writes can be made to fail.
std::shared_ptr<FaultyDriver> MountFlaky(Fixture& f) {
  auto driver = std::make_shared<FaultyDriver>(BucketDriver());
  tierbridge::testing::Mount(*f.registry, "flaky", SOURCE_CATEGORY_CLOUD, driver, {CAPABILITY_MULTIPART_UPLOAD});
  return driver;
}

void TestTransientPartFailureIsRetried() {
  Fixture f;
  auto    flaky = MountFlaky(f);
  Put(*f.host, f.dir / "retry.bin", "0123456789"); // 10 bytes, 3 parts
  flaky->FailWrites(1, [] { throw std::runtime_error("connection reset"); });

  auto engine = f.MakeEngine();
  engine->Start();
  auto queued = engine->EnqueueUpload("flaky", f.dir / "retry.bin", "/retry.bin");

  auto done = engine->Wait(queued.id(), kWait);
  assert(done.status() == TRANSFER_STATUS_COMPLETED);
  assert(done.bytes_transferred() == done.total_size());
  assert(done.error().empty());
  // The first part went out twice.
  assert(flaky->write_calls() == 4);
  assert(Slurp(*flaky, "/retry.bin") == "0123456789");
}

void TestExhaustedAttemptsFailTheTransfer() {
  Fixture f;
  auto    flaky = MountFlaky(f);
  Put(*f.host, f.dir / "doomed.bin", "0123456789");
  flaky->FailWrites(2, [] { throw std::runtime_error("connection reset"); });

  auto engine = f.MakeEngine();
  engine->Start();
  auto queued = engine->EnqueueUpload("flaky", f.dir / "doomed.bin", "/doomed.bin");

  auto done = engine->Wait(queued.id(), kWait);
  assert(done.status() == TRANSFER_STATUS_FAILED);
  assert(done.error() == "connection reset");
  assert(done.error_code() == TRANSFER_ERROR_CODE_INTERNAL);
  assert(done.bytes_transferred() == 0);
  assert(flaky->write_calls() == 2);
  assert(!flaky->Exists("/doomed.bin"));
}

void TestPermissionDeniedIsNotRetried() {
  Fixture f;
  auto    flaky = MountFlaky(f);
  Put(*f.host, f.dir / "locked.bin", "0123456789");
  flaky->FailWrites(5, [] { throw tierbridge::util::PermissionDenied("bucket policy denies writes"); });

  auto engine = f.MakeEngine();
  engine->Start();
  auto queued = engine->EnqueueUpload("flaky", f.dir / "locked.bin", "/locked.bin");

  auto done = engine->Wait(queued.id(), kWait);
  assert(done.status() == TRANSFER_STATUS_FAILED);
  assert(done.error_code() == TRANSFER_ERROR_CODE_PERMISSION_DENIED);
  assert(done.error() == "bucket policy denies writes");
  assert(flaky->write_calls() == 1);

  // The failure kind survives a restart.
  engine->Stop();
  auto reloaded = f.MakeEngine();
  reloaded->Start();
  assert(reloaded->Get(queued.id()).error_code() == TRANSFER_ERROR_CODE_PERMISSION_DENIED);
}

} // namespace

int main() {
  TestMultipartUploadPublishesEachPart();
  TestDownloadToHost();
  TestEmptyFileCompletes();
  TestPauseResumeCancelTransitions();
  TestRestartResumesFromPersistedPart();
  TestPendingTransferSurvivesRestart();
  TestEnqueueValidation();
  TestListFiltersAndPrune();
  TestTransientPartFailureIsRetried();
  TestExhaustedAttemptsFailTheTransfer();
  TestPermissionDeniedIsNotRetried();

  std::cout << "tierbridge_unit_transfer_engine: pass\n";
  return 0;
}
