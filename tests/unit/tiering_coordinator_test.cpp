#include "internal/tiering/tiering_coordinator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/source/source_registry.hpp"
#include "internal/tiering/warm_queue.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_sources.hpp"

namespace {

using namespace tierbridge::vfs::core::v1;
using tierbridge::db::memory::MemoryRepository;
using tierbridge::source::SourceRegistry;
using tierbridge::testing::BucketDriver;
using tierbridge::testing::Put;
using tierbridge::tiering::TieringCoordinator;
using tierbridge::tiering::WarmQueue;
using tierbridge::tiering::WarmTask;

constexpr auto kWait = std::chrono::seconds(10);

struct Fixture {
  Fixture() {
    repository = std::make_shared<MemoryRepository>();
    registry   = std::make_shared<SourceRegistry>();
    archive    = BucketDriver();
    plain      = BucketDriver();
    tierbridge::testing::Mount(*registry, "glacier", SOURCE_CATEGORY_CLOUD, archive, {CAPABILITY_TIERING});
    tierbridge::testing::Mount(*registry, "nas", SOURCE_CATEGORY_NETWORK, plain);

    // Cold retrieval is instant so warms finish inside the test; archive is slow.
    config.mutable_retrieval_sec()->set_cold_sec(0);
    config.mutable_retrieval_sec()->set_archive_sec(43200);
    config.set_max_blocking_retrieval_sec(900);
    config.set_workers(1);
    config.set_read_chunk_bytes(3);

    Put(*archive, "/movie.mkv", "0123456789");
    Put(*plain, "/notes.txt", "notes");
  }

  std::shared_ptr<MemoryRepository>          repository;
  std::shared_ptr<SourceRegistry>            registry;
  tierbridge::storage::SourceDriverPtr       archive;
  tierbridge::storage::SourceDriverPtr       plain;
  tierbridge::runtime::config::TieringConfig config;
};

void TestWarmQueueOrdersByPriority() {
  WarmQueue queue;
  queue.Enqueue(WarmTask{.request_id = "low", .priority = 0});
  queue.Enqueue(WarmTask{.request_id = "high", .priority = 10});
  queue.Enqueue(WarmTask{.request_id = "low-2", .priority = 0});

  assert(queue.Dequeue()->request_id == "high");
  assert(queue.Dequeue()->request_id == "low");
  assert(queue.Dequeue()->request_id == "low-2");

  queue.Shutdown();
  assert(!queue.Dequeue().has_value());
}

void TestTierFallsBackToSourceDefault() {
  Fixture            f;
  TieringCoordinator tiering(f.repository, f.registry, f.config);

  // Cloud sources default to cold; sources without tiering are always hot.
  assert(tiering.TierOf("glacier", "/movie.mkv") == TIER_STATUS_COLD);
  assert(tiering.TierOf("nas", "/notes.txt") == TIER_STATUS_HOT);
  assert(tiering.EstimateRetrievalSec("nas", "/notes.txt") == 0);
  assert(tiering.RetrievalSecFor(TIER_STATUS_ARCHIVE) == 43200);
}

void TestWarmingHotFileCompletesImmediately() {
  Fixture            f;
  TieringCoordinator tiering(f.repository, f.registry, f.config);

  const auto handle   = tiering.Warm("nas", "/notes.txt");
  const auto progress = tiering.WaitWarm(handle.request_id(), std::chrono::milliseconds(0));
  assert(progress.status() == WARM_STATE_COMPLETED);
  assert(progress.progress() == 100);
  assert(handle.estimated_retrieval_sec() == 0);
}

void TestWarmPromotesColdFileToHot() {
  Fixture            f;
  TieringCoordinator tiering(f.repository, f.registry, f.config);
  tiering.Start();

  const auto handle = tiering.Warm("glacier", "movie.mkv");
  assert(handle.path() == "/movie.mkv");

  const auto progress = tiering.WaitWarm(handle.request_id(), kWait);
  assert(progress.status() == WARM_STATE_COMPLETED);
  assert(progress.bytes_transferred() == 10);
  assert(progress.total_bytes() == 10);
  assert(tiering.TierOf("glacier", "/movie.mkv") == TIER_STATUS_HOT);

  // Once hot, a repeated warm is a no-op.
  const auto again = tiering.Warm("glacier", "/movie.mkv");
  assert(tiering.WaitWarm(again.request_id(), std::chrono::milliseconds(0)).status() == WARM_STATE_COMPLETED);
  tiering.Stop();
}

void TestConcurrentWarmsShareOneRequest() {
  Fixture            f;
  TieringCoordinator tiering(f.repository, f.registry, f.config);

  // Not started, so the first request stays queued.
  const auto first  = tiering.Warm("glacier", "/movie.mkv");
  const auto second = tiering.Warm("glacier", "/movie.mkv", 5);
  assert(first.request_id() == second.request_id());

  tiering.CancelWarm(first.request_id());
  const auto canceled = tiering.WaitWarm(first.request_id(), std::chrono::milliseconds(0));
  assert(canceled.status() == WARM_STATE_ERROR);
  assert(canceled.error() == "canceled");

  // A canceled request frees the file for a new one.
  const auto third = tiering.Warm("glacier", "/movie.mkv");
  assert(third.request_id() != first.request_id());
}

void TestEnsureResidentRespectsPolicy() {
  Fixture            f;
  TieringCoordinator tiering(f.repository, f.registry, f.config);
  tiering.Start();

  // Non-blocking callers learn the retrieval estimate instead of waiting.
  bool threw = false;
  try {
    tiering.EnsureResident("glacier", "/movie.mkv", {.block = false});
  } catch (const tierbridge::util::RetrievalRequired& e) {
    threw = e.estimated_retrieval_sec() == 0;
  }
  assert(threw);

  tiering.EnsureResident("glacier", "/movie.mkv", {.block = true});
  assert(tiering.TierOf("glacier", "/movie.mkv") == TIER_STATUS_HOT);

  // Archive retrieval is over the blocking limit even for blocking callers.
  Put(*f.archive, "/deep.tar", "x");
  auto sync = tiering.ChangeTier("glacier", {"/deep.tar"}, TIER_STATUS_ARCHIVE);
  assert(sync.files_synced() == 1);

  threw = false;
  try {
    tiering.EnsureResident("glacier", "/deep.tar", {.block = true});
  } catch (const tierbridge::util::RetrievalRequired& e) {
    threw = e.estimated_retrieval_sec() == 43200;
  }
  assert(threw);
  tiering.Stop();
}

void TestChangeTierReportsPerFileOutcome() {
  Fixture            f;
  TieringCoordinator tiering(f.repository, f.registry, f.config);
  tiering.Start();

  auto result = tiering.ChangeTier("glacier", {"/movie.mkv", "/missing.bin"}, TIER_STATUS_COLD);
  assert(result.files_skipped() == 1);
  assert(result.files_failed() == 1);
  assert(result.errors_size() == 1);

  result = tiering.ChangeTier("glacier", {"/movie.mkv"}, TIER_STATUS_HOT);
  assert(result.files_synced() == 1);
  assert(result.bytes_transferred() == 10);
  assert(tiering.TierOf("glacier", "/movie.mkv") == TIER_STATUS_HOT);

  result = tiering.ChangeTier("glacier", {"/movie.mkv"}, TIER_STATUS_NEARLINE);
  assert(result.files_synced() == 1);
  assert(tiering.TierOf("glacier", "/movie.mkv") == TIER_STATUS_NEARLINE);

  bool threw = false;
  try {
    tiering.ChangeTier("nas", {"/notes.txt"}, TIER_STATUS_COLD);
  } catch (const tierbridge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    tiering.ChangeTier("glacier", {"/movie.mkv"}, TIER_STATUS_UNSPECIFIED);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  tiering.Stop();
}

void TestStopFailsQueuedWarms() {
  Fixture f;
  f.config.mutable_retrieval_sec()->set_cold_sec(3600);
  TieringCoordinator tiering(f.repository, f.registry, f.config);
  tiering.Start();

  const auto handle = tiering.Warm("glacier", "/movie.mkv");
  assert(handle.estimated_retrieval_sec() == 3600);

  tiering.Stop();
  const auto progress = tiering.WaitWarm(handle.request_id(), std::chrono::milliseconds(0));
  assert(progress.status() == WARM_STATE_ERROR);
  assert(tiering.TierOf("glacier", "/movie.mkv") == TIER_STATUS_COLD);
}

} // namespace

int main() {
  TestWarmQueueOrdersByPriority();
  TestTierFallsBackToSourceDefault();
  TestWarmingHotFileCompletesImmediately();
  TestWarmPromotesColdFileToHot();
  TestConcurrentWarmsShareOneRequest();
  TestEnsureResidentRespectsPolicy();
  TestChangeTierReportsPerFileOutcome();
  TestStopFailsQueuedWarms();

  std::cout << "tierbridge_unit_tiering_coordinator: pass\n";
  return 0;
}
