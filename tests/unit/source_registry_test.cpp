#include "internal/source/source_registry.hpp"

#include <cassert>
#include <iostream>

#include "internal/tiering/storage_class.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_sources.hpp"

namespace {

using namespace tierbridge::vfs::core::v1;
using tierbridge::source::SourceRegistry;
using tierbridge::testing::BucketDriver;
using tierbridge::testing::Mount;

void TestMountFillsDefaults() {
  SourceRegistry registry;
  Mount(registry, "s3", SOURCE_CATEGORY_CLOUD, BucketDriver(), {CAPABILITY_TIERING, CAPABILITY_MULTIPART_UPLOAD});
  Mount(registry, "nas", SOURCE_CATEGORY_NETWORK, BucketDriver());
  Mount(registry, "disk", SOURCE_CATEGORY_LOCAL, BucketDriver(), {CAPABILITY_ATOMIC_RENAME});

  assert(registry.Resolve("s3").default_tier() == TIER_STATUS_COLD);
  assert(registry.Resolve("nas").default_tier() == TIER_STATUS_WARM);
  assert(registry.Resolve("disk").default_tier() == TIER_STATUS_HOT);
  assert(registry.Resolve("disk").status() == SOURCE_STATUS_CONNECTED);

  assert(registry.HasCapability("s3", CAPABILITY_TIERING));
  assert(!registry.HasCapability("nas", CAPABILITY_TIERING));
  assert(registry.CapabilitiesOf("s3").size() == 2);
}

void TestDuplicateAndUnknownSources() {
  SourceRegistry registry;
  Mount(registry, "s3", SOURCE_CATEGORY_CLOUD, BucketDriver());

  bool threw = false;
  try {
    Mount(registry, "s3", SOURCE_CATEGORY_CLOUD, BucketDriver());
  } catch (const tierbridge::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    registry.Resolve("missing");
  } catch (const tierbridge::util::SourceNotFound& e) {
    threw = e.source_id() == "missing";
  }
  assert(threw);

  registry.Unmount("s3");
  assert(!registry.Contains("s3"));
}

void TestMoveRuleIsSameSource() {
  assert(SourceRegistry::IsMove("s3", "s3"));
  assert(!SourceRegistry::IsMove("s3", "gcs"));
}

void TestListingAndTransferTargets() {
  SourceRegistry registry;
  Mount(registry, "zeta", SOURCE_CATEGORY_CLOUD, BucketDriver());
  Mount(registry, "alpha", SOURCE_CATEGORY_LOCAL, BucketDriver());
  Mount(registry, "offline", SOURCE_CATEGORY_NETWORK, BucketDriver());
  Mount(registry, tierbridge::source::kNativeSourceId, SOURCE_CATEGORY_LOCAL, BucketDriver());
  registry.SetStatus("offline", SOURCE_STATUS_DISCONNECTED);

  const auto all = registry.List();
  assert(all.size() == 3);
  assert(all[0].id() == "alpha");
  assert(all[2].id() == "zeta");

  const auto targets = registry.TransferTargets("alpha");
  assert(targets.size() == 1);
  assert(targets[0].id() == "zeta");
}

void TestStorageClassMapping() {
  using tierbridge::tiering::StorageClassFor;
  assert(StorageClassFor(PROVIDER_S3, TIER_STATUS_COLD) == "GLACIER_IR");
  assert(StorageClassFor(PROVIDER_S3, TIER_STATUS_ARCHIVE) == "DEEP_ARCHIVE");
  assert(StorageClassFor(PROVIDER_GCS, TIER_STATUS_NEARLINE) == "NEARLINE");
  assert(StorageClassFor(PROVIDER_AZURE, TIER_STATUS_HOT) == "Hot");
  assert(StorageClassFor(PROVIDER_GENERIC, TIER_STATUS_WARM) == "warm");
}

} // namespace

int main() {
  TestMountFillsDefaults();
  TestDuplicateAndUnknownSources();
  TestMoveRuleIsSameSource();
  TestListingAndTransferTargets();
  TestStorageClassMapping();

  std::cout << "tierbridge_unit_source_registry: pass\n";
  return 0;
}
