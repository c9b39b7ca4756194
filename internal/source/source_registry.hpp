#pragma once

#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/storage/source_driver.hpp"
#include "tierbridge/vfs/core/v1/types.pb.h"

namespace tierbridge::source {

// Host filesystem as seen through the native clipboard.
inline constexpr const char* kNativeSourceId = "native";

/*
  SourceRegistry

  Set of mounted sources and their drivers. Pure lookup: it never touches
  bytes itself.

  Move vs copy rule:
    an operation between two paths is a true move iff both live on the same
    source id. Anything else is copy-then-delete.
*/
class SourceRegistry {
 public:
  using StorageSource = tierbridge::vfs::core::v1::StorageSource;
  using Capability    = tierbridge::vfs::core::v1::Capability;

  // Throws AlreadyExists for a duplicate id. Fills default_tier from the
  // category when unset.
  void Mount(StorageSource source, storage::SourceDriverPtr driver);

  void Unmount(const std::string& id);

  void SetStatus(const std::string& id, tierbridge::vfs::core::v1::SourceStatus status);

  // Throws SourceNotFound.
  StorageSource Resolve(const std::string& id) const;

  bool Contains(const std::string& id) const;

  static bool SameSource(const std::string& a, const std::string& b) {
    return a == b;
  }

  static bool IsMove(const std::string& from_source_id, const std::string& to_source_id) {
    return SameSource(from_source_id, to_source_id);
  }

  std::set<Capability> CapabilitiesOf(const std::string& id) const;
  bool                 HasCapability(const std::string& id, Capability capability) const;

  storage::SourceDriverPtr Driver(const std::string& id) const;

  // Ordered by id; the native pseudo-source is not listed.
  std::vector<StorageSource> List() const;

  // Connected sources other than exclude_id.
  std::vector<StorageSource> TransferTargets(const std::string& exclude_id) const;

  static tierbridge::vfs::core::v1::TierStatus DefaultTierFor(tierbridge::vfs::core::v1::SourceCategory category);

 private:
  struct Entry {
    StorageSource            source;
    storage::SourceDriverPtr driver;
  };

  const Entry& Find(const std::string& id) const;

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> sources_;
};

} // namespace tierbridge::source
