#pragma once

#include <cstdint>
#include <string>

#include "tierbridge/vfs/core/v1/types.pb.h"

namespace tierbridge::db::model {

// Files without a row sit at their source's default tier.
struct FileTierRecord {
  std::string                           source_id;
  std::string                           path;
  tierbridge::vfs::core::v1::TierStatus tier          = tierbridge::vfs::core::v1::TIER_STATUS_UNSPECIFIED;
  uint64_t                              updated_at_ms = 0;
};

} // namespace tierbridge::db::model
