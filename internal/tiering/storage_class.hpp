#pragma once

#include <string>

#include "tierbridge/vfs/core/v1/types.pb.h"

namespace tierbridge::tiering {

/*
  Provider storage class backing a logical tier.

      tier       s3            gcs        azure
      hot        STANDARD      STANDARD   Hot
      warm       STANDARD      STANDARD   Cool
      nearline   STANDARD      NEARLINE   Cool
      cold       GLACIER_IR    COLDLINE   Cool
      archive    DEEP_ARCHIVE  COLDLINE   Archive

  Generic sources report the tier name itself.
*/
std::string StorageClassFor(tierbridge::vfs::core::v1::Provider provider, tierbridge::vfs::core::v1::TierStatus tier);

std::string TierName(tierbridge::vfs::core::v1::TierStatus tier);

} // namespace tierbridge::tiering
