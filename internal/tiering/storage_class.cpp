#include "storage_class.hpp"

namespace tierbridge::tiering {

using namespace tierbridge::vfs::core::v1;

std::string TierName(TierStatus tier) {
  switch (tier) {
    case TIER_STATUS_HOT:
      return "hot";
    case TIER_STATUS_WARM:
      return "warm";
    case TIER_STATUS_COLD:
      return "cold";
    case TIER_STATUS_NEARLINE:
      return "nearline";
    case TIER_STATUS_ARCHIVE:
      return "archive";
    default:
      return "unspecified";
  }
}

std::string StorageClassFor(Provider provider, TierStatus tier) {
  switch (provider) {
    case PROVIDER_S3:
      if (tier == TIER_STATUS_COLD) return "GLACIER_IR";
      if (tier == TIER_STATUS_ARCHIVE) return "DEEP_ARCHIVE";
      return "STANDARD";
    case PROVIDER_GCS:
      if (tier == TIER_STATUS_NEARLINE) return "NEARLINE";
      if (tier == TIER_STATUS_COLD || tier == TIER_STATUS_ARCHIVE) return "COLDLINE";
      return "STANDARD";
    case PROVIDER_AZURE:
      if (tier == TIER_STATUS_HOT) return "Hot";
      if (tier == TIER_STATUS_ARCHIVE) return "Archive";
      return "Cool";
    default:
      return TierName(tier);
  }
}

} // namespace tierbridge::tiering
