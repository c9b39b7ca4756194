#pragma once

#include "config/config.pb.h"
#include "internal/storage/source_driver.hpp"

namespace tierbridge::storage {

class StorageFactory {
 public:
  // Resolves the source URI through Arrow and wraps it in a driver.
  static SourceDriverPtr Build(const tierbridge::runtime::config::SourceConfig& source);
};

} // namespace tierbridge::storage
