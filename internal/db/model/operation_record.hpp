#pragma once

#include <cstdint>
#include <string>

#include "tierbridge/vfs/core/v1/types.pb.h"

namespace tierbridge::db::model {

/*
  Ledger row. Category is captured when the entry is created so history
  filtering keeps working after the source is unmounted.
*/
struct OperationRecord {
  std::string id;

  tierbridge::vfs::core::v1::OperationType  type            = tierbridge::vfs::core::v1::OPERATION_TYPE_UNSPECIFIED;
  std::string                               source_id;
  tierbridge::vfs::core::v1::SourceCategory source_category = tierbridge::vfs::core::v1::SOURCE_CATEGORY_UNSPECIFIED;

  std::string source_path;
  std::string dest_path;

  uint64_t file_size       = 0;
  uint64_t bytes_processed = 0;

  tierbridge::vfs::core::v1::OperationStatus status = tierbridge::vfs::core::v1::OPERATION_STATUS_PENDING;
  std::string                                error;

  uint64_t started_at_ms   = 0;
  uint64_t completed_at_ms = 0;

  // Insertion order, breaks ties between entries started in the same millisecond.
  uint64_t seq = 0;
};

} // namespace tierbridge::db::model
