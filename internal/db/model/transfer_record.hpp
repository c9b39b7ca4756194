#pragma once

#include <cstdint>
#include <string>

#include "tierbridge/vfs/core/v1/types.pb.h"

namespace tierbridge::db::model {

/*
  Persistent transfer row.

  Written before the first byte moves and after every completed part, so a
  restart resumes from (part_index, bytes_transferred). Speed and ETA are
  derived at runtime and never stored.
*/
struct TransferRecord {
  std::string id;

  tierbridge::vfs::core::v1::TransferKind kind = tierbridge::vfs::core::v1::TRANSFER_KIND_UNSPECIFIED;

  std::string source_id;
  std::string local_path;
  std::string remote_path;

  uint64_t total_size        = 0;
  uint64_t bytes_transferred = 0;
  uint32_t part_index        = 0;
  uint32_t total_parts       = 0;
  uint64_t part_size         = 0;

  tierbridge::vfs::core::v1::TransferStatus status = tierbridge::vfs::core::v1::TRANSFER_STATUS_PENDING;
  std::string                               error;
  tierbridge::vfs::core::v1::TransferErrorCode error_code = tierbridge::vfs::core::v1::TRANSFER_ERROR_CODE_UNSPECIFIED;

  uint64_t created_at_ms   = 0;
  uint64_t updated_at_ms   = 0;
  uint64_t completed_at_ms = 0; // 0 = not terminal
};

} // namespace tierbridge::db::model
