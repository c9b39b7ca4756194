#pragma once

#include <exception>
#include <string>

#include "tierbridge/vfs/core/v1/types.pb.h"

namespace tierbridge::transfer {

/*
  Transfer failures are persisted as (error_code, error). The code keeps the
  util::errors type across the engine boundary so a caller waiting on the
  transfer can rethrow what the worker saw.
*/
tierbridge::vfs::core::v1::TransferErrorCode ClassifyError(const std::exception& e);

[[noreturn]] void ThrowTransferError(tierbridge::vfs::core::v1::TransferErrorCode code, const std::string& message);

} // namespace tierbridge::transfer
