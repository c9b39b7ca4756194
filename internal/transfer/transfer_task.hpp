#pragma once

#include <string>

namespace tierbridge::transfer {

struct TransferTask {
  std::string transfer_id;
  std::string source_id;
};

} // namespace tierbridge::transfer
