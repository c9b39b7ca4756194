#pragma once

#include <cstdint>
#include <string>

namespace tierbridge::tiering {

struct WarmTask {
  std::string request_id;
  std::string source_id;
  std::string path;
  int32_t     priority = 0;
  uint64_t    seq      = 0; // FIFO within a priority
};

} // namespace tierbridge::tiering
