#pragma once

#include <functional>

#include "service_context.hpp"
#include "tierbridge/vfs/v1.hpp"

namespace tierbridge::service {

class TieringService {
 public:
  // Returns false when the stream is gone.
  template <typename Event>
  using Emit      = std::function<bool(const Event&)>;
  using Cancelled = std::function<bool()>;

  explicit TieringService(ServiceContext ctx);

  tierbridge::vfs::v1::WarmHandle WarmFile(const tierbridge::vfs::v1::WarmFileRequest& req);

  /*
    Streams warm progress until the watched request completes or errors.
    An empty request_id streams every request until the caller cancels.
  */
  void WatchWarm(const tierbridge::vfs::v1::WatchWarmRequest& req, const Emit<tierbridge::vfs::v1::WarmProgress>& emit,
                 const Cancelled& cancelled);

  tierbridge::vfs::v1::SyncResult ChangeTier(const tierbridge::vfs::v1::ChangeTierRequest& req);

  tierbridge::vfs::v1::TranscodeHandle TranscodeVideo(const tierbridge::vfs::v1::TranscodeVideoRequest& req);

  void WatchTranscode(const tierbridge::vfs::v1::WatchTranscodeRequest& req, const Emit<tierbridge::vfs::v1::TranscodeProgress>& emit,
                      const Cancelled& cancelled);

 private:
  ServiceContext ctx_;
};

} // namespace tierbridge::service
