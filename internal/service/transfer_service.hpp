#pragma once

#include <functional>

#include "service_context.hpp"
#include "tierbridge/vfs/v1.hpp"

namespace tierbridge::service {

class TransferService {
 public:
  using Emit      = std::function<bool(const tierbridge::vfs::v1::TransferRecord&)>;
  using Cancelled = std::function<bool()>;

  explicit TransferService(ServiceContext ctx);

  tierbridge::vfs::v1::TransferRecord EnqueueUpload(const tierbridge::vfs::v1::EnqueueTransferRequest& req);

  // Refuses files that are not resident; warm them first.
  tierbridge::vfs::v1::TransferRecord EnqueueDownload(const tierbridge::vfs::v1::EnqueueTransferRequest& req);

  tierbridge::vfs::v1::ListTransfersResponse ListTransfers(const tierbridge::vfs::v1::ListTransfersRequest& req);

  void PauseTransfer(const tierbridge::vfs::v1::TransferControlRequest& req);
  void ResumeTransfer(const tierbridge::vfs::v1::TransferControlRequest& req);
  void CancelTransfer(const tierbridge::vfs::v1::TransferControlRequest& req);

  // Streams record snapshots until the transfer is terminal or the caller cancels.
  void WatchTransfer(const tierbridge::vfs::v1::TransferControlRequest& req, const Emit& emit, const Cancelled& cancelled);

 private:
  // Throws NotFound when the id is unknown or belongs to another source.
  tierbridge::vfs::v1::TransferRecord Lookup(const tierbridge::vfs::v1::TransferControlRequest& req) const;

  ServiceContext ctx_;
};

} // namespace tierbridge::service
