#pragma once

#include "service_context.hpp"
#include "tierbridge/vfs/v1.hpp"

namespace tierbridge::service {

// Read-only views: mounted sources, transfer targets and the operation ledger.
class CatalogService {
 public:
  explicit CatalogService(ServiceContext ctx);

  tierbridge::vfs::v1::ListOperationsResponse ListOperations(const tierbridge::vfs::v1::ListOperationsRequest& req);

  tierbridge::vfs::v1::ListSourcesResponse ListSources();

  tierbridge::vfs::v1::ListSourcesResponse GetTransferTargets(const tierbridge::vfs::v1::TransferTargetsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace tierbridge::service
