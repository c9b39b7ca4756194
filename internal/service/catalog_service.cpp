#include "catalog_service.hpp"

#include "internal/ledger/operation_ledger.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/source/source_registry.hpp"

namespace tierbridge::service {

using namespace tierbridge::vfs::v1;

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListOperationsResponse CatalogService::ListOperations(const ListOperationsRequest& req) {
  return ObserveRpc("CatalogService.ListOperations", "", [&] {
    ListOperationsResponse resp;
    if (req.active_only()) {
      for (const auto& record : ctx_.ledger->Active()) {
        *resp.add_operations() = record;
      }
      return resp;
    }

    ledger::OperationLedger::ListFilter filter;
    for (const auto category : req.categories()) {
      filter.categories.insert(static_cast<SourceCategory>(category));
    }
    for (const auto& record : ctx_.ledger->List(filter)) {
      *resp.add_operations() = record;
    }
    return resp;
  });
}

ListSourcesResponse CatalogService::ListSources() {
  return ObserveRpc("CatalogService.ListSources", "", [&] {
    ListSourcesResponse resp;
    for (const auto& source : ctx_.registry->List()) {
      *resp.add_sources() = source;
    }
    return resp;
  });
}

ListSourcesResponse CatalogService::GetTransferTargets(const TransferTargetsRequest& req) {
  return ObserveRpc("CatalogService.GetTransferTargets", req.exclude_source_id(), [&] {
    ListSourcesResponse resp;
    for (const auto& source : ctx_.registry->TransferTargets(req.exclude_source_id())) {
      *resp.add_sources() = source;
    }
    return resp;
  });
}

} // namespace tierbridge::service
