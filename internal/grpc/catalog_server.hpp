#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/catalog_service.hpp"
#include "tierbridge/vfs/v1.hpp"

namespace tierbridge::grpc {

class CatalogServer final : public tierbridge::vfs::v1::CatalogService::Service {
 public:
  explicit CatalogServer(std::shared_ptr<tierbridge::service::CatalogService> svc);

  ::grpc::Status ListOperations(::grpc::ServerContext*, const tierbridge::vfs::v1::ListOperationsRequest*, tierbridge::vfs::v1::ListOperationsResponse*) override;

  ::grpc::Status ListSources(::grpc::ServerContext*, const google::protobuf::Empty*, tierbridge::vfs::v1::ListSourcesResponse*) override;

  ::grpc::Status GetTransferTargets(::grpc::ServerContext*, const tierbridge::vfs::v1::TransferTargetsRequest*, tierbridge::vfs::v1::ListSourcesResponse*) override;

 private:
  std::shared_ptr<tierbridge::service::CatalogService> service_;
};

} // namespace tierbridge::grpc
