#include "catalog_server.hpp"

#include "grpc_error.hpp"

namespace tierbridge::grpc {

CatalogServer::CatalogServer(std::shared_ptr<tierbridge::service::CatalogService> svc) : service_(std::move(svc)) {
}

::grpc::Status CatalogServer::ListOperations(::grpc::ServerContext*, const tierbridge::vfs::v1::ListOperationsRequest* req, tierbridge::vfs::v1::ListOperationsResponse* resp) {
  try {
    *resp = service_->ListOperations(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::ListSources(::grpc::ServerContext*, const google::protobuf::Empty*, tierbridge::vfs::v1::ListSourcesResponse* resp) {
  try {
    *resp = service_->ListSources();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::GetTransferTargets(::grpc::ServerContext*, const tierbridge::vfs::v1::TransferTargetsRequest* req, tierbridge::vfs::v1::ListSourcesResponse* resp) {
  try {
    *resp = service_->GetTransferTargets(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tierbridge::grpc
