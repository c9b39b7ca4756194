#include "transfer_server.hpp"

#include "grpc_error.hpp"

namespace tierbridge::grpc {

TransferServer::TransferServer(std::shared_ptr<tierbridge::service::TransferService> svc) : service_(std::move(svc)) {
}

::grpc::Status TransferServer::EnqueueUpload(::grpc::ServerContext*, const tierbridge::vfs::v1::EnqueueTransferRequest* req, tierbridge::vfs::v1::TransferRecord* resp) {
  try {
    *resp = service_->EnqueueUpload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TransferServer::EnqueueDownload(::grpc::ServerContext*, const tierbridge::vfs::v1::EnqueueTransferRequest* req, tierbridge::vfs::v1::TransferRecord* resp) {
  try {
    *resp = service_->EnqueueDownload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TransferServer::ListTransfers(::grpc::ServerContext*, const tierbridge::vfs::v1::ListTransfersRequest* req, tierbridge::vfs::v1::ListTransfersResponse* resp) {
  try {
    *resp = service_->ListTransfers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TransferServer::PauseTransfer(::grpc::ServerContext*, const tierbridge::vfs::v1::TransferControlRequest* req, google::protobuf::Empty*) {
  try {
    service_->PauseTransfer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TransferServer::ResumeTransfer(::grpc::ServerContext*, const tierbridge::vfs::v1::TransferControlRequest* req, google::protobuf::Empty*) {
  try {
    service_->ResumeTransfer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TransferServer::CancelTransfer(::grpc::ServerContext*, const tierbridge::vfs::v1::TransferControlRequest* req, google::protobuf::Empty*) {
  try {
    service_->CancelTransfer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TransferServer::WatchTransfer(::grpc::ServerContext* ctx, const tierbridge::vfs::v1::TransferControlRequest* req,
                                             ::grpc::ServerWriter<tierbridge::vfs::v1::TransferRecord>* writer) {
  try {
    service_->WatchTransfer(
        *req, [writer](const tierbridge::vfs::v1::TransferRecord& event) { return writer->Write(event); },
        [ctx] { return ctx->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tierbridge::grpc
