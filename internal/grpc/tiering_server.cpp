#include "tiering_server.hpp"

#include "grpc_error.hpp"

namespace tierbridge::grpc {

TieringServer::TieringServer(std::shared_ptr<tierbridge::service::TieringService> svc) : service_(std::move(svc)) {
}

::grpc::Status TieringServer::WarmFile(::grpc::ServerContext*, const tierbridge::vfs::v1::WarmFileRequest* req, tierbridge::vfs::v1::WarmHandle* resp) {
  try {
    *resp = service_->WarmFile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TieringServer::WatchWarm(::grpc::ServerContext* ctx, const tierbridge::vfs::v1::WatchWarmRequest* req,
                                        ::grpc::ServerWriter<tierbridge::vfs::v1::WarmProgress>* writer) {
  try {
    service_->WatchWarm(
        *req, [writer](const tierbridge::vfs::v1::WarmProgress& event) { return writer->Write(event); },
        [ctx] { return ctx->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TieringServer::ChangeTier(::grpc::ServerContext*, const tierbridge::vfs::v1::ChangeTierRequest* req, tierbridge::vfs::v1::SyncResult* resp) {
  try {
    *resp = service_->ChangeTier(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TieringServer::TranscodeVideo(::grpc::ServerContext*, const tierbridge::vfs::v1::TranscodeVideoRequest* req, tierbridge::vfs::v1::TranscodeHandle* resp) {
  try {
    *resp = service_->TranscodeVideo(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TieringServer::WatchTranscode(::grpc::ServerContext* ctx, const tierbridge::vfs::v1::WatchTranscodeRequest* req,
                                             ::grpc::ServerWriter<tierbridge::vfs::v1::TranscodeProgress>* writer) {
  try {
    service_->WatchTranscode(
        *req, [writer](const tierbridge::vfs::v1::TranscodeProgress& event) { return writer->Write(event); },
        [ctx] { return ctx->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tierbridge::grpc
