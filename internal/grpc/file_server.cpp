#include "file_server.hpp"

#include "grpc_error.hpp"

namespace tierbridge::grpc {

FileServer::FileServer(std::shared_ptr<tierbridge::service::FileService> svc) : service_(std::move(svc)) {
}

::grpc::Status FileServer::Move(::grpc::ServerContext*, const tierbridge::vfs::v1::MoveRequest* req, tierbridge::vfs::v1::MoveResponse* resp) {
  try {
    *resp = service_->Move(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FileServer::MoveToSource(::grpc::ServerContext*, const tierbridge::vfs::v1::MoveRequest* req, tierbridge::vfs::v1::MoveResponse* resp) {
  try {
    *resp = service_->Move(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FileServer::MoveBatch(::grpc::ServerContext*, const tierbridge::vfs::v1::BatchRequest* req, tierbridge::vfs::v1::BatchResult* resp) {
  try {
    *resp = service_->MoveBatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FileServer::Copy(::grpc::ServerContext*, const tierbridge::vfs::v1::CopyRequest* req, tierbridge::vfs::v1::CopyResponse* resp) {
  try {
    *resp = service_->Copy(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FileServer::CopyToSource(::grpc::ServerContext*, const tierbridge::vfs::v1::CopyRequest* req, tierbridge::vfs::v1::CopyResponse* resp) {
  try {
    *resp = service_->Copy(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FileServer::CopyBatch(::grpc::ServerContext*, const tierbridge::vfs::v1::BatchRequest* req, tierbridge::vfs::v1::BatchResult* resp) {
  try {
    *resp = service_->CopyBatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FileServer::Rename(::grpc::ServerContext*, const tierbridge::vfs::v1::RenameRequest* req, google::protobuf::Empty*) {
  try {
    service_->Rename(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FileServer::DeleteRecursive(::grpc::ServerContext*, const tierbridge::vfs::v1::PathRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteRecursive(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FileServer::Mkdir(::grpc::ServerContext*, const tierbridge::vfs::v1::PathRequest* req, google::protobuf::Empty*) {
  try {
    service_->Mkdir(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FileServer::List(::grpc::ServerContext*, const tierbridge::vfs::v1::ListRequest* req, tierbridge::vfs::v1::ListResponse* resp) {
  try {
    *resp = service_->List(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tierbridge::grpc
