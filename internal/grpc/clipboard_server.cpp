#include "clipboard_server.hpp"

#include "grpc_error.hpp"

namespace tierbridge::grpc {

ClipboardServer::ClipboardServer(std::shared_ptr<tierbridge::service::ClipboardService> svc) : service_(std::move(svc)) {
}

::grpc::Status ClipboardServer::Copy(::grpc::ServerContext*, const tierbridge::vfs::v1::ClipboardSetRequest* req, google::protobuf::Empty*) {
  try {
    service_->Copy(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClipboardServer::Cut(::grpc::ServerContext*, const tierbridge::vfs::v1::ClipboardSetRequest* req, google::protobuf::Empty*) {
  try {
    service_->Cut(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClipboardServer::Paste(::grpc::ServerContext*, const tierbridge::vfs::v1::PasteRequest* req, tierbridge::vfs::v1::BatchResult* resp) {
  try {
    *resp = service_->Paste(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClipboardServer::PasteToNative(::grpc::ServerContext*, const tierbridge::vfs::v1::PasteToNativeRequest* req, tierbridge::vfs::v1::BatchResult* resp) {
  try {
    *resp = service_->PasteToNative(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClipboardServer::CopyForNative(::grpc::ServerContext*, const tierbridge::vfs::v1::CopyForNativeRequest* req, tierbridge::vfs::v1::CopyForNativeResponse* resp) {
  try {
    *resp = service_->CopyForNative(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClipboardServer::ReadNative(::grpc::ServerContext*, const google::protobuf::Empty*, tierbridge::vfs::v1::NativePaths* resp) {
  try {
    *resp = service_->ReadNative();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClipboardServer::WriteNative(::grpc::ServerContext*, const tierbridge::vfs::v1::NativePaths* req, tierbridge::vfs::v1::NativePaths* resp) {
  try {
    *resp = service_->WriteNative(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClipboardServer::PasteNativeIntoVfs(::grpc::ServerContext*, const tierbridge::vfs::v1::PasteNativeIntoVfsRequest* req, tierbridge::vfs::v1::BatchResult* resp) {
  try {
    *resp = service_->PasteNativeIntoVfs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClipboardServer::HasFiles(::grpc::ServerContext*, const google::protobuf::Empty*, tierbridge::vfs::v1::HasFilesResponse* resp) {
  try {
    *resp = service_->HasFiles();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClipboardServer::Get(::grpc::ServerContext*, const google::protobuf::Empty*, tierbridge::vfs::v1::GetClipboardResponse* resp) {
  try {
    *resp = service_->Get();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ClipboardServer::Clear(::grpc::ServerContext*, const google::protobuf::Empty*, google::protobuf::Empty*) {
  try {
    service_->Clear();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace tierbridge::grpc
