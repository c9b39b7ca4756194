#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/clipboard_service.hpp"
#include "tierbridge/vfs/v1.hpp"

namespace tierbridge::grpc {

class ClipboardServer final : public tierbridge::vfs::v1::ClipboardService::Service {
 public:
  explicit ClipboardServer(std::shared_ptr<tierbridge::service::ClipboardService> svc);

  ::grpc::Status Copy(::grpc::ServerContext*, const tierbridge::vfs::v1::ClipboardSetRequest*, google::protobuf::Empty*) override;

  ::grpc::Status Cut(::grpc::ServerContext*, const tierbridge::vfs::v1::ClipboardSetRequest*, google::protobuf::Empty*) override;

  ::grpc::Status Paste(::grpc::ServerContext*, const tierbridge::vfs::v1::PasteRequest*, tierbridge::vfs::v1::BatchResult*) override;

  ::grpc::Status PasteToNative(::grpc::ServerContext*, const tierbridge::vfs::v1::PasteToNativeRequest*, tierbridge::vfs::v1::BatchResult*) override;

  ::grpc::Status CopyForNative(::grpc::ServerContext*, const tierbridge::vfs::v1::CopyForNativeRequest*, tierbridge::vfs::v1::CopyForNativeResponse*) override;

  ::grpc::Status ReadNative(::grpc::ServerContext*, const google::protobuf::Empty*, tierbridge::vfs::v1::NativePaths*) override;

  ::grpc::Status WriteNative(::grpc::ServerContext*, const tierbridge::vfs::v1::NativePaths*, tierbridge::vfs::v1::NativePaths*) override;

  ::grpc::Status PasteNativeIntoVfs(::grpc::ServerContext*, const tierbridge::vfs::v1::PasteNativeIntoVfsRequest*, tierbridge::vfs::v1::BatchResult*) override;

  ::grpc::Status HasFiles(::grpc::ServerContext*, const google::protobuf::Empty*, tierbridge::vfs::v1::HasFilesResponse*) override;

  ::grpc::Status Get(::grpc::ServerContext*, const google::protobuf::Empty*, tierbridge::vfs::v1::GetClipboardResponse*) override;

  ::grpc::Status Clear(::grpc::ServerContext*, const google::protobuf::Empty*, google::protobuf::Empty*) override;

 private:
  std::shared_ptr<tierbridge::service::ClipboardService> service_;
};

} // namespace tierbridge::grpc
