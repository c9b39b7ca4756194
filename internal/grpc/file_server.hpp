#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/file_service.hpp"
#include "tierbridge/vfs/v1.hpp"

namespace tierbridge::grpc {

class FileServer final : public tierbridge::vfs::v1::FileService::Service {
 public:
  explicit FileServer(std::shared_ptr<tierbridge::service::FileService> svc);

  ::grpc::Status Move(::grpc::ServerContext*, const tierbridge::vfs::v1::MoveRequest*, tierbridge::vfs::v1::MoveResponse*) override;

  ::grpc::Status MoveToSource(::grpc::ServerContext*, const tierbridge::vfs::v1::MoveRequest*, tierbridge::vfs::v1::MoveResponse*) override;

  ::grpc::Status MoveBatch(::grpc::ServerContext*, const tierbridge::vfs::v1::BatchRequest*, tierbridge::vfs::v1::BatchResult*) override;

  ::grpc::Status Copy(::grpc::ServerContext*, const tierbridge::vfs::v1::CopyRequest*, tierbridge::vfs::v1::CopyResponse*) override;

  ::grpc::Status CopyToSource(::grpc::ServerContext*, const tierbridge::vfs::v1::CopyRequest*, tierbridge::vfs::v1::CopyResponse*) override;

  ::grpc::Status CopyBatch(::grpc::ServerContext*, const tierbridge::vfs::v1::BatchRequest*, tierbridge::vfs::v1::BatchResult*) override;

  ::grpc::Status Rename(::grpc::ServerContext*, const tierbridge::vfs::v1::RenameRequest*, google::protobuf::Empty*) override;

  ::grpc::Status DeleteRecursive(::grpc::ServerContext*, const tierbridge::vfs::v1::PathRequest*, google::protobuf::Empty*) override;

  ::grpc::Status Mkdir(::grpc::ServerContext*, const tierbridge::vfs::v1::PathRequest*, google::protobuf::Empty*) override;

  ::grpc::Status List(::grpc::ServerContext*, const tierbridge::vfs::v1::ListRequest*, tierbridge::vfs::v1::ListResponse*) override;

 private:
  std::shared_ptr<tierbridge::service::FileService> service_;
};

} // namespace tierbridge::grpc
