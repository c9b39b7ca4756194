#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/transfer_service.hpp"
#include "tierbridge/vfs/v1.hpp"

namespace tierbridge::grpc {

class TransferServer final : public tierbridge::vfs::v1::TransferService::Service {
 public:
  explicit TransferServer(std::shared_ptr<tierbridge::service::TransferService> svc);

  ::grpc::Status EnqueueUpload(::grpc::ServerContext*, const tierbridge::vfs::v1::EnqueueTransferRequest*, tierbridge::vfs::v1::TransferRecord*) override;

  ::grpc::Status EnqueueDownload(::grpc::ServerContext*, const tierbridge::vfs::v1::EnqueueTransferRequest*, tierbridge::vfs::v1::TransferRecord*) override;

  ::grpc::Status ListTransfers(::grpc::ServerContext*, const tierbridge::vfs::v1::ListTransfersRequest*, tierbridge::vfs::v1::ListTransfersResponse*) override;

  ::grpc::Status PauseTransfer(::grpc::ServerContext*, const tierbridge::vfs::v1::TransferControlRequest*, google::protobuf::Empty*) override;

  ::grpc::Status ResumeTransfer(::grpc::ServerContext*, const tierbridge::vfs::v1::TransferControlRequest*, google::protobuf::Empty*) override;

  ::grpc::Status CancelTransfer(::grpc::ServerContext*, const tierbridge::vfs::v1::TransferControlRequest*, google::protobuf::Empty*) override;

  ::grpc::Status WatchTransfer(::grpc::ServerContext*, const tierbridge::vfs::v1::TransferControlRequest*, ::grpc::ServerWriter<tierbridge::vfs::v1::TransferRecord>*) override;

 private:
  std::shared_ptr<tierbridge::service::TransferService> service_;
};

} // namespace tierbridge::grpc
