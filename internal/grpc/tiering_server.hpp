#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/tiering_service.hpp"
#include "tierbridge/vfs/v1.hpp"

namespace tierbridge::grpc {

class TieringServer final : public tierbridge::vfs::v1::TieringService::Service {
 public:
  explicit TieringServer(std::shared_ptr<tierbridge::service::TieringService> svc);

  ::grpc::Status WarmFile(::grpc::ServerContext*, const tierbridge::vfs::v1::WarmFileRequest*, tierbridge::vfs::v1::WarmHandle*) override;

  ::grpc::Status WatchWarm(::grpc::ServerContext*, const tierbridge::vfs::v1::WatchWarmRequest*, ::grpc::ServerWriter<tierbridge::vfs::v1::WarmProgress>*) override;

  ::grpc::Status ChangeTier(::grpc::ServerContext*, const tierbridge::vfs::v1::ChangeTierRequest*, tierbridge::vfs::v1::SyncResult*) override;

  ::grpc::Status TranscodeVideo(::grpc::ServerContext*, const tierbridge::vfs::v1::TranscodeVideoRequest*, tierbridge::vfs::v1::TranscodeHandle*) override;

  ::grpc::Status WatchTranscode(::grpc::ServerContext*, const tierbridge::vfs::v1::WatchTranscodeRequest*, ::grpc::ServerWriter<tierbridge::vfs::v1::TranscodeProgress>*) override;

 private:
  std::shared_ptr<tierbridge::service::TieringService> service_;
};

} // namespace tierbridge::grpc
