#pragma once

#include "service_context.hpp"
#include "tierbridge/vfs/v1.hpp"

namespace tierbridge::service {

class FileService {
 public:
  explicit FileService(ServiceContext ctx);

  tierbridge::vfs::v1::MoveResponse Move(const tierbridge::vfs::v1::MoveRequest& req);
  tierbridge::vfs::v1::CopyResponse Copy(const tierbridge::vfs::v1::CopyRequest& req);

  tierbridge::vfs::v1::BatchResult MoveBatch(const tierbridge::vfs::v1::BatchRequest& req);
  tierbridge::vfs::v1::BatchResult CopyBatch(const tierbridge::vfs::v1::BatchRequest& req);

  void Rename(const tierbridge::vfs::v1::RenameRequest& req);
  void DeleteRecursive(const tierbridge::vfs::v1::PathRequest& req);
  void Mkdir(const tierbridge::vfs::v1::PathRequest& req);

  tierbridge::vfs::v1::ListResponse List(const tierbridge::vfs::v1::ListRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace tierbridge::service
