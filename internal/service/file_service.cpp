#include "file_service.hpp"

#include "internal/fileops/file_operations.hpp"
#include "internal/service/observe_rpc.hpp"

namespace tierbridge::service {

using namespace tierbridge::vfs::v1;

namespace {

fileops::Location ToLocation(const FileLocation& location) {
  if (location.source_id().empty()) {
    throw std::invalid_argument("source_id is required");
  }
  if (location.path().empty()) {
    throw std::invalid_argument("path is required");
  }
  return {location.source_id(), location.path()};
}

template <typename Repeated>
std::vector<std::string> ToVector(const Repeated& values) {
  return {values.begin(), values.end()};
}

} // namespace

FileService::FileService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

MoveResponse FileService::Move(const MoveRequest& req) {
  return ObserveRpc("FileService.Move", req.from().source_id(), [&] {
    const auto result = ctx_.files->Move(ToLocation(req.from()), ToLocation(req.to()));

    MoveResponse resp;
    resp.set_bytes_transferred(result.bytes_transferred);
    resp.set_source_deleted(result.source_deleted);
    resp.set_dest_path(result.dest_path);
    return resp;
  });
}

CopyResponse FileService::Copy(const CopyRequest& req) {
  return ObserveRpc("FileService.Copy", req.from().source_id(), [&] {
    const auto result = ctx_.files->Copy(ToLocation(req.from()), ToLocation(req.to()), req.recursive());

    CopyResponse resp;
    resp.set_bytes_transferred(result.bytes_transferred);
    resp.set_dest_path(result.dest_path);
    return resp;
  });
}

BatchResult FileService::MoveBatch(const BatchRequest& req) {
  return ObserveRpc("FileService.MoveBatch", req.from_source_id(), [&] {
    return ctx_.files->MoveBatch(req.from_source_id(), ToVector(req.paths()), req.to_source_id(), req.dest_dir());
  });
}

BatchResult FileService::CopyBatch(const BatchRequest& req) {
  return ObserveRpc("FileService.CopyBatch", req.from_source_id(), [&] {
    return ctx_.files->CopyBatch(req.from_source_id(), ToVector(req.paths()), req.to_source_id(), req.dest_dir());
  });
}

void FileService::Rename(const RenameRequest& req) {
  ObserveRpc("FileService.Rename", req.source_id(), [&] { ctx_.files->Rename(req.source_id(), req.from(), req.to()); });
}

void FileService::DeleteRecursive(const PathRequest& req) {
  ObserveRpc("FileService.DeleteRecursive", req.source_id(), [&] { ctx_.files->DeleteRecursive(req.source_id(), req.path()); });
}

void FileService::Mkdir(const PathRequest& req) {
  ObserveRpc("FileService.Mkdir", req.source_id(), [&] { ctx_.files->Mkdir(req.source_id(), req.path()); });
}

ListResponse FileService::List(const ListRequest& req) {
  return ObserveRpc("FileService.List", req.source_id(), [&] {
    ListResponse resp;
    for (auto& entry : ctx_.files->List(req.source_id(), req.path().empty() ? "/" : req.path(), req.recursive())) {
      *resp.add_entries() = std::move(entry);
    }
    return resp;
  });
}

} // namespace tierbridge::service
