#include "clipboard_service.hpp"

#include "internal/clipboard/clipboard_manager.hpp"
#include "internal/service/observe_rpc.hpp"

namespace tierbridge::service {

using namespace tierbridge::vfs::v1;

namespace {

template <typename Repeated>
std::vector<std::string> ToVector(const Repeated& values) {
  return {values.begin(), values.end()};
}

NativePaths ToNativePaths(const std::vector<std::string>& paths) {
  NativePaths out;
  for (const auto& path : paths) {
    out.add_paths(path);
  }
  return out;
}

} // namespace

ClipboardService::ClipboardService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void ClipboardService::Copy(const ClipboardSetRequest& req) {
  ObserveRpc("ClipboardService.Copy", req.source_id(), [&] { ctx_.clipboard->Copy(req.source_id(), ToVector(req.paths())); });
}

void ClipboardService::Cut(const ClipboardSetRequest& req) {
  ObserveRpc("ClipboardService.Cut", req.source_id(), [&] { ctx_.clipboard->Cut(req.source_id(), ToVector(req.paths())); });
}

BatchResult ClipboardService::Paste(const PasteRequest& req) {
  return ObserveRpc("ClipboardService.Paste", req.dest_source_id(),
                    [&] { return ctx_.clipboard->Paste(req.dest_source_id(), req.dest_path()); });
}

BatchResult ClipboardService::PasteToNative(const PasteToNativeRequest& req) {
  return ObserveRpc("ClipboardService.PasteToNative", "", [&] { return ctx_.clipboard->PasteToNative(req.dest_path()); });
}

CopyForNativeResponse ClipboardService::CopyForNative(const CopyForNativeRequest& req) {
  return ObserveRpc("ClipboardService.CopyForNative", req.source_id(), [&] {
    const auto exported = ctx_.clipboard->CopyForNative(req.source_id(), ToVector(req.paths()));

    CopyForNativeResponse resp;
    resp.set_status(exported.status);
    for (const auto& path : exported.exported_paths) {
      resp.add_exported_paths(path);
    }
    return resp;
  });
}

NativePaths ClipboardService::ReadNative() {
  return ObserveRpc("ClipboardService.ReadNative", "", [&] { return ToNativePaths(ctx_.clipboard->ReadNative()); });
}

NativePaths ClipboardService::WriteNative(const NativePaths& req) {
  return ObserveRpc("ClipboardService.WriteNative", "",
                    [&] { return ToNativePaths(ctx_.clipboard->WriteNative(ToVector(req.paths()))); });
}

BatchResult ClipboardService::PasteNativeIntoVfs(const PasteNativeIntoVfsRequest& req) {
  return ObserveRpc("ClipboardService.PasteNativeIntoVfs", req.dest_source_id(), [&] {
    return ctx_.clipboard->PasteNativeIntoVfs(ToVector(req.paths()), req.dest_source_id(), req.dest_path());
  });
}

HasFilesResponse ClipboardService::HasFiles() {
  return ObserveRpc("ClipboardService.HasFiles", "", [&] {
    HasFilesResponse resp;
    resp.set_has_files(ctx_.clipboard->HasFiles());
    return resp;
  });
}

GetClipboardResponse ClipboardService::Get() {
  return ObserveRpc("ClipboardService.Get", "", [&] {
    GetClipboardResponse resp;
    if (auto payload = ctx_.clipboard->Get()) {
      *resp.mutable_payload() = std::move(*payload);
    }
    return resp;
  });
}

void ClipboardService::Clear() {
  ObserveRpc("ClipboardService.Clear", "", [&] { ctx_.clipboard->Clear(); });
}

} // namespace tierbridge::service
