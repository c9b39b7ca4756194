#pragma once

#include "service_context.hpp"
#include "tierbridge/vfs/v1.hpp"

namespace tierbridge::service {

class ClipboardService {
 public:
  explicit ClipboardService(ServiceContext ctx);

  void Copy(const tierbridge::vfs::v1::ClipboardSetRequest& req);
  void Cut(const tierbridge::vfs::v1::ClipboardSetRequest& req);

  tierbridge::vfs::v1::BatchResult Paste(const tierbridge::vfs::v1::PasteRequest& req);
  tierbridge::vfs::v1::BatchResult PasteToNative(const tierbridge::vfs::v1::PasteToNativeRequest& req);

  tierbridge::vfs::v1::CopyForNativeResponse CopyForNative(const tierbridge::vfs::v1::CopyForNativeRequest& req);

  tierbridge::vfs::v1::NativePaths ReadNative();
  tierbridge::vfs::v1::NativePaths WriteNative(const tierbridge::vfs::v1::NativePaths& req);

  tierbridge::vfs::v1::BatchResult PasteNativeIntoVfs(const tierbridge::vfs::v1::PasteNativeIntoVfsRequest& req);

  tierbridge::vfs::v1::HasFilesResponse     HasFiles();
  tierbridge::vfs::v1::GetClipboardResponse Get();
  void                                      Clear();

 private:
  ServiceContext ctx_;
};

} // namespace tierbridge::service
