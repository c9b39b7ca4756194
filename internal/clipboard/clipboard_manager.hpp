#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/clipboard/native_clipboard.hpp"
#include "internal/fileops/file_operations.hpp"
#include "internal/storage/source_driver.hpp"
#include "tierbridge/vfs/core/v1/types.pb.h"

namespace tierbridge::source {
class SourceRegistry;
}

namespace tierbridge::clipboard {

/*
  ClipboardManager

  The process-wide clipboard, owned by whoever constructs it:

      Empty -> Holding(copy | cut) -> Empty

  Copy and cut overwrite any prior payload. Paste works on a snapshot taken
  under the lock, so a concurrent copy/cut never shows half a payload.

  Paste, per clipboard path:
    - destination equal to or beneath the path: rejected
    - otherwise placed into the destination folder under a free name
      ("doc copy.pdf"), by rename on the same source or through the
      TransferEngine across sources
  Afterwards a cut keeps only the failed paths (cleared when none failed);
  a copy stays for the next paste.

  Native bridge: payloads from the host clipboard use the "native" source,
  which is the host filesystem.
*/
class ClipboardManager {
 public:
  using Payload         = tierbridge::vfs::core::v1::ClipboardPayload;
  using BatchResult     = tierbridge::vfs::core::v1::BatchResult;
  using ResidencyPolicy = fileops::FileOperations::ResidencyPolicy;

  struct NativeExport {
    std::string              status;
    std::vector<std::string> exported_paths;
    std::vector<std::string> errors;
  };

  ClipboardManager(std::shared_ptr<source::SourceRegistry> registry, std::shared_ptr<fileops::FileOperations> files,
                   std::shared_ptr<NativeClipboard> native, storage::SourceDriverPtr local_driver,
                   tierbridge::runtime::config::ClipboardConfig config);

  void Copy(const std::string& source_id, const std::vector<std::string>& paths);
  void Cut(const std::string& source_id, const std::vector<std::string>& paths);

  // Internal payload, else the host clipboard as a native copy.
  std::optional<Payload> Get() const;

  // Internal payload only.
  bool HasFiles() const;

  void Clear();

  // Throws ClipboardEmpty when there is nothing to paste.
  BatchResult Paste(const std::string& dest_source_id, const std::string& dest_path, const ResidencyPolicy& policy = {});

  // Paste into a host directory; pasted files are also put on the host clipboard.
  BatchResult PasteToNative(const std::string& dest_path, const ResidencyPolicy& policy = {});

  /*
    Materializes VFS files on the host (full download for remote sources)
    under <export_dir>/tierbridge-clipboard and writes them to the host
    clipboard.
  */
  NativeExport CopyForNative(const std::string& source_id, const std::vector<std::string>& paths, const ResidencyPolicy& policy = {});

  // Existing host files on the host clipboard.
  std::vector<std::string> ReadNative() const;
  std::vector<std::string> WriteNative(const std::vector<std::string>& paths);

  // Pastes host files (the host clipboard when paths is empty) into the VFS.
  BatchResult PasteNativeIntoVfs(const std::vector<std::string>& paths, const std::string& dest_source_id, const std::string& dest_path,
                                 const ResidencyPolicy& policy = {});

  std::string ExportRoot() const;

 private:
  void Set(tierbridge::vfs::core::v1::ClipboardOperation operation, const std::string& source_id, const std::vector<std::string>& paths);

  // Runs the paste algorithm for one snapshot; fills failed with the paths that did not land.
  BatchResult PasteSnapshot(const Payload& payload, const std::string& dest_source_id, const std::string& dest_path,
                            const ResidencyPolicy& policy, std::vector<std::string>* failed);

  // Applies the post-paste rule unless a newer copy/cut replaced the snapshot.
  void Settle(uint64_t generation, const Payload& payload, const std::vector<std::string>& failed);

  std::shared_ptr<source::SourceRegistry>       registry_;
  std::shared_ptr<fileops::FileOperations>      files_;
  std::shared_ptr<NativeClipboard>              native_;
  storage::SourceDriverPtr                      local_driver_;
  tierbridge::runtime::config::ClipboardConfig config_;

  mutable std::mutex     mutex_;
  std::optional<Payload> payload_;
  uint64_t               generation_ = 0; // bumped by every copy, cut and clear
};

} // namespace tierbridge::clipboard
