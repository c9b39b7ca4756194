#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace tierbridge::clipboard {

/*
  Host operating system clipboard, file list flavor.
  Paths are absolute host paths.
*/
class NativeClipboard {
 public:
  virtual ~NativeClipboard() = default;

  virtual bool Available() const = 0;

  // Empty when the clipboard holds no files.
  virtual std::vector<std::string> ReadFiles() = 0;

  virtual void WriteFiles(const std::vector<std::string>& paths) = 0;
};

// Headless hosts: reads are empty, writes fail with InvalidState.
class NullNativeClipboard final : public NativeClipboard {
 public:
  bool                     Available() const override;
  std::vector<std::string> ReadFiles() override;
  void                     WriteFiles(const std::vector<std::string>& paths) override;
};

std::shared_ptr<NativeClipboard> MakeNativeClipboard(tierbridge::runtime::config::NativeClipboardBackend backend);

} // namespace tierbridge::clipboard
