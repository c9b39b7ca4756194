#pragma once

#include <string>
#include <vector>

#include "internal/clipboard/native_clipboard.hpp"

namespace tierbridge::clipboard {

/*
  X11 clipboard through the xclip / xsel command line tools, exchanging
  text/uri-list. In auto mode xclip is tried first, then xsel.
*/
class X11Clipboard final : public NativeClipboard {
 public:
  enum class Tool { Auto, Xclip, Xsel };

  explicit X11Clipboard(Tool tool);

  bool                     Available() const override;
  std::vector<std::string> ReadFiles() override;
  void                     WriteFiles(const std::vector<std::string>& paths) override;

 private:
  std::vector<Tool> Candidates() const;

  Tool tool_;
};

} // namespace tierbridge::clipboard
