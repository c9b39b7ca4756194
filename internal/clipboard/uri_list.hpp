#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tierbridge::clipboard {

/*
  text/uri-list (RFC 2483) as exchanged with X11 file managers.

      # comment
      file:///home/me/My%20File.txt\r\n

  Encoding keeps '/' and RFC 3986 unreserved characters; everything else is
  %XX. Decoding accepts file:// and file://localhost URIs, skips comments,
  blank lines and other schemes, and takes bare absolute paths as-is (xsel
  falls back to plain text).
*/
std::string              EncodeUriList(const std::vector<std::string>& paths);
std::vector<std::string> DecodeUriList(std::string_view text);

std::string PercentEncodePath(std::string_view path);
// Malformed escapes are kept literally.
std::string PercentDecode(std::string_view text);

} // namespace tierbridge::clipboard
