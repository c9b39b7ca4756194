#include "transcode_formats.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "internal/storage/common/path_utils.hpp"

namespace tierbridge::transcode {

namespace {

constexpr std::array<std::string_view, 7> kVideoExtensions = {"mp4", "mov", "mkv", "avi", "webm", "m4v", "wmv"};

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

const std::vector<std::string>& SupportedFormats() {
  static const std::vector<std::string> formats = {"mp4", "webm", "mkv", "mov"};
  return formats;
}

bool IsSupportedFormat(std::string_view format) {
  const auto  lowered = Lower(format);
  const auto& formats = SupportedFormats();
  return std::find(formats.begin(), formats.end(), lowered) != formats.end();
}

bool HasVideoExtension(std::string_view path) {
  const auto name = storage::common::BaseName(path);
  const auto dot  = name.rfind('.');
  if (dot == std::string::npos || dot == 0) return false;
  const auto ext = Lower(std::string_view(name).substr(dot + 1));
  return std::find(kVideoExtensions.begin(), kVideoExtensions.end(), ext) != kVideoExtensions.end();
}

std::string OutputPathFor(std::string_view path, std::string_view format) {
  const auto name = storage::common::BaseName(path);
  const auto dot  = name.rfind('.');
  const auto stem = (dot == std::string::npos || dot == 0) ? name : name.substr(0, dot);
  return storage::common::DestPath(storage::common::ParentPath(path), stem + "." + Lower(format));
}

} // namespace tierbridge::transcode
