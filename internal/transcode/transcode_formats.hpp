#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tierbridge::transcode {

// Container formats a video can be transcoded into.
const std::vector<std::string>& SupportedFormats();

bool IsSupportedFormat(std::string_view format);

// Video extensions the transcoder accepts as input (case-insensitive).
bool HasVideoExtension(std::string_view path);

// "/a/clip.mov" + "mp4" -> "/a/clip.mp4"
std::string OutputPathFor(std::string_view path, std::string_view format);

} // namespace tierbridge::transcode
