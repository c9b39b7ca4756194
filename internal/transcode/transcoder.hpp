#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace tierbridge::transcode {

/*
  Converts one host video file into another container/codec set.
  Progress is reported in percent of the input duration when known.
*/
class Transcoder {
 public:
  using ProgressFn = std::function<void(uint32_t percent)>;

  virtual ~Transcoder() = default;

  virtual void Transcode(const std::string& input, const std::string& output, const std::string& format, const ProgressFn& progress) = 0;
};

// Runs the ffmpeg binary; progress is parsed from "-progress pipe:1".
class FfmpegTranscoder final : public Transcoder {
 public:
  explicit FfmpegTranscoder(std::string ffmpeg_path);

  void Transcode(const std::string& input, const std::string& output, const std::string& format, const ProgressFn& progress) override;

  // Encoder arguments for a target container.
  static std::string CodecArgs(const std::string& format);

 private:
  std::string ffmpeg_path_;
};

} // namespace tierbridge::transcode
