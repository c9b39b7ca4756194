#include "transcoder.hpp"

#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/transcode/transcode_formats.hpp"

namespace tierbridge::transcode {

using observability::IntField;
using observability::StringField;

namespace {

std::string ShellQuote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

// "Duration: 00:01:02.50," -> 62500 ms; 0 when absent.
int64_t ParseDurationMs(const std::string& line) {
  const auto pos = line.find("Duration: ");
  if (pos == std::string::npos) return 0;
  int    h = 0, m = 0;
  double s = 0.0;
  if (std::sscanf(line.c_str() + pos + 10, "%d:%d:%lf", &h, &m, &s) != 3) return 0;
  return static_cast<int64_t>((h * 3600 + m * 60) * 1000 + s * 1000.0);
}

// ffmpeg reports out_time_ms in microseconds.
int64_t ParseOutTimeMs(const std::string& line) {
  constexpr std::string_view kKey = "out_time_ms=";
  if (line.compare(0, kKey.size(), kKey) != 0) return -1;
  try {
    return std::stoll(line.substr(kKey.size())) / 1000;
  } catch (const std::exception&) {
    return -1;
  }
}

} // namespace

FfmpegTranscoder::FfmpegTranscoder(std::string ffmpeg_path) : ffmpeg_path_(std::move(ffmpeg_path)) {
  if (ffmpeg_path_.empty()) ffmpeg_path_ = "ffmpeg";
}

std::string FfmpegTranscoder::CodecArgs(const std::string& format) {
  if (format == "webm") return "-c:v libvpx-vp9 -crf 32 -b:v 0 -c:a libopus";
  if (format == "mp4") return "-c:v libx264 -preset medium -crf 23 -c:a aac -movflags +faststart";
  if (format == "mov") return "-c:v libx264 -preset medium -crf 23 -c:a aac";
  if (format == "mkv") return "-c:v libx264 -preset medium -crf 23 -c:a aac";
  throw std::invalid_argument("unsupported transcode format: " + format);
}

void FfmpegTranscoder::Transcode(const std::string& input, const std::string& output, const std::string& format,
                                 const ProgressFn& progress) {
  const auto command = ShellQuote(ffmpeg_path_) + " -hide_banner -nostdin -y -i " + ShellQuote(input) + " " + CodecArgs(format) +
                       " -progress pipe:1 -nostats " + ShellQuote(output) + " 2>&1";

  TIERBRIDGE_LOG_INFO("ffmpeg started", {StringField("input", input), StringField("output", output), StringField("format", format)});

  FILE* pipe = popen(command.c_str(), "r");
  if (!pipe) {
    throw std::runtime_error("unable to start " + ffmpeg_path_);
  }

  int64_t                duration_ms = 0;
  uint32_t               last        = 0;
  std::string            tail;
  std::array<char, 1024> buf{};
  while (std::fgets(buf.data(), static_cast<int>(buf.size()), pipe)) {
    std::string line(buf.data());
    if (!line.empty() && line.back() == '\n') line.pop_back();

    if (duration_ms == 0) duration_ms = ParseDurationMs(line);

    const auto out_ms = ParseOutTimeMs(line);
    if (out_ms >= 0 && duration_ms > 0 && progress) {
      const auto pct = static_cast<uint32_t>(std::min<int64_t>(100, out_ms * 100 / duration_ms));
      if (pct != last) {
        last = pct;
        progress(pct);
      }
    }
    if (line.find('=') == std::string::npos) tail = line; // last diagnostic line
  }

  const int raw  = pclose(pipe);
  const int code = (raw != -1 && WIFEXITED(raw)) ? WEXITSTATUS(raw) : -1;
  if (code != 0) {
    TIERBRIDGE_LOG_ERROR("ffmpeg failed", {StringField("input", input), IntField("exit_code", code), StringField("output", tail)});
    throw std::runtime_error("ffmpeg exited with " + std::to_string(code) + (tail.empty() ? "" : ": " + tail));
  }
  if (progress) progress(100);
}

} // namespace tierbridge::transcode
