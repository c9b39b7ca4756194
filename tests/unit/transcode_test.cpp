#include "internal/transcode/transcode_coordinator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/transcode/transcode_formats.hpp"
#include "internal/transcode/transcoder.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_stack.hpp"

namespace {

using namespace tierbridge::vfs::core::v1;
using tierbridge::events::EventQueue;
using tierbridge::testing::Put;
using tierbridge::testing::Slurp;
using tierbridge::testing::Stack;
using tierbridge::transcode::FfmpegTranscoder;
using tierbridge::transcode::kTranscodeProgressTopic;
using tierbridge::transcode::TranscodeCoordinator;
using tierbridge::transcode::Transcoder;

constexpr auto kWait = std::chrono::seconds(10);

// Writes "<format>:<input bytes>" and reports halfway and done.
class FakeTranscoder final : public Transcoder {
 public:
  explicit FakeTranscoder(tierbridge::storage::SourceDriverPtr host) : host_(std::move(host)) {
  }

  void Transcode(const std::string& input, const std::string& output, const std::string& format, const ProgressFn& progress) override {
    if (fail) throw std::runtime_error("encoder crashed");
    progress(50);
    Put(*host_, output, format + ":" + Slurp(*host_, input));
    progress(100);
  }

  bool fail = false;

 private:
  tierbridge::storage::SourceDriverPtr host_;
};

struct Fixture {
  Fixture() {
    transcoder = std::make_shared<FakeTranscoder>(s.host);
    config.set_enabled(true);
    config.set_workers(1);
  }

  std::unique_ptr<TranscodeCoordinator> MakeCoordinator() {
    return std::make_unique<TranscodeCoordinator>(s.registry, s.files, transcoder, s.host, config, s.dir / "transcode");
  }

  Stack                                        s;
  std::shared_ptr<FakeTranscoder>              transcoder;
  tierbridge::runtime::config::TranscodeConfig config;
};

void TestFormats() {
  using namespace tierbridge::transcode;

  assert(SupportedFormats().size() == 4);
  assert(IsSupportedFormat("WEBM"));
  assert(!IsSupportedFormat("gif"));

  assert(HasVideoExtension("/a/clip.MOV"));
  assert(!HasVideoExtension("/a/notes.txt"));
  assert(!HasVideoExtension("/a/.mp4"));

  assert(OutputPathFor("/a/clip.mov", "mp4") == "/a/clip.mp4");
  assert(OutputPathFor("/clip", "webm") == "/clip.webm");

  assert(FfmpegTranscoder::CodecArgs("webm").find("libvpx-vp9") != std::string::npos);
  bool threw = false;
  try {
    FfmpegTranscoder::CodecArgs("gif");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestTranscodeStoresOutputNextToInput() {
  Fixture f;
  Put(*f.s.bucket, "/videos/trip.mov", "raw");

  auto coordinator = f.MakeCoordinator();
  coordinator->Start();

  EventQueue<TranscodeProgress> events(coordinator->Events(), kTranscodeProgressTopic);

  const auto handle = coordinator->Transcode("bucket", "videos/trip.mov", "mp4");
  assert(handle.file_path() == "/videos/trip.mov");
  assert(handle.output_path() == "/videos/trip.mp4");

  const auto done = coordinator->Wait(handle.job_id(), kWait);
  assert(done.status() == TRANSCODE_STATE_COMPLETED);
  assert(done.progress() == 100);
  assert(Slurp(*f.s.bucket, "/videos/trip.mp4") == "mp4:raw");
  assert(f.s.bucket->Exists("/videos/trip.mov"));

  // Progress never goes backwards over the phases.
  uint32_t last = 0;
  for (;;) {
    auto event = events.Pop(std::chrono::milliseconds(100));
    if (!event) break;
    assert(event->progress() >= last);
    last = event->progress();
  }
  assert(last == 100);

  // A second run does not overwrite the first output.
  const auto again = coordinator->Transcode("bucket", "/videos/trip.mov", "mp4");
  assert(coordinator->Wait(again.job_id(), kWait).status() == TRANSCODE_STATE_COMPLETED);
  assert(Slurp(*f.s.bucket, "/videos/trip copy.mp4") == "mp4:raw");

  // Staging is cleaned after each job.
  assert(f.s.host->List(f.s.dir / "transcode", false).empty());
  coordinator->Stop();
}

void TestTranscoderFailureIsReported() {
  Fixture f;
  Put(*f.s.disk, "/clip.mkv", "raw");
  f.transcoder->fail = true;

  auto coordinator = f.MakeCoordinator();
  coordinator->Start();

  const auto handle = coordinator->Transcode("disk", "/clip.mkv", "webm");
  const auto done   = coordinator->Wait(handle.job_id(), kWait);
  assert(done.status() == TRANSCODE_STATE_ERROR);
  assert(done.error() == "encoder crashed");
  assert(!f.s.disk->Exists("/clip.webm"));
  coordinator->Stop();
}

void TestTranscodeRejectsBadRequests() {
  Fixture f;
  Put(*f.s.disk, "/clip.mp4", "raw");
  Put(*f.s.disk, "/notes.txt", "text");
  Put(*f.s.host, f.s.dir / "host.mp4", "raw");

  auto coordinator = f.MakeCoordinator();
  coordinator->Start();

  auto expect_invalid_argument = [&](const std::string& source_id, const std::string& path, const std::string& format) {
    bool threw = false;
    try {
      coordinator->Transcode(source_id, path, format);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  };
  expect_invalid_argument("disk", "/clip.mp4", "gif");
  expect_invalid_argument("disk", "/notes.txt", "mp4");
  expect_invalid_argument("disk", "/clip.mp4", "mp4");

  bool threw = false;
  try {
    coordinator->Transcode("disk", "/missing.mp4", "webm");
  } catch (const tierbridge::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  // The host source is mounted without the transcode capability.
  threw = false;
  try {
    coordinator->Transcode(tierbridge::source::kNativeSourceId, f.s.dir / "host.mp4", "webm");
  } catch (const tierbridge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    coordinator->Status("no-such-job");
  } catch (const tierbridge::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  coordinator->Stop();
}

void TestDisabledCoordinator() {
  Fixture f;
  f.config.set_enabled(false);
  Put(*f.s.disk, "/clip.mp4", "raw");

  auto coordinator = f.MakeCoordinator();
  coordinator->Start();

  bool threw = false;
  try {
    coordinator->Transcode("disk", "/clip.mp4", "webm");
  } catch (const tierbridge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  coordinator->Stop();
}

} // namespace

int main() {
  TestFormats();
  TestTranscodeStoresOutputNextToInput();
  TestTranscoderFailureIsReported();
  TestTranscodeRejectsBadRequests();
  TestDisabledCoordinator();

  std::cout << "tierbridge_unit_transcode: pass\n";
  return 0;
}
