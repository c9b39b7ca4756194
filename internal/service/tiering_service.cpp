#include "tiering_service.hpp"

#include <chrono>

#include "internal/events/event_hub.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/tiering/tiering_coordinator.hpp"
#include "internal/transcode/transcode_coordinator.hpp"

namespace tierbridge::service {

using namespace tierbridge::vfs::v1;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(250);

bool IsTerminal(const WarmProgress& progress) {
  return progress.status() == WARM_STATE_COMPLETED || progress.status() == WARM_STATE_ERROR;
}

bool IsTerminal(const TranscodeProgress& progress) {
  return progress.status() == TRANSCODE_STATE_COMPLETED || progress.status() == TRANSCODE_STATE_ERROR;
}

} // namespace

TieringService::TieringService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

WarmHandle TieringService::WarmFile(const WarmFileRequest& req) {
  return ObserveRpc("TieringService.WarmFile", req.source_id(),
                    [&] { return ctx_.tiering->Warm(req.source_id(), req.file_path(), req.priority()); });
}

void TieringService::WatchWarm(const WatchWarmRequest& req, const Emit<WarmProgress>& emit, const Cancelled& cancelled) {
  ObserveRpc("TieringService.WatchWarm", "", [&] {
    // Subscribe before reading the snapshot so nothing falls in between.
    events::EventQueue<WarmProgress> queue(ctx_.tiering->Events(), tiering::kWarmProgressTopic);

    const bool single = !req.request_id().empty();
    if (single) {
      const auto current = ctx_.tiering->WaitWarm(req.request_id(), std::chrono::milliseconds(0));
      if (!emit(current) || IsTerminal(current)) return;
    }

    while (!cancelled()) {
      auto event = queue.Pop(kPollInterval);
      if (!event) continue;
      if (single && event->request_id() != req.request_id()) continue;
      if (!emit(*event)) return;
      if (single && IsTerminal(*event)) return;
    }
  });
}

SyncResult TieringService::ChangeTier(const ChangeTierRequest& req) {
  return ObserveRpc("TieringService.ChangeTier", req.source_id(), [&] {
    return ctx_.tiering->ChangeTier(req.source_id(), {req.paths().begin(), req.paths().end()}, req.target_tier());
  });
}

TranscodeHandle TieringService::TranscodeVideo(const TranscodeVideoRequest& req) {
  return ObserveRpc("TieringService.TranscodeVideo", req.source_id(),
                    [&] { return ctx_.transcode->Transcode(req.source_id(), req.file_path(), req.format()); });
}

void TieringService::WatchTranscode(const WatchTranscodeRequest& req, const Emit<TranscodeProgress>& emit, const Cancelled& cancelled) {
  ObserveRpc("TieringService.WatchTranscode", "", [&] {
    if (req.job_id().empty()) {
      throw std::invalid_argument("job_id is required");
    }
    events::EventQueue<TranscodeProgress> queue(ctx_.transcode->Events(), transcode::kTranscodeProgressTopic);

    const auto current = ctx_.transcode->Status(req.job_id());
    if (!emit(current) || IsTerminal(current)) return;

    while (!cancelled()) {
      auto event = queue.Pop(kPollInterval);
      if (!event || event->job_id() != req.job_id()) continue;
      if (!emit(*event) || IsTerminal(*event)) return;
    }
  });
}

} // namespace tierbridge::service
