#include "transfer_service.hpp"

#include <chrono>

#include "internal/events/event_hub.hpp"
#include "internal/ledger/transfer_journal.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/tiering/tiering_coordinator.hpp"
#include "internal/transfer/transfer_engine.hpp"
#include "internal/util/errors.hpp"

namespace tierbridge::service {

using namespace tierbridge::vfs::v1;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(250);

bool IsTerminal(const TransferRecord& record) {
  switch (record.status()) {
    case TRANSFER_STATUS_COMPLETED:
    case TRANSFER_STATUS_FAILED:
    case TRANSFER_STATUS_CANCELED:
      return true;
    default:
      return false;
  }
}

void RequirePaths(const EnqueueTransferRequest& req) {
  if (req.local_path().empty() || req.remote_path().empty()) {
    throw std::invalid_argument("local_path and remote_path are required");
  }
}

} // namespace

TransferService::TransferService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

TransferRecord TransferService::EnqueueUpload(const EnqueueTransferRequest& req) {
  return ObserveRpc("TransferService.EnqueueUpload", req.source_id(), [&] {
    RequirePaths(req);
    auto record = ctx_.transfers->EnqueueUpload(req.source_id(), req.local_path(), req.remote_path());
    if (ctx_.journal) ctx_.journal->Track(record);
    return record;
  });
}

TransferRecord TransferService::EnqueueDownload(const EnqueueTransferRequest& req) {
  return ObserveRpc("TransferService.EnqueueDownload", req.source_id(), [&] {
    RequirePaths(req);
    tiering::TieringCoordinator::ResidencyPolicy policy;
    policy.block = false;
    ctx_.tiering->EnsureResident(req.source_id(), req.remote_path(), policy);
    auto record = ctx_.transfers->EnqueueDownload(req.source_id(), req.remote_path(), req.local_path());
    if (ctx_.journal) ctx_.journal->Track(record);
    return record;
  });
}

ListTransfersResponse TransferService::ListTransfers(const ListTransfersRequest& req) {
  return ObserveRpc("TransferService.ListTransfers", req.source_id(), [&] {
    transfer::TransferEngine::ListFilter filter;
    if (!req.source_id().empty()) filter.source_id = req.source_id();
    filter.active_only = req.active_only();

    ListTransfersResponse resp;
    for (auto& record : ctx_.transfers->List(filter)) {
      *resp.add_transfers() = std::move(record);
    }
    return resp;
  });
}

void TransferService::PauseTransfer(const TransferControlRequest& req) {
  ObserveRpc("TransferService.PauseTransfer", req.source_id(), [&] {
    Lookup(req);
    ctx_.transfers->Pause(req.upload_id());
  });
}

void TransferService::ResumeTransfer(const TransferControlRequest& req) {
  ObserveRpc("TransferService.ResumeTransfer", req.source_id(), [&] {
    const auto record = Lookup(req);
    ctx_.transfers->Resume(req.upload_id(), record.source_id());
  });
}

void TransferService::CancelTransfer(const TransferControlRequest& req) {
  ObserveRpc("TransferService.CancelTransfer", req.source_id(), [&] {
    Lookup(req);
    ctx_.transfers->Cancel(req.upload_id());
  });
}

void TransferService::WatchTransfer(const TransferControlRequest& req, const Emit& emit, const Cancelled& cancelled) {
  ObserveRpc("TransferService.WatchTransfer", req.source_id(), [&] {
    events::EventQueue<TransferRecord> queue(ctx_.transfers->Events(), transfer::TransferTopic(req.upload_id()));

    const auto current = Lookup(req);
    if (!emit(current) || IsTerminal(current)) return;

    while (!cancelled()) {
      auto event = queue.Pop(kPollInterval);
      if (!event) continue;
      if (!emit(*event) || IsTerminal(*event)) return;
    }
  });
}

TransferRecord TransferService::Lookup(const TransferControlRequest& req) const {
  if (req.upload_id().empty()) {
    throw std::invalid_argument("upload_id is required");
  }
  auto record = ctx_.transfers->Get(req.upload_id());
  if (!req.source_id().empty() && record.source_id() != req.source_id()) {
    throw util::NotFound("transfer " + req.upload_id() + " not found on source " + req.source_id());
  }
  return record;
}

} // namespace tierbridge::service
