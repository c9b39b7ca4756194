#include "transfer_journal.hpp"

#include "internal/ledger/operation_ledger.hpp"
#include "internal/observability/logging.hpp"

namespace tierbridge::ledger {

using namespace tierbridge::vfs::core::v1;
using observability::ErrorField;
using observability::StringField;

TransferJournal::TransferJournal(std::shared_ptr<transfer::TransferEngine> transfers, std::shared_ptr<OperationLedger> ledger)
    : transfers_(std::move(transfers)), ledger_(std::move(ledger)) {
}

TransferJournal::~TransferJournal() {
  std::unordered_map<std::string, Entry> entries;
  {
    std::lock_guard lock(mutex_);
    entries.swap(entries_);
  }
  for (const auto& [_, entry] : entries) {
    transfers_->Unsubscribe(entry.token);
  }
}

void TransferJournal::Track(const TransferRecord& record) {
  const bool upload = record.kind() == TRANSFER_KIND_UPLOAD;
  const auto operation_id =
      ledger_->Begin(upload ? OPERATION_TYPE_UPLOAD : OPERATION_TYPE_DOWNLOAD, record.source_id(),
                     upload ? record.local_path() : record.remote_path(), upload ? record.remote_path() : record.local_path(),
                     record.total_size());

  {
    std::lock_guard lock(mutex_);
    entries_[record.id()].operation_id = operation_id;
  }

  const auto token = transfers_->Subscribe(record.id(), [this](const TransferRecord& event) {
    switch (event.status()) {
      case TRANSFER_STATUS_COMPLETED:
      case TRANSFER_STATUS_FAILED:
      case TRANSFER_STATUS_CANCELED:
        Settle(event);
        break;
      default:
        break;
    }
  });

  bool settled = false;
  {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(record.id());
    if (it == entries_.end()) {
      settled = true;
    } else {
      it->second.token = token;
    }
  }
  if (settled) {
    transfers_->Unsubscribe(token);
    return;
  }

  // The transfer may have ended before the subscription was in place.
  const auto current = transfers_->Get(record.id());
  if (current.status() == TRANSFER_STATUS_COMPLETED || current.status() == TRANSFER_STATUS_FAILED ||
      current.status() == TRANSFER_STATUS_CANCELED) {
    Settle(current);
  }
}

size_t TransferJournal::Tracked() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

void TransferJournal::Settle(const TransferRecord& record) {
  Entry entry;
  {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(record.id());
    if (it == entries_.end()) return;
    entry = it->second;
    entries_.erase(it);
  }
  if (entry.token != 0) {
    transfers_->Unsubscribe(entry.token);
  }

  try {
    ledger_->Progress(entry.operation_id, record.bytes_transferred());
    switch (record.status()) {
      case TRANSFER_STATUS_COMPLETED:
        ledger_->Complete(entry.operation_id);
        break;
      case TRANSFER_STATUS_CANCELED:
        ledger_->Cancel(entry.operation_id);
        break;
      default:
        ledger_->Fail(entry.operation_id, record.error());
        break;
    }
  } catch (const std::exception& e) {
    TIERBRIDGE_LOG_WARN("ledger update for transfer failed",
                        {StringField("transfer_id", record.id()), StringField("operation_id", entry.operation_id), ErrorField(e)});
  }
}

} // namespace tierbridge::ledger
