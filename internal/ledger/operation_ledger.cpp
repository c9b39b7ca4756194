#include "operation_ledger.hpp"

#include <algorithm>
#include <map>

#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/source/source_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace tierbridge::ledger {

using namespace tierbridge::vfs::core::v1;
using observability::BytesField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr uint32_t kDefaultRetention = 10;

bool IsTerminal(OperationStatus status) {
  return status == OPERATION_STATUS_COMPLETED || status == OPERATION_STATUS_FAILED || status == OPERATION_STATUS_CANCELED;
}

} // namespace

OperationLedger::OperationLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<source::SourceRegistry> registry,
                                 tierbridge::runtime::config::LedgerConfig config)
    : repository_(std::move(repository)), registry_(std::move(registry)), config_(std::move(config)) {
  if (config_.retention_per_category() == 0) config_.set_retention_per_category(kDefaultRetention);
}

void OperationLedger::Load() {
  std::lock_guard lock(mutex_);

  auto tx   = repository_->Begin();
  auto rows = repository_->ListOperations(*tx);

  size_t interrupted = 0;
  for (auto& row : rows) {
    next_seq_ = std::max(next_seq_, row.seq + 1);
    if (!IsTerminal(row.status)) {
      row.status          = OPERATION_STATUS_FAILED;
      row.error           = "interrupted by restart";
      row.completed_at_ms = util::NowMillis();
      db::ThrowIfDbError(repository_->UpdateOperation(*tx, row), "fail interrupted operation " + row.id);
      ++interrupted;
    }
  }
  tx->Commit();

  TIERBRIDGE_LOG_INFO("operation ledger loaded", {IntField("entries", static_cast<int64_t>(rows.size())),
                                                   IntField("interrupted", static_cast<int64_t>(interrupted))});
}

std::string OperationLedger::Begin(OperationType type, const std::string& source_id, const std::string& source_path,
                                   const std::string& dest_path, uint64_t file_size) {
  const auto mounted = registry_->Resolve(source_id);

  db::model::OperationRecord record;
  record.id              = util::NewId();
  record.type            = type;
  record.source_id       = source_id;
  record.source_category = mounted.category();
  record.source_path     = source_path;
  record.dest_path       = dest_path;
  record.file_size       = file_size;
  record.status          = OPERATION_STATUS_IN_PROGRESS;
  record.started_at_ms   = util::NowMillis();

  {
    std::lock_guard lock(mutex_);
    record.seq = next_seq_++;
    auto tx    = repository_->Begin();
    db::ThrowIfDbError(repository_->InsertOperation(*tx, record), "begin operation");
    tx->Commit();
  }

  TIERBRIDGE_LOG_INFO("operation started", {StringField("operation_id", record.id), StringField("type", OperationType_Name(type)),
                                             StringField("source_id", source_id), StringField("source_path", source_path),
                                             StringField("dest_path", dest_path)});
  return record.id;
}

void OperationLedger::Progress(const std::string& id, uint64_t bytes_processed) {
  std::lock_guard lock(mutex_);
  auto            record = Fetch(id);
  if (IsTerminal(record.status)) {
    throw util::InvalidState("operation " + id + " is already finished");
  }
  record.bytes_processed = bytes_processed;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpdateOperation(*tx, record), "update operation " + id);
  tx->Commit();
}

OperationLedger::Record OperationLedger::Complete(const std::string& id) {
  return Finish(id, OPERATION_STATUS_COMPLETED, "");
}

OperationLedger::Record OperationLedger::Fail(const std::string& id, const std::string& error) {
  return Finish(id, OPERATION_STATUS_FAILED, error);
}

OperationLedger::Record OperationLedger::Cancel(const std::string& id) {
  return Finish(id, OPERATION_STATUS_CANCELED, "");
}

OperationLedger::Record OperationLedger::Finish(const std::string& id, OperationStatus status, const std::string& error) {
  db::model::OperationRecord record;
  {
    std::lock_guard lock(mutex_);
    record = Fetch(id);
    if (IsTerminal(record.status)) {
      throw util::InvalidState("operation " + id + " is already finished");
    }

    record.status          = status;
    record.error           = error;
    record.completed_at_ms = util::NowMillis();
    if (status == OPERATION_STATUS_COMPLETED) {
      record.bytes_processed = std::max(record.bytes_processed, record.file_size);
    }

    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->UpdateOperation(*tx, record), "finish operation " + id);
    tx->Commit();
  }

  if (status == OPERATION_STATUS_FAILED) {
    TIERBRIDGE_LOG_WARN("operation failed", {StringField("operation_id", id), StringField("type", OperationType_Name(record.type)),
                                              StringField("source_path", record.source_path), StringField("error", error)});
  } else {
    TIERBRIDGE_LOG_INFO("operation finished", {StringField("operation_id", id), StringField("status", OperationStatus_Name(status)),
                                                BytesField("bytes_processed", record.bytes_processed)});
  }
  return ToProto(record);
}

OperationLedger::Record OperationLedger::Append(db::model::OperationRecord record) {
  if (!IsTerminal(record.status)) {
    throw std::invalid_argument("only finished operations can be appended");
  }
  if (record.id.empty()) record.id = util::NewId();
  if (record.source_category == SOURCE_CATEGORY_UNSPECIFIED && registry_->Contains(record.source_id)) {
    record.source_category = registry_->Resolve(record.source_id).category();
  }
  if (record.started_at_ms == 0) record.started_at_ms = util::NowMillis();
  if (record.completed_at_ms == 0) record.completed_at_ms = util::NowMillis();

  {
    std::lock_guard lock(mutex_);
    record.seq = next_seq_++;
    auto tx    = repository_->Begin();
    db::ThrowIfDbError(repository_->InsertOperation(*tx, record), "append operation");
    tx->Commit();
  }

  TIERBRIDGE_LOG_INFO("operation recorded", {StringField("operation_id", record.id), StringField("type", OperationType_Name(record.type)),
                                              StringField("status", OperationStatus_Name(record.status))});
  return ToProto(record);
}

OperationLedger::Record OperationLedger::Get(const std::string& id) const {
  std::lock_guard lock(mutex_);
  return ToProto(Fetch(id));
}

std::vector<OperationLedger::Record> OperationLedger::List(const ListFilter& filter) const {
  std::vector<db::model::OperationRecord> rows;
  {
    auto tx = repository_->Begin();
    rows    = repository_->ListOperations(*tx);
    tx->Commit();
  }

  std::map<SourceCategory, uint32_t> shown;
  std::vector<Record>                out;
  for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
    if (!filter.categories.empty() && filter.categories.count(it->source_category) == 0) continue;
    if (shown[it->source_category]++ >= config_.retention_per_category()) continue;
    out.push_back(ToProto(*it));
  }
  return out;
}

std::vector<OperationLedger::Record> OperationLedger::Active() const {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListOperations(*tx);
  tx->Commit();

  std::vector<Record> out;
  for (const auto& row : rows) {
    if (!IsTerminal(row.status)) out.push_back(ToProto(row));
  }
  return out;
}

size_t OperationLedger::Prune() {
  std::lock_guard lock(mutex_);

  auto tx   = repository_->Begin();
  auto rows = repository_->ListOperations(*tx);

  std::map<SourceCategory, uint32_t> kept;
  size_t                             pruned = 0;
  for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
    if (!IsTerminal(it->status)) continue;
    if (kept[it->source_category]++ < config_.retention_per_category()) continue;
    db::ThrowIfDbError(repository_->DeleteOperation(*tx, it->id), "prune operation " + it->id);
    ++pruned;
  }
  tx->Commit();

  if (pruned > 0) {
    TIERBRIDGE_LOG_INFO("operation ledger pruned", {IntField("pruned", static_cast<int64_t>(pruned))});
  }
  return pruned;
}

db::model::OperationRecord OperationLedger::Fetch(const std::string& id) const {
  auto tx     = repository_->Begin();
  auto record = repository_->GetOperation(*tx, id);
  tx->Commit();
  if (!record) {
    throw util::NotFound("operation not found: " + id);
  }
  return *record;
}

OperationLedger::Record OperationLedger::ToProto(const db::model::OperationRecord& record) {
  Record out;
  out.set_id(record.id);
  out.set_type(record.type);
  out.set_source_id(record.source_id);
  out.set_source_category(record.source_category);
  out.set_source_path(record.source_path);
  out.set_dest_path(record.dest_path);
  out.set_file_size(record.file_size);
  out.set_bytes_processed(record.bytes_processed);
  out.set_status(record.status);
  out.set_error(record.error);
  *out.mutable_started_at() = util::ToProto(util::FromUnixMillis(record.started_at_ms));
  if (record.completed_at_ms != 0) {
    *out.mutable_completed_at() = util::ToProto(util::FromUnixMillis(record.completed_at_ms));
  }
  return out;
}

} // namespace tierbridge::ledger
