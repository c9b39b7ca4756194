#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace tierbridge::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------------
// Transfers
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertTransfer(Transaction& t, const model::TransferRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.transfers.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "transfer already exists: " + r.id);
  s.transfers[r.id] = r;
  return Result::Ok();
}

std::optional<model::TransferRecord> MemoryRepository::GetTransfer(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.transfers.find(id);
  if (it == s.transfers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TransferRecord> MemoryRepository::ListTransfers(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::TransferRecord> records;
  records.reserve(s.transfers.size());
  for (const auto& [_, record] : s.transfers) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return records;
}

Result MemoryRepository::UpdateTransfer(Transaction& t, const model::TransferRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.transfers.contains(r.id)) return Result::Err(ErrorCode::NotFound, "transfer not found: " + r.id);
  s.transfers[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteTransfer(Transaction& t, const std::string& id) {
  TX(t).Mutable().transfers.erase(id);
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// Operations
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertOperation(Transaction& t, const model::OperationRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.operations.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "operation already exists: " + r.id);
  s.operations[r.id] = r;
  return Result::Ok();
}

std::optional<model::OperationRecord> MemoryRepository::GetOperation(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.operations.find(id);
  if (it == s.operations.end()) return std::nullopt;
  return it->second;
}

std::vector<model::OperationRecord> MemoryRepository::ListOperations(Transaction& t) {
  const auto&                         s = TX(t).View();
  std::vector<model::OperationRecord> records;
  records.reserve(s.operations.size());
  for (const auto& [_, record] : s.operations) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.seq < b.seq; });
  return records;
}

Result MemoryRepository::UpdateOperation(Transaction& t, const model::OperationRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.operations.contains(r.id)) return Result::Err(ErrorCode::NotFound, "operation not found: " + r.id);
  s.operations[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteOperation(Transaction& t, const std::string& id) {
  TX(t).Mutable().operations.erase(id);
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// File tiers
// ---------------------------------------------------------------------------

Result MemoryRepository::UpsertFileTier(Transaction& t, const model::FileTierRecord& r) {
  TX(t).Mutable().file_tiers[{r.source_id, r.path}] = r;
  return Result::Ok();
}

std::optional<model::FileTierRecord> MemoryRepository::GetFileTier(Transaction& t, const std::string& source_id, const std::string& path) {
  const auto& s  = TX(t).View();
  auto        it = s.file_tiers.find({source_id, path});
  if (it == s.file_tiers.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteFileTier(Transaction& t, const std::string& source_id, const std::string& path) {
  TX(t).Mutable().file_tiers.erase({source_id, path});
  return Result::Ok();
}

std::vector<model::FileTierRecord> MemoryRepository::ListFileTiers(Transaction& t, const std::string& source_id) {
  const auto&                        s = TX(t).View();
  std::vector<model::FileTierRecord> out;
  for (auto it = s.file_tiers.lower_bound({source_id, std::string()}); it != s.file_tiers.end() && it->first.first == source_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

} // namespace tierbridge::db::memory
