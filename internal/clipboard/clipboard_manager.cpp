#include "clipboard_manager.hpp"

#include <algorithm>
#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/source/source_registry.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tierbridge::clipboard {

using namespace tierbridge::vfs::core::v1;
using observability::ErrorField;
using observability::IntField;
using observability::StringField;
using storage::common::IsSelfOrDescendant;
using storage::common::NormalizeTarget;

namespace {

constexpr const char* kExportDirName = "tierbridge-clipboard";

const char* OperationName(ClipboardOperation operation) {
  return operation == CLIPBOARD_OPERATION_CUT ? "cut" : "copy";
}

// Normalized, first occurrence wins.
std::vector<std::string> UniquePaths(const std::vector<std::string>& paths) {
  std::vector<std::string> out;
  out.reserve(paths.size());
  for (const auto& path : paths) {
    auto normalized = NormalizeTarget(path);
    if (std::find(out.begin(), out.end(), normalized) == out.end()) {
      out.push_back(std::move(normalized));
    }
  }
  return out;
}

} // namespace

ClipboardManager::ClipboardManager(std::shared_ptr<source::SourceRegistry> registry, std::shared_ptr<fileops::FileOperations> files,
                                   std::shared_ptr<NativeClipboard> native, storage::SourceDriverPtr local_driver,
                                   tierbridge::runtime::config::ClipboardConfig config)
    : registry_(std::move(registry)),
      files_(std::move(files)),
      native_(std::move(native)),
      local_driver_(std::move(local_driver)),
      config_(std::move(config)) {
  if (!native_) native_ = std::make_shared<NullNativeClipboard>();
  if (config_.export_dir().empty()) {
    config_.set_export_dir(std::filesystem::temp_directory_path().string());
  }
}

// ---------------------------------------------------------------------------
// Payload
// ---------------------------------------------------------------------------

void ClipboardManager::Copy(const std::string& source_id, const std::vector<std::string>& paths) {
  Set(CLIPBOARD_OPERATION_COPY, source_id, paths);
}

void ClipboardManager::Cut(const std::string& source_id, const std::vector<std::string>& paths) {
  Set(CLIPBOARD_OPERATION_CUT, source_id, paths);
}

void ClipboardManager::Set(ClipboardOperation operation, const std::string& source_id, const std::vector<std::string>& paths) {
  if (paths.empty()) {
    throw std::invalid_argument("clipboard needs at least one path");
  }
  registry_->Resolve(source_id);

  const auto unique = UniquePaths(paths);

  Payload payload;
  payload.set_operation(operation);
  payload.set_source_id(source_id);
  for (const auto& path : unique) {
    payload.add_paths(path);
  }
  *payload.mutable_created_at() = util::ToProto(util::Now());

  {
    std::lock_guard lock(mutex_);
    payload_ = std::move(payload);
    ++generation_;
  }

  TIERBRIDGE_LOG_INFO("clipboard set", {StringField("operation", OperationName(operation)), StringField("source_id", source_id),
                                         IntField("paths", static_cast<int64_t>(unique.size()))});

  // Host files are mirrored so the platform file manager can paste them too.
  if (source_id == source::kNativeSourceId && native_->Available()) {
    try {
      native_->WriteFiles(unique);
    } catch (const std::exception& e) {
      TIERBRIDGE_LOG_WARN("native clipboard mirror failed", {ErrorField(e)});
    }
  }
}

std::optional<ClipboardManager::Payload> ClipboardManager::Get() const {
  {
    std::lock_guard lock(mutex_);
    if (payload_) return payload_;
  }

  const auto host = ReadNative();
  if (host.empty()) return std::nullopt;

  Payload payload;
  payload.set_operation(CLIPBOARD_OPERATION_COPY);
  payload.set_source_id(source::kNativeSourceId);
  for (const auto& path : host) {
    payload.add_paths(path);
  }
  *payload.mutable_created_at() = util::ToProto(util::Now());
  return payload;
}

bool ClipboardManager::HasFiles() const {
  std::lock_guard lock(mutex_);
  return payload_.has_value() && payload_->paths_size() > 0;
}

void ClipboardManager::Clear() {
  {
    std::lock_guard lock(mutex_);
    payload_.reset();
    ++generation_;
  }
  TIERBRIDGE_LOG_INFO("clipboard cleared");
}

// ---------------------------------------------------------------------------
// Paste
// ---------------------------------------------------------------------------

ClipboardManager::BatchResult ClipboardManager::Paste(const std::string& dest_source_id, const std::string& dest_path,
                                                      const ResidencyPolicy& policy) {
  std::optional<Payload> snapshot;
  uint64_t               generation = 0;
  {
    std::lock_guard lock(mutex_);
    if (payload_) {
      snapshot   = payload_;
      generation = generation_;
    }
  }
  const bool internal = snapshot.has_value();
  if (!internal) snapshot = Get();
  if (!snapshot || snapshot->paths_size() == 0) {
    throw util::ClipboardEmpty();
  }

  registry_->Resolve(dest_source_id);

  std::vector<std::string> failed;
  auto                     result = PasteSnapshot(*snapshot, dest_source_id, dest_path, policy, &failed);
  if (internal) {
    Settle(generation, *snapshot, failed);
  }
  return result;
}

ClipboardManager::BatchResult ClipboardManager::PasteToNative(const std::string& dest_path, const ResidencyPolicy& policy) {
  auto result = Paste(source::kNativeSourceId, dest_path, policy);

  if (result.pasted_paths_size() > 0 && native_->Available()) {
    try {
      native_->WriteFiles({result.pasted_paths().begin(), result.pasted_paths().end()});
    } catch (const std::exception& e) {
      TIERBRIDGE_LOG_WARN("native clipboard update failed", {ErrorField(e)});
    }
  }
  return result;
}

ClipboardManager::BatchResult ClipboardManager::PasteSnapshot(const Payload& payload, const std::string& dest_source_id,
                                                              const std::string& dest_path, const ResidencyPolicy& policy,
                                                              std::vector<std::string>* failed) {
  const auto dest = NormalizeTarget(dest_path);
  const bool move = payload.operation() == CLIPBOARD_OPERATION_CUT;

  BatchResult result;
  for (const auto& path : payload.paths()) {
    if (IsSelfOrDescendant(dest, path)) {
      result.set_files_failed(result.files_failed() + 1);
      result.add_errors(path + ": cannot paste a folder into itself");
      failed->push_back(path);
      continue;
    }

    try {
      result.add_pasted_paths(files_->PlaceInto({payload.source_id(), path}, dest_source_id, dest, move, policy));
      result.set_files_pasted(result.files_pasted() + 1);
    } catch (const std::exception& e) {
      result.set_files_failed(result.files_failed() + 1);
      result.add_errors(path + ": " + e.what());
      failed->push_back(path);
    }
  }

  TIERBRIDGE_LOG_INFO("clipboard pasted", {StringField("operation", OperationName(payload.operation())),
                                            StringField("from_source_id", payload.source_id()), StringField("dest_source_id", dest_source_id),
                                            StringField("dest_path", dest), IntField("pasted", result.files_pasted()),
                                            IntField("failed", result.files_failed())});
  return result;
}

void ClipboardManager::Settle(uint64_t generation, const Payload& payload, const std::vector<std::string>& failed) {
  if (payload.operation() != CLIPBOARD_OPERATION_CUT) return;

  std::lock_guard lock(mutex_);
  if (generation_ != generation || !payload_) {
    // A newer copy/cut won; it is not ours to clear.
    return;
  }

  if (failed.empty()) {
    payload_.reset();
  } else {
    payload_->clear_paths();
    for (const auto& path : failed) {
      payload_->add_paths(path);
    }
  }
  ++generation_;
}

// ---------------------------------------------------------------------------
// Native bridge
// ---------------------------------------------------------------------------

std::string ClipboardManager::ExportRoot() const {
  return storage::common::DestPath(config_.export_dir(), kExportDirName);
}

ClipboardManager::NativeExport ClipboardManager::CopyForNative(const std::string& source_id, const std::vector<std::string>& paths,
                                                               const ResidencyPolicy& policy) {
  if (paths.empty()) {
    throw std::invalid_argument("nothing to copy");
  }
  registry_->Resolve(source_id);
  auto driver = registry_->Driver(source_id);

  const auto root     = ExportRoot();
  bool       prepared = false;

  NativeExport out;
  for (const auto& path : UniquePaths(paths)) {
    try {
      if (auto host = driver->LocalPath(path)) {
        if (!driver->Exists(path)) throw util::NotFound("not found: " + path);
        out.exported_paths.push_back(*host);
        continue;
      }

      // The previous export is superseded by this one.
      if (!prepared) {
        local_driver_->DeleteRecursive(root);
        local_driver_->Mkdir(root);
        prepared = true;
      }
      out.exported_paths.push_back(files_->PlaceInto({source_id, path}, source::kNativeSourceId, root, /*move=*/false, policy));
    } catch (const std::exception& e) {
      out.errors.push_back(path + ": " + e.what());
    }
  }

  // Exported files stay on disk when the host clipboard refuses them.
  bool written = false;
  if (!out.exported_paths.empty()) {
    try {
      native_->WriteFiles(out.exported_paths);
      written = true;
    } catch (const std::exception& e) {
      out.errors.push_back("system clipboard: " + std::string(e.what()));
      TIERBRIDGE_LOG_WARN("native clipboard write failed", {StringField("source_id", source_id), ErrorField(e)});
    }
  }

  if (written) {
    out.status = "Copied " + std::to_string(out.exported_paths.size()) + " item(s) to the system clipboard";
  } else if (!out.exported_paths.empty()) {
    out.status = "Exported " + std::to_string(out.exported_paths.size()) + " item(s) but the system clipboard is unavailable";
  } else {
    out.status = "Copied 0 item(s) to the system clipboard";
  }
  if (!out.errors.empty()) {
    out.status += ", " + std::to_string(out.errors.size()) + " failed";
  }

  TIERBRIDGE_LOG_INFO("exported to native clipboard", {StringField("source_id", source_id),
                                                        IntField("exported", static_cast<int64_t>(out.exported_paths.size())),
                                                        IntField("failed", static_cast<int64_t>(out.errors.size()))});
  return out;
}

std::vector<std::string> ClipboardManager::ReadNative() const {
  std::vector<std::string> out;
  for (const auto& raw : native_->ReadFiles()) {
    try {
      auto path = NormalizeTarget(raw);
      if (local_driver_->Exists(path)) out.push_back(std::move(path));
    } catch (const std::invalid_argument& e) {
      TIERBRIDGE_LOG_DEBUG("ignoring native clipboard entry", {StringField("path", raw), ErrorField(e)});
    }
  }
  return out;
}

std::vector<std::string> ClipboardManager::WriteNative(const std::vector<std::string>& paths) {
  const auto unique = UniquePaths(paths);
  native_->WriteFiles(unique);
  return unique;
}

ClipboardManager::BatchResult ClipboardManager::PasteNativeIntoVfs(const std::vector<std::string>& paths, const std::string& dest_source_id,
                                                                   const std::string& dest_path, const ResidencyPolicy& policy) {
  const auto host = paths.empty() ? ReadNative() : UniquePaths(paths);
  if (host.empty()) {
    throw util::ClipboardEmpty();
  }
  registry_->Resolve(dest_source_id);

  Payload payload;
  payload.set_operation(CLIPBOARD_OPERATION_COPY);
  payload.set_source_id(source::kNativeSourceId);
  for (const auto& path : host) {
    payload.add_paths(path);
  }

  std::vector<std::string> failed;
  return PasteSnapshot(payload, dest_source_id, dest_path, policy, &failed);
}

} // namespace tierbridge::clipboard
