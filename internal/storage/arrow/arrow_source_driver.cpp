#include "arrow_source_driver.hpp"

#include <arrow/io/interfaces.h>

#include <chrono>
#include <cstdio>
#include <filesystem>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace tierbridge::storage {

using namespace tierbridge::storage::common;

namespace {

constexpr const char* kPartSuffix = ".tbparts";

// True when any component of fs_path is a part directory.
bool InPartDir(const std::string& fs_path) {
  const std::string suffix(kPartSuffix);
  size_t            pos = fs_path.find(suffix);
  while (pos != std::string::npos) {
    const size_t end = pos + suffix.size();
    if (end == fs_path.size() || fs_path[end] == '/') return true;
    pos = fs_path.find(suffix, end);
  }
  return false;
}

FileStat ToStat(const arrow::fs::FileInfo& info, std::string vfs_path) {
  FileStat stat;
  stat.path         = std::move(vfs_path);
  stat.is_directory = info.IsDirectory();
  stat.size         = info.size() > 0 ? static_cast<uint64_t>(info.size()) : 0;
  const auto ms     = std::chrono::duration_cast<std::chrono::milliseconds>(info.mtime().time_since_epoch()).count();
  stat.mtime_ms     = ms > 0 ? ms : 0;
  return stat;
}

} // namespace

ArrowSourceDriver::ArrowSourceDriver(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : root_path_(std::move(root_path)), is_local_(fs->type_name() == "local") {
  const bool host_root = root_path_.empty() || root_path_ == "/";
  if (is_local_ && host_root) {
    root_path_      = "/";
    absolute_paths_ = true;
    fs_             = std::move(fs);
    return;
  }
  if (is_local_) {
    Unwrap(fs->CreateDir(root_path_, /*recursive=*/true));
  }
  fs_ = root_path_.empty() ? std::move(fs) : std::make_shared<arrow::fs::SubTreeFileSystem>(root_path_, std::move(fs));
}

std::string ArrowSourceDriver::FsPath(const std::string& vfs_path) const {
  auto normalized = NormalizeTarget(vfs_path);
  return absolute_paths_ ? normalized : normalized.substr(1);
}

std::string ArrowSourceDriver::VfsPath(const std::string& fs_path) {
  if (!fs_path.empty() && fs_path.front() == '/') return NormalizeTarget(fs_path);
  return NormalizeTarget("/" + fs_path);
}

std::string ArrowSourceDriver::PartDir(const std::string& vfs_path) const {
  return FsPath(vfs_path) + kPartSuffix;
}

std::string ArrowSourceDriver::PartName(uint32_t part_index) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "part-%05u", part_index);
  return buf;
}

void ArrowSourceDriver::EnsureParent(const std::string& fs_path) {
  const auto slash = fs_path.rfind('/');
  if (slash == std::string::npos || slash == 0) return; // parent is the root
  Unwrap(fs_->CreateDir(fs_path.substr(0, slash), /*recursive=*/true));
}

// ------------------------------------------------------------------
// Metadata
// ------------------------------------------------------------------

std::optional<FileStat> ArrowSourceDriver::Stat(const std::string& path) {
  const auto fs_path = FsPath(path);
  auto       info    = Unwrap(fs_->GetFileInfo(fs_path));
  if (info.type() == arrow::fs::FileType::NotFound) return std::nullopt;
  return ToStat(info, NormalizeTarget(path));
}

std::vector<FileStat> ArrowSourceDriver::List(const std::string& dir, bool recursive) {
  arrow::fs::FileSelector selector;
  selector.base_dir       = FsPath(dir);
  selector.recursive      = recursive;
  selector.allow_not_found = false;

  auto infos = Unwrap(fs_->GetFileInfo(selector));

  std::vector<FileStat> out;
  out.reserve(infos.size());
  for (const auto& info : infos) {
    if (InPartDir(info.path())) continue;
    out.push_back(ToStat(info, VfsPath(info.path())));
  }
  return out;
}

// ------------------------------------------------------------------
// Bytes
// ------------------------------------------------------------------

std::shared_ptr<arrow::Buffer> ArrowSourceDriver::ReadAt(const std::string& path, uint64_t offset, uint64_t length) {
  auto input = Unwrap(fs_->OpenInputFile(FsPath(path)));
  return Unwrap(input->ReadAt(static_cast<int64_t>(offset), static_cast<int64_t>(length)));
}

void ArrowSourceDriver::WriteAll(const std::string& path, const std::shared_ptr<arrow::Buffer>& buffer) {
  const auto fs_path = FsPath(path);
  EnsureParent(fs_path);
  auto out = Unwrap(fs_->OpenOutputStream(fs_path));
  if (buffer && buffer->size() > 0) {
    Unwrap(out->Write(buffer->data(), buffer->size()));
  }
  Unwrap(out->Close());
}

void ArrowSourceDriver::WritePart(const std::string& path, uint32_t part_index, const std::shared_ptr<arrow::Buffer>& buffer) {
  const auto part_dir = PartDir(path);
  Unwrap(fs_->CreateDir(part_dir, /*recursive=*/true));

  auto out = Unwrap(fs_->OpenOutputStream(part_dir + "/" + PartName(part_index)));
  if (buffer && buffer->size() > 0) {
    Unwrap(out->Write(buffer->data(), buffer->size()));
  }
  Unwrap(out->Close());
}

void ArrowSourceDriver::FinalizeParts(const std::string& path, uint32_t total_parts) {
  const auto fs_path  = FsPath(path);
  const auto part_dir = PartDir(path);
  EnsureParent(fs_path);

  auto out = Unwrap(fs_->OpenOutputStream(fs_path));
  for (uint32_t i = 0; i < total_parts; ++i) {
    auto part = ReadAll(Unwrap(fs_->OpenInputFile(part_dir + "/" + PartName(i))));
    if (part->size() > 0) {
      Unwrap(out->Write(part->data(), part->size()));
    }
  }
  Unwrap(out->Close());

  auto info = Unwrap(fs_->GetFileInfo(part_dir));
  if (info.type() != arrow::fs::FileType::NotFound) {
    Unwrap(fs_->DeleteDir(part_dir));
  }
}

bool ArrowSourceDriver::HasPendingParts(const std::string& path) {
  auto info = Unwrap(fs_->GetFileInfo(PartDir(path)));
  return info.type() == arrow::fs::FileType::Directory;
}

// ------------------------------------------------------------------
// Namespace operations
// ------------------------------------------------------------------

void ArrowSourceDriver::Move(const std::string& from, const std::string& to) {
  const auto dest = FsPath(to);
  EnsureParent(dest);
  Unwrap(fs_->Move(FsPath(from), dest));
}

void ArrowSourceDriver::Copy(const std::string& from, const std::string& to) {
  const auto from_vfs = NormalizeTarget(from);
  const auto to_vfs   = NormalizeTarget(to);
  const auto src      = FsPath(from_vfs);
  const auto dest     = FsPath(to_vfs);

  auto info = Unwrap(fs_->GetFileInfo(src));
  if (info.type() == arrow::fs::FileType::NotFound) {
    throw util::NotFound("copy source not found: " + from_vfs);
  }

  if (!info.IsDirectory()) {
    EnsureParent(dest);
    Unwrap(fs_->CopyFile(src, dest));
    return;
  }

  Unwrap(fs_->CreateDir(dest, /*recursive=*/true));

  arrow::fs::FileSelector selector;
  selector.base_dir  = src;
  selector.recursive = true;

  const size_t prefix = from_vfs == "/" ? 1 : from_vfs.size() + 1;

  // Directories come before their contents in a recursive listing.
  for (const auto& entry : Unwrap(fs_->GetFileInfo(selector))) {
    if (InPartDir(entry.path())) continue;
    const auto relative = VfsPath(entry.path()).substr(prefix);
    const auto target   = FsPath(DestPath(to_vfs, relative));
    if (entry.IsDirectory()) {
      Unwrap(fs_->CreateDir(target, /*recursive=*/true));
    } else {
      EnsureParent(target);
      Unwrap(fs_->CopyFile(entry.path(), target));
    }
  }
}

void ArrowSourceDriver::DeleteRecursive(const std::string& path) {
  if (NormalizeTarget(path) == "/") {
    throw util::InvalidState("refusing to delete the source root");
  }
  const auto fs_path = FsPath(path);

  auto info = Unwrap(fs_->GetFileInfo(fs_path));
  switch (info.type()) {
    case arrow::fs::FileType::NotFound:
      return;
    case arrow::fs::FileType::Directory:
      Unwrap(fs_->DeleteDir(fs_path));
      return;
    default:
      Unwrap(fs_->DeleteFile(fs_path));
      return;
  }
}

void ArrowSourceDriver::Mkdir(const std::string& path) {
  const auto fs_path = FsPath(path);
  auto       info    = Unwrap(fs_->GetFileInfo(fs_path));
  if (info.type() != arrow::fs::FileType::NotFound) {
    throw util::AlreadyExists("path already exists: " + NormalizeTarget(path));
  }
  Unwrap(fs_->CreateDir(fs_path, /*recursive=*/true));
}

std::optional<std::string> ArrowSourceDriver::LocalPath(const std::string& path) const {
  if (!is_local_) return std::nullopt;
  const auto relative = NormalizeTarget(path).substr(1);
  if (absolute_paths_) return "/" + relative;
  std::filesystem::path full(root_path_);
  if (!relative.empty()) full /= relative;
  return full.lexically_normal().string();
}

} // namespace tierbridge::storage
