#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/source_driver.hpp"

namespace tierbridge::storage {

/*
  SourceDriver over any arrow::fs::FileSystem.

  The source root is mounted with a SubTreeFileSystem, so a VFS path "/a/b"
  maps to "<root>/a/b" inside the wrapped filesystem. A local filesystem
  rooted at "/" is used unwrapped with absolute paths. Arrow filesystems are
  thread-safe, which makes the driver shareable as-is.
*/
class ArrowSourceDriver final : public SourceDriver {
 public:
  ArrowSourceDriver(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  std::optional<FileStat> Stat(const std::string& path) override;
  std::vector<FileStat>   List(const std::string& dir, bool recursive) override;

  std::shared_ptr<arrow::Buffer> ReadAt(const std::string& path, uint64_t offset, uint64_t length) override;
  void                           WriteAll(const std::string& path, const std::shared_ptr<arrow::Buffer>& buffer) override;

  void WritePart(const std::string& path, uint32_t part_index, const std::shared_ptr<arrow::Buffer>& buffer) override;
  void FinalizeParts(const std::string& path, uint32_t total_parts) override;
  bool HasPendingParts(const std::string& path) override;

  void Move(const std::string& from, const std::string& to) override;
  void Copy(const std::string& from, const std::string& to) override;
  void DeleteRecursive(const std::string& path) override;
  void Mkdir(const std::string& path) override;

  std::optional<std::string> LocalPath(const std::string& path) const override;

 private:
  // "/a/b" -> "a/b" under a sub-tree, "/a/b" unchanged on an unwrapped local filesystem
  std::string        FsPath(const std::string& vfs_path) const;
  static std::string VfsPath(const std::string& fs_path);
  std::string        PartDir(const std::string& vfs_path) const;
  static std::string PartName(uint32_t part_index);

  void EnsureParent(const std::string& fs_path);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  bool                                   is_local_       = false;
  bool                                   absolute_paths_ = false;
};

} // namespace tierbridge::storage
