#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tierbridge::storage {

struct FileStat {
  std::string path; // absolute VFS path
  bool        is_directory = false;
  uint64_t    size         = 0;
  int64_t     mtime_ms     = 0;
};

/*
  Storage backend behind one mounted source.

  All paths are absolute VFS paths ("/a/b"). Every byte moves as an Arrow
  buffer. Implementations are shared by all transfers targeting the source
  and must be safe for concurrent use.

  Errors are reported with the util::errors taxonomy (NotFound,
  PermissionDenied, DestinationFull, AlreadyExists); anything else is a
  transient std::runtime_error.
*/

class SourceDriver {
 public:
  virtual ~SourceDriver() = default;

  // ------------------------------------------------------------------
  // Metadata
  // ------------------------------------------------------------------
  virtual std::optional<FileStat> Stat(const std::string& path) = 0;

  /*
    Children of dir (all descendants when recursive). Throws NotFound when
    dir does not exist. In-flight part directories are hidden.
  */
  virtual std::vector<FileStat> List(const std::string& dir, bool recursive) = 0;

  bool Exists(const std::string& path) {
    return Stat(path).has_value();
  }

  // ------------------------------------------------------------------
  // Bytes
  // ------------------------------------------------------------------
  // May return fewer than length bytes at end of file.
  virtual std::shared_ptr<arrow::Buffer> ReadAt(const std::string& path, uint64_t offset, uint64_t length) = 0;

  // Creates missing parent directories; replaces an existing file.
  virtual void WriteAll(const std::string& path, const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  /*
    Multipart writes.

    Each part lands as a separate object next to the destination:

        <path>.tbparts/part-00000
        <path>.tbparts/part-00001

    FinalizeParts concatenates parts [0, total_parts) into <path> and drops
    the part directory. An interrupted transfer can rewrite any part and
    finalize later.
  */
  virtual void WritePart(const std::string& path, uint32_t part_index, const std::shared_ptr<arrow::Buffer>& buffer) = 0;
  virtual void FinalizeParts(const std::string& path, uint32_t total_parts) = 0;

  // True while <path> has parts written but not finalized.
  virtual bool HasPendingParts(const std::string& path) = 0;

  // ------------------------------------------------------------------
  // Namespace operations
  // ------------------------------------------------------------------
  virtual void Move(const std::string& from, const std::string& to) = 0;

  // Server-side copy; directories are copied recursively.
  virtual void Copy(const std::string& from, const std::string& to) = 0;

  // Deleting an absent path succeeds.
  virtual void DeleteRecursive(const std::string& path) = 0;

  // Creates missing parents; throws AlreadyExists when path exists.
  virtual void Mkdir(const std::string& path) = 0;

  // Host filesystem path for sources that live on local disk, else nullopt.
  virtual std::optional<std::string> LocalPath(const std::string& path) const = 0;
};

using SourceDriverPtr = std::shared_ptr<SourceDriver>;

} // namespace tierbridge::storage
