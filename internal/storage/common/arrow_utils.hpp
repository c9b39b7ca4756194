#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace tierbridge::storage::common {

/*
  Translate a failed arrow::Status into the error taxonomy and throw.

      errno EACCES/EPERM        -> PermissionDenied
      errno ENOSPC/EDQUOT       -> DestinationFull
      errno ENOENT, "not found" -> NotFound
      errno EEXIST              -> AlreadyExists
      anything else             -> std::runtime_error
*/
[[noreturn]] void ThrowStatus(const arrow::Status& status);

template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) ThrowStatus(result.status());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) ThrowStatus(status);
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

/*
  Build the filesystem behind a source URI.

  Returns the filesystem and the root path inside it. Explicit S3/GCS/Azure
  options win over whatever the URI query string carries.
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const std::string& uri, const tierbridge::runtime::config::FileSystemOptions& filesystem_options);

} // namespace tierbridge::storage::common
