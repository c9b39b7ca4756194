#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace tierbridge::storage::common {

/*
  VFS path helpers.

  VFS paths are absolute, '/' separated and never carry a trailing slash
  (except the root itself). They are independent of the host OS.
*/

// "" -> "/", "a//b/" -> "/a/b". Rejects NUL bytes and ".." components.
std::string NormalizeTarget(std::string_view path);

// DestPath("/", "x") == "/x", DestPath("/a/b", "x") == "/a/b/x".
std::string DestPath(std::string_view dir, std::string_view name);

// True when target is path itself or lies beneath it.
bool IsSelfOrDescendant(std::string_view target, std::string_view path);

std::string BaseName(std::string_view path);
std::string ParentPath(std::string_view path);

/*
  Next name in the copy sequence:

      doc.pdf      -> doc copy.pdf
      doc copy.pdf -> doc copy 2.pdf
      doc copy 2.pdf -> doc copy 3.pdf
      folder       -> folder copy

  Directories never split an extension.
*/
std::string GenerateCopyName(std::string_view name, bool is_directory);

/*
  First name in the copy sequence of `name` not reported as taken by `exists`.
  Returns `name` unchanged when it is free. Throws NameConflict after
  kMaxCopyCandidates attempts.
*/
constexpr int kMaxCopyCandidates = 1000;
std::string   NextAvailableName(std::string_view dir, std::string_view name, bool is_directory,
                                const std::function<bool(const std::string&)>& exists);

// Always within [0, 100]; 0 when total is 0.
double ProgressPercentage(uint64_t bytes, uint64_t total);

} // namespace tierbridge::storage::common
