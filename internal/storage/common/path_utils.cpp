#include "path_utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "internal/util/errors.hpp"

namespace tierbridge::storage::common {

std::string NormalizeTarget(std::string_view path) {
  if (path.find('\0') != std::string_view::npos) {
    throw std::invalid_argument("path contains NUL byte");
  }

  std::vector<std::string_view> parts;
  size_t                        pos = 0;
  while (pos <= path.size()) {
    auto next = path.find('/', pos);
    if (next == std::string_view::npos) next = path.size();
    auto part = path.substr(pos, next - pos);
    if (part == "..") {
      throw std::invalid_argument("path must not contain '..' components: " + std::string(path));
    }
    if (!part.empty() && part != ".") {
      parts.push_back(part);
    }
    pos = next + 1;
  }

  if (parts.empty()) {
    return "/";
  }

  std::string out;
  for (const auto& part : parts) {
    out.push_back('/');
    out.append(part);
  }
  return out;
}

std::string DestPath(std::string_view dir, std::string_view name) {
  const auto base = NormalizeTarget(dir);
  if (base == "/") {
    return "/" + std::string(name);
  }
  return base + "/" + std::string(name);
}

bool IsSelfOrDescendant(std::string_view target, std::string_view path) {
  const auto t = NormalizeTarget(target);
  const auto p = NormalizeTarget(path);
  if (p == "/") {
    return true;
  }
  return t == p || t.starts_with(p + "/");
}

std::string BaseName(std::string_view path) {
  const auto normalized = NormalizeTarget(path);
  if (normalized == "/") {
    return "";
  }
  return normalized.substr(normalized.rfind('/') + 1);
}

std::string ParentPath(std::string_view path) {
  const auto normalized = NormalizeTarget(path);
  const auto slash      = normalized.rfind('/');
  if (slash == 0) {
    return "/";
  }
  return normalized.substr(0, slash);
}

namespace {

constexpr std::string_view kCopy = " copy";

bool ParseCounter(std::string_view digits, unsigned* out) {
  if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }
  try {
    *out = static_cast<unsigned>(std::stoul(std::string(digits)));
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

std::string NextInSequence(std::string_view stem) {
  const auto copy_pos = stem.rfind(kCopy);
  if (copy_pos != std::string_view::npos) {
    const auto after = stem.substr(copy_pos + kCopy.size());
    if (after.empty()) {
      return std::string(stem) + " 2";
    }
    unsigned counter = 0;
    if (after.front() == ' ' && ParseCounter(after.substr(1), &counter)) {
      return std::string(stem.substr(0, copy_pos + kCopy.size())) + " " + std::to_string(counter + 1);
    }
  }
  return std::string(stem) + std::string(kCopy);
}

} // namespace

std::string GenerateCopyName(std::string_view name, bool is_directory) {
  const auto dot = name.rfind('.');
  // Leading-dot names (".env") have no extension.
  if (is_directory || dot == std::string_view::npos || dot == 0) {
    return NextInSequence(name);
  }
  return NextInSequence(name.substr(0, dot)) + std::string(name.substr(dot));
}

std::string NextAvailableName(std::string_view dir, std::string_view name, bool is_directory,
                              const std::function<bool(const std::string&)>& exists) {
  std::string candidate(name);
  for (int attempt = 0; attempt < kMaxCopyCandidates; ++attempt) {
    if (!exists(DestPath(dir, candidate))) {
      return candidate;
    }
    candidate = GenerateCopyName(candidate, is_directory);
  }
  throw util::NameConflict("no free name for '" + std::string(name) + "' in " + std::string(dir));
}

double ProgressPercentage(uint64_t bytes, uint64_t total) {
  if (total == 0) {
    return 0.0;
  }
  const double pct = static_cast<double>(bytes) / static_cast<double>(total) * 100.0;
  return std::clamp(pct, 0.0, 100.0);
}

} // namespace tierbridge::storage::common
