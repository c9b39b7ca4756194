#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/mockfs.h>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include "internal/source/source_registry.hpp"
#include "internal/storage/arrow/arrow_source_driver.hpp"

namespace tierbridge::testing {

using tierbridge::vfs::core::v1::Capability;
using tierbridge::vfs::core::v1::SourceCategory;

// Unique host directory, removed with everything in it on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& prefix = "tierbridge-test") {
    std::random_device rd;
    path_ = (std::filesystem::temp_directory_path() / (prefix + "-" + std::to_string(rd()) + "-" +
                                                       std::to_string(std::chrono::steady_clock::now().time_since_epoch().count())))
                .string();
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&)            = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const {
    return path_;
  }

  std::string operator/(const std::string& name) const {
    return path_ + "/" + name;
  }

 private:
  std::string path_;
};

// The host filesystem, addressed by absolute host paths.
inline storage::SourceDriverPtr HostDriver() {
  return std::make_shared<storage::ArrowSourceDriver>(std::make_shared<arrow::fs::LocalFileSystem>(), "/");
}

// A host directory mounted as a source root.
inline storage::SourceDriverPtr LocalDriver(const std::string& root) {
  return std::make_shared<storage::ArrowSourceDriver>(std::make_shared<arrow::fs::LocalFileSystem>(), root);
}

// In-memory filesystem; it has no host path, so it behaves like a remote bucket.
inline storage::SourceDriverPtr BucketDriver() {
  auto fs = std::make_shared<arrow::fs::internal::MockFileSystem>(
      std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now()));
  return std::make_shared<storage::ArrowSourceDriver>(std::move(fs), "");
}

/*
  Forwards everything to another driver. WritePart can be made to throw for
  the next N calls, or be held at a gate until the test opens it.
*/
class FaultyDriver final : public storage::SourceDriver {
 public:
  explicit FaultyDriver(storage::SourceDriverPtr inner) : inner_(std::move(inner)) {
  }

  void FailWrites(int count, std::function<void()> raise) {
    std::lock_guard lock(mutex_);
    failures_ = count;
    raise_    = std::move(raise);
  }

  void HoldWrites() {
    std::lock_guard lock(mutex_);
    held_ = true;
  }

  void ReleaseWrites() {
    {
      std::lock_guard lock(mutex_);
      held_ = false;
    }
    changed_.notify_all();
  }

  // Waits until at least n WritePart calls arrived. False on timeout.
  bool WaitForWrites(int n, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    std::unique_lock lock(mutex_);
    return changed_.wait_for(lock, timeout, [&] { return write_calls_ >= n; });
  }

  int write_calls() const {
    std::lock_guard lock(mutex_);
    return write_calls_;
  }

  std::optional<storage::FileStat> Stat(const std::string& path) override {
    return inner_->Stat(path);
  }
  std::vector<storage::FileStat> List(const std::string& dir, bool recursive) override {
    return inner_->List(dir, recursive);
  }
  std::shared_ptr<arrow::Buffer> ReadAt(const std::string& path, uint64_t offset, uint64_t length) override {
    return inner_->ReadAt(path, offset, length);
  }
  void WriteAll(const std::string& path, const std::shared_ptr<arrow::Buffer>& buffer) override {
    inner_->WriteAll(path, buffer);
  }

  void WritePart(const std::string& path, uint32_t part_index, const std::shared_ptr<arrow::Buffer>& buffer) override {
    std::function<void()> raise;
    {
      std::unique_lock lock(mutex_);
      ++write_calls_;
      changed_.notify_all();
      changed_.wait(lock, [&] { return !held_; });
      if (failures_ > 0) {
        --failures_;
        raise = raise_;
      }
    }
    if (raise) raise();
    inner_->WritePart(path, part_index, buffer);
  }

  void FinalizeParts(const std::string& path, uint32_t total_parts) override {
    inner_->FinalizeParts(path, total_parts);
  }
  bool HasPendingParts(const std::string& path) override {
    return inner_->HasPendingParts(path);
  }
  void Move(const std::string& from, const std::string& to) override {
    inner_->Move(from, to);
  }
  void Copy(const std::string& from, const std::string& to) override {
    inner_->Copy(from, to);
  }
  void DeleteRecursive(const std::string& path) override {
    inner_->DeleteRecursive(path);
  }
  void Mkdir(const std::string& path) override {
    inner_->Mkdir(path);
  }
  std::optional<std::string> LocalPath(const std::string& path) const override {
    return inner_->LocalPath(path);
  }

 private:
  storage::SourceDriverPtr inner_;

  mutable std::mutex      mutex_;
  std::condition_variable changed_;
  int                     failures_    = 0;
  int                     write_calls_ = 0;
  bool                    held_        = false;
  std::function<void()>   raise_;
};

inline void Mount(source::SourceRegistry& registry, const std::string& id, SourceCategory category, storage::SourceDriverPtr driver,
                  std::initializer_list<Capability> capabilities = {}) {
  tierbridge::vfs::core::v1::StorageSource source;
  source.set_id(id);
  source.set_name(id);
  source.set_category(category);
  for (auto capability : capabilities) {
    source.add_capabilities(capability);
  }
  registry.Mount(std::move(source), std::move(driver));
}

inline void Put(storage::SourceDriver& driver, const std::string& path, const std::string& text) {
  driver.WriteAll(path, arrow::Buffer::FromString(text));
}

inline std::string Slurp(storage::SourceDriver& driver, const std::string& path) {
  auto stat = driver.Stat(path);
  if (!stat) return "";
  return driver.ReadAt(path, 0, stat->size)->ToString();
}

} // namespace tierbridge::testing
