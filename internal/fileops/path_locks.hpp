#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tierbridge::fileops {

/*
  Per-key mutexes for serializing writes to one destination path.
  Slots are created on demand and dropped when the last holder leaves.
*/
class PathLocks {
 public:
  class Guard {
   public:
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&&) = delete;
    Guard(const Guard&)       = delete;
    ~Guard();

   private:
    friend class PathLocks;
    struct Slot;
    Guard(PathLocks* owner, std::string key, std::shared_ptr<Slot> slot);

    PathLocks*            owner_;
    std::string           key_;
    std::shared_ptr<Slot> slot_;
  };

  Guard Lock(const std::string& source_id, const std::string& path);

  // True while some caller holds or waits for the path.
  bool Held(const std::string& source_id, const std::string& path) const;

  size_t Size() const;

 private:
  void Release(const std::string& key);

  mutable std::mutex                                            mutex_;
  std::unordered_map<std::string, std::shared_ptr<Guard::Slot>> slots_;
};

} // namespace tierbridge::fileops
