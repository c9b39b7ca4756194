#include "path_locks.hpp"

namespace tierbridge::fileops {

struct PathLocks::Guard::Slot {
  std::mutex mutex;
  size_t     users = 0;
};

PathLocks::Guard::Guard(PathLocks* owner, std::string key, std::shared_ptr<Slot> slot)
    : owner_(owner), key_(std::move(key)), slot_(std::move(slot)) {
}

PathLocks::Guard::Guard(Guard&& other) noexcept
    : owner_(other.owner_), key_(std::move(other.key_)), slot_(std::move(other.slot_)) {
  other.owner_ = nullptr;
}

PathLocks::Guard::~Guard() {
  if (!owner_ || !slot_) return;
  slot_->mutex.unlock();
  owner_->Release(key_);
}

namespace {

std::string Key(const std::string& source_id, const std::string& path) {
  return source_id + '\n' + path;
}

} // namespace

PathLocks::Guard PathLocks::Lock(const std::string& source_id, const std::string& path) {
  auto                         key = Key(source_id, path);
  std::shared_ptr<Guard::Slot> slot;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = slots_[key];
    if (!entry) entry = std::make_shared<Guard::Slot>();
    ++entry->users;
    slot = entry;
  }
  slot->mutex.lock();
  return Guard(this, std::move(key), std::move(slot));
}

bool PathLocks::Held(const std::string& source_id, const std::string& path) const {
  std::lock_guard lock(mutex_);
  return slots_.count(Key(source_id, path)) > 0;
}

void PathLocks::Release(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto            it = slots_.find(key);
  if (it != slots_.end() && --it->second->users == 0) {
    slots_.erase(it);
  }
}

size_t PathLocks::Size() const {
  std::lock_guard lock(mutex_);
  return slots_.size();
}

} // namespace tierbridge::fileops
