#include "source_registry.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tierbridge::source {

using namespace tierbridge::vfs::core::v1;

void SourceRegistry::Mount(StorageSource source, storage::SourceDriverPtr driver) {
  if (source.id().empty()) {
    throw std::invalid_argument("source id must not be empty");
  }
  if (!driver) {
    throw std::invalid_argument("source " + source.id() + " has no driver");
  }
  if (source.default_tier() == TIER_STATUS_UNSPECIFIED) {
    source.set_default_tier(DefaultTierFor(source.category()));
  }
  if (source.status() == SOURCE_STATUS_UNSPECIFIED) {
    source.set_status(SOURCE_STATUS_CONNECTED);
  }

  const auto id = source.id();
  {
    std::unique_lock lock(mutex_);
    if (sources_.contains(id)) {
      throw util::AlreadyExists("source already mounted: " + id);
    }
    sources_.emplace(id, Entry{std::move(source), std::move(driver)});
  }

  TIERBRIDGE_LOG_INFO("source mounted", {observability::StringField("source_id", id)});
}

void SourceRegistry::Unmount(const std::string& id) {
  {
    std::unique_lock lock(mutex_);
    if (sources_.erase(id) == 0) {
      throw util::SourceNotFound(id);
    }
  }
  TIERBRIDGE_LOG_INFO("source unmounted", {observability::StringField("source_id", id)});
}

void SourceRegistry::SetStatus(const std::string& id, SourceStatus status) {
  std::unique_lock lock(mutex_);
  auto             it = sources_.find(id);
  if (it == sources_.end()) {
    throw util::SourceNotFound(id);
  }
  it->second.source.set_status(status);
}

const SourceRegistry::Entry& SourceRegistry::Find(const std::string& id) const {
  auto it = sources_.find(id);
  if (it == sources_.end()) {
    throw util::SourceNotFound(id);
  }
  return it->second;
}

StorageSource SourceRegistry::Resolve(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return Find(id).source;
}

bool SourceRegistry::Contains(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return sources_.contains(id);
}

std::set<SourceRegistry::Capability> SourceRegistry::CapabilitiesOf(const std::string& id) const {
  std::shared_lock     lock(mutex_);
  std::set<Capability> out;
  for (int capability : Find(id).source.capabilities()) {
    out.insert(static_cast<Capability>(capability));
  }
  return out;
}

bool SourceRegistry::HasCapability(const std::string& id, Capability capability) const {
  std::shared_lock lock(mutex_);
  const auto&      caps = Find(id).source.capabilities();
  return std::find(caps.begin(), caps.end(), capability) != caps.end();
}

storage::SourceDriverPtr SourceRegistry::Driver(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return Find(id).driver;
}

std::vector<StorageSource> SourceRegistry::List() const {
  std::vector<StorageSource> out;
  {
    std::shared_lock lock(mutex_);
    out.reserve(sources_.size());
    for (const auto& [id, entry] : sources_) {
      if (id == kNativeSourceId) continue;
      out.push_back(entry.source);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id() < b.id(); });
  return out;
}

std::vector<StorageSource> SourceRegistry::TransferTargets(const std::string& exclude_id) const {
  auto all = List();
  all.erase(std::remove_if(all.begin(), all.end(),
                           [&](const StorageSource& s) { return s.id() == exclude_id || s.status() != SOURCE_STATUS_CONNECTED; }),
            all.end());
  return all;
}

TierStatus SourceRegistry::DefaultTierFor(SourceCategory category) {
  switch (category) {
    case SOURCE_CATEGORY_LOCAL:
    case SOURCE_CATEGORY_BLOCK:
      return TIER_STATUS_HOT;
    case SOURCE_CATEGORY_NETWORK:
      return TIER_STATUS_WARM;
    default:
      return TIER_STATUS_COLD;
  }
}

} // namespace tierbridge::source
