#include "storage_factory.hpp"

#include "arrow/arrow_source_driver.hpp"
#include "common/arrow_utils.hpp"

namespace tierbridge::storage {

SourceDriverPtr StorageFactory::Build(const tierbridge::runtime::config::SourceConfig& source) {
  auto [fs, root] = common::Unwrap(common::ResolveFileSystem(source.uri(), source.filesystem_options()));
  return std::make_shared<ArrowSourceDriver>(std::move(fs), std::move(root));
}

} // namespace tierbridge::storage
