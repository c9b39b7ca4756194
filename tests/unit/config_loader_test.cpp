#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using tierbridge::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "tierbridge_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "C:\\tierbridge\\\"quoted\"\\db.sqlite"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\tierbridge\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestSourcesAndEngineSettingsAreParsed() {
  auto config = ConfigLoader::LoadFromYamlString(R"(sources:
  - id: archive
    name: "Archive bucket"
    category: SOURCE_CATEGORY_CLOUD
    uri: "s3://media/archive"
    provider: PROVIDER_S3
    default_tier: TIER_STATUS_COLD
    capabilities: [CAPABILITY_MULTIPART_UPLOAD, CAPABILITY_TIERING]
    filesystem_options:
      s3:
        region: "eu-west-1"
  - id: home
    category: SOURCE_CATEGORY_LOCAL
    uri: "file:///srv/home"
    capabilities: [CAPABILITY_ATOMIC_RENAME, CAPABILITY_TRANSCODE]
transfer:
  part_size_bytes: 1048576
  per_source_concurrency: 1
tiering:
  retrieval_sec:
    cold_sec: 5
clipboard:
  native_backend: NATIVE_CLIPBOARD_BACKEND_XSEL
)");

  assert(config.sources_size() == 2);
  const auto& archive = config.sources(0);
  assert(archive.id() == "archive");
  assert(archive.category() == tierbridge::vfs::core::v1::SOURCE_CATEGORY_CLOUD);
  assert(archive.provider() == tierbridge::vfs::core::v1::PROVIDER_S3);
  assert(archive.default_tier() == tierbridge::vfs::core::v1::TIER_STATUS_COLD);
  assert(archive.capabilities_size() == 2);
  assert(archive.filesystem_options().s3().region() == "eu-west-1");

  assert(config.transfer().part_size_bytes() == 1048576);
  assert(config.transfer().per_source_concurrency() == 1);
  assert(config.tiering().retrieval_sec().cold_sec() == 5);
  assert(config.clipboard().native_backend() == tierbridge::runtime::config::NATIVE_CLIPBOARD_BACKEND_XSEL);
}

void TestDefaultsFillMissingTunables() {
  auto config = ConfigLoader::LoadFromYamlString("server:\n  bind_address: \"127.0.0.1:1\"\n");

  assert(config.transfer().part_size_bytes() == 5ull * 1024 * 1024);
  assert(config.transfer().workers() > 0);
  assert(config.transfer().per_source_concurrency() > 0);
  assert(config.transfer().progress_interval_ms() <= 1000);
  assert(!config.transfer().staging_dir().empty());
  assert(config.tiering().retrieval_sec().archive_sec() > config.tiering().retrieval_sec().cold_sec());
  assert(config.tiering().max_blocking_retrieval_sec() == 900);
  assert(config.ledger().retention_per_category() == 10);
  assert(config.transcode().ffmpeg_path() == "ffmpeg");
  assert(!config.clipboard().export_dir().empty());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestInvalidSourcesAreRejected() {
  assert(Rejects("sources:\n  - uri: \"file:///a\"\n"));
  assert(Rejects("sources:\n  - id: a\n"));
  assert(Rejects("sources:\n  - id: native\n    uri: \"file:///a\"\n"));
  assert(Rejects("sources:\n  - id: a\n    uri: \"file:///a\"\n  - id: a\n    uri: \"file:///b\"\n"));
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestSourcesAndEngineSettingsAreParsed();
  TestDefaultsFillMissingTunables();
  TestUnknownFieldsAreRejected();
  TestInvalidSourcesAreRejected();

  std::cout << "tierbridge_unit_config_loader: pass\n";
  return 0;
}
