#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <unordered_set>

namespace tierbridge::config {

using tierbridge::runtime::config::RuntimeConfig;

namespace {

constexpr uint64_t kDefaultPartSize           = 5ull * 1024 * 1024;
constexpr uint32_t kDefaultTransferWorkers    = 4;
constexpr uint32_t kDefaultPerSourceLimit     = 2;
constexpr uint32_t kDefaultPartAttempts       = 3;
constexpr uint32_t kDefaultRetryBackoffMs     = 200;
constexpr uint32_t kDefaultSpeedWindowMs      = 5000;
constexpr uint32_t kDefaultProgressIntervalMs = 1000;
constexpr uint32_t kDefaultTransferHistory    = 100;
constexpr uint32_t kDefaultLedgerRetention    = 10;
constexpr uint64_t kDefaultReadChunk          = 1024 * 1024;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("0.0.0.0:50051", "007")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig ParseNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  ConfigLoader::Validate(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address("127.0.0.1:50061");
  }

  auto* transfer = config->mutable_transfer();
  if (transfer->part_size_bytes() == 0) transfer->set_part_size_bytes(kDefaultPartSize);
  if (transfer->workers() == 0) transfer->set_workers(kDefaultTransferWorkers);
  if (transfer->per_source_concurrency() == 0) transfer->set_per_source_concurrency(kDefaultPerSourceLimit);
  if (transfer->max_part_attempts() == 0) transfer->set_max_part_attempts(kDefaultPartAttempts);
  if (transfer->retry_backoff_ms() == 0) transfer->set_retry_backoff_ms(kDefaultRetryBackoffMs);
  if (transfer->speed_window_ms() == 0) transfer->set_speed_window_ms(kDefaultSpeedWindowMs);
  if (transfer->progress_interval_ms() == 0) transfer->set_progress_interval_ms(kDefaultProgressIntervalMs);
  if (transfer->history_retention() == 0) transfer->set_history_retention(kDefaultTransferHistory);
  if (transfer->staging_dir().empty()) {
    transfer->set_staging_dir((std::filesystem::temp_directory_path() / "tierbridge-staging").string());
  }

  auto* tiering = config->mutable_tiering();
  if (tiering->workers() == 0) tiering->set_workers(2);
  if (tiering->read_chunk_bytes() == 0) tiering->set_read_chunk_bytes(kDefaultReadChunk);
  if (!tiering->has_retrieval_sec()) {
    auto* retrieval = tiering->mutable_retrieval_sec();
    retrieval->set_warm_sec(1);
    retrieval->set_cold_sec(60);
    retrieval->set_nearline_sec(30);
    retrieval->set_archive_sec(12 * 60 * 60);
  }
  if (tiering->max_blocking_retrieval_sec() == 0) tiering->set_max_blocking_retrieval_sec(15 * 60);

  auto* clipboard = config->mutable_clipboard();
  if (clipboard->export_dir().empty()) {
    clipboard->set_export_dir(std::filesystem::temp_directory_path().string());
  }

  if (config->ledger().retention_per_category() == 0) {
    config->mutable_ledger()->set_retention_per_category(kDefaultLedgerRetention);
  }

  auto* transcode = config->mutable_transcode();
  if (transcode->ffmpeg_path().empty()) transcode->set_ffmpeg_path("ffmpeg");
  if (transcode->workers() == 0) transcode->set_workers(1);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  std::unordered_set<std::string> ids;
  for (const auto& source : config.sources()) {
    if (source.id().empty()) {
      throw std::runtime_error("Invalid configuration: source id must not be empty");
    }
    if (source.id() == "native") {
      throw std::runtime_error("Invalid configuration: source id 'native' is reserved for the host clipboard");
    }
    if (!ids.insert(source.id()).second) {
      throw std::runtime_error("Invalid configuration: duplicate source id " + source.id());
    }
    if (source.uri().empty()) {
      throw std::runtime_error("Invalid configuration: source " + source.id() + " has no uri");
    }
  }
}

} // namespace tierbridge::config
