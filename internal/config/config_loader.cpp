#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace causal::config {

using causal::runtime::config::RuntimeConfig;

namespace {

constexpr uint64_t kDefaultCacheMaxSize = 1000;
constexpr uint64_t kDefaultCacheTtlMs   = 300000;
constexpr uint64_t kDefaultPageSize     = 1000;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("1000" vs 1000)
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

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

  ApplyDefaults(config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (!config.has_cache()) {
    config.mutable_cache()->set_enabled(true);
  }
  if (config.cache().max_size() == 0) {
    config.mutable_cache()->set_max_size(kDefaultCacheMaxSize);
  }
  if (config.cache().ttl_ms() == 0) {
    config.mutable_cache()->set_ttl_ms(kDefaultCacheTtlMs);
  }

  // lineage queries depend on these two, so an absent section keeps them on
  if (!config.has_indexes()) {
    config.mutable_indexes()->set_correlation_id(true);
    config.mutable_indexes()->set_causation_id(true);
  }

  if (config.store().missing_parent() == causal::runtime::config::MISSING_PARENT_POLICY_UNSPECIFIED) {
    config.mutable_store()->set_missing_parent(causal::runtime::config::MISSING_PARENT_POLICY_FALLBACK);
  }

  if (config.replay().page_size() == 0) {
    config.mutable_replay()->set_page_size(kDefaultPageSize);
  }
}

} // namespace causal::config
