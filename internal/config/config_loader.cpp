#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace collab::config {

using collab::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultBindAddress     = "0.0.0.0:50061";
constexpr std::int64_t kDefaultCacheTtlSec    = 7 * 24 * 3600;
constexpr std::int64_t kDefaultRefreshSec     = 3600;
constexpr int          kDefaultMaxDepth       = 6;
constexpr int          kDefaultWindowYears    = 2;
constexpr unsigned     kDefaultPerformerCap   = 10;
constexpr unsigned     kDefaultDirectorCap    = 20;
constexpr unsigned     kDefaultWorkers        = 4;
constexpr unsigned     kDefaultTransientRetry = 5;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
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

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
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

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

void Reject(const std::string& what) {
  throw std::runtime_error("Invalid configuration: " + what);
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
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* edge_policy = config.mutable_edge_policy();
  if (!edge_policy->has_performer_performer_cap()) edge_policy->set_performer_performer_cap(kDefaultPerformerCap);
  if (!edge_policy->has_performer_director_cap()) edge_policy->set_performer_director_cap(kDefaultDirectorCap);

  auto* path_finder = config.mutable_path_finder();
  if (!path_finder->has_cache_ttl()) path_finder->mutable_cache_ttl()->set_seconds(kDefaultCacheTtlSec);
  if (!path_finder->has_default_max_depth()) path_finder->set_default_max_depth(kDefaultMaxDepth);

  auto* trends = config.mutable_trends();
  if (!trends->has_window_years()) trends->set_window_years(kDefaultWindowYears);
  if (!trends->has_refresh_interval()) trends->mutable_refresh_interval()->set_seconds(kDefaultRefreshSec);

  auto* population = config.mutable_population();
  if (!population->has_workers()) population->set_workers(kDefaultWorkers);
  if (!population->has_max_transient_retries()) population->set_max_transient_retries(kDefaultTransientRetry);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& edge_policy = config.edge_policy();
  if (edge_policy.key_crew_roles().empty()) {
    Reject("edge_policy.key_crew_roles must list at least one crew role");
  }
  for (const auto& role : edge_policy.key_crew_roles()) {
    if (role.empty()) Reject("edge_policy.key_crew_roles contains an empty role name");
  }

  const auto& path_finder = config.path_finder();
  if (path_finder.cache_ttl().seconds() <= 0) Reject("path_finder.cache_ttl must be positive");
  if (path_finder.default_max_depth() <= 0) Reject("path_finder.default_max_depth must be positive");

  const auto& trends = config.trends();
  if (trends.window_years() <= 0) Reject("trends.window_years must be positive");
  if (trends.refresh_interval().seconds() <= 0) Reject("trends.refresh_interval must be positive");

  if (config.population().workers() == 0) Reject("population.workers must be positive");

  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) Reject("database.sqlite.path is empty");
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    Reject("database.postgres.connection_uri is empty");
  }
}

} // namespace collab::config
