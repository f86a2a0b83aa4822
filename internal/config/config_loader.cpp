#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace storykb::config {

using storykb::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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
      throw util::ValidationError("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;

  // an empty document means "all defaults"
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ValidationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::ValidationError("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::ValidationError("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw util::ValidationError("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  using namespace storykb::runtime::config;

  auto* ledger = config.mutable_ledger();
  if (ledger->backend() == LedgerConfig::LEDGER_BACKEND_UNSPECIFIED) {
    ledger->set_backend(LedgerConfig::LEDGER_BACKEND_MEMORY);
  }
  if (ledger->sqlite().busy_timeout_ms() == 0) {
    ledger->mutable_sqlite()->set_busy_timeout_ms(5000);
  }

  auto* graph = config.mutable_graph_store();
  if (graph->backend() == GraphStoreConfig::GRAPH_BACKEND_UNSPECIFIED) {
    graph->set_backend(GraphStoreConfig::GRAPH_BACKEND_MEMORY);
  }
  if (graph->sqlite().busy_timeout_ms() == 0) {
    graph->mutable_sqlite()->set_busy_timeout_ms(5000);
  }
  if (graph->sqlite().max_connections() == 0) {
    graph->mutable_sqlite()->set_max_connections(4);
  }

  auto* vector = config.mutable_vector_store();
  if (vector->backend() == VectorStoreConfig::VECTOR_BACKEND_UNSPECIFIED) {
    vector->set_backend(VectorStoreConfig::VECTOR_BACKEND_MEMORY);
  }

  auto* coordinator = config.mutable_coordinator();
  if (coordinator->prepare_timeout_ms() == 0) {
    coordinator->set_prepare_timeout_ms(5000);
  }
  if (coordinator->commit_timeout_ms() == 0) {
    coordinator->set_commit_timeout_ms(5000);
  }
  if (coordinator->conflict_policy() == CONFLICT_POLICY_UNSPECIFIED) {
    coordinator->set_conflict_policy(CONFLICT_POLICY_WAIT);
  }
  if (coordinator->lock_wait_timeout_ms() == 0) {
    coordinator->set_lock_wait_timeout_ms(10000);
  }

  auto* retry = coordinator->mutable_retry();
  if (retry->max_attempts() == 0) {
    retry->set_max_attempts(3);
  }
  if (retry->initial_backoff_ms() == 0) {
    retry->set_initial_backoff_ms(20);
  }
  if (retry->max_backoff_ms() == 0) {
    retry->set_max_backoff_ms(500);
  }
  if (retry->multiplier() == 0.0) {
    retry->set_multiplier(2.0);
  }

  auto* workers = config.mutable_workers();
  if (workers->threads() == 0) {
    workers->set_threads(4);
  }

  auto* reconciler = config.mutable_reconciler();
  if (reconciler->interval_ms() == 0) {
    reconciler->set_interval_ms(30000);
  }
  if (reconciler->batch_size() == 0) {
    reconciler->set_batch_size(64);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  using namespace storykb::runtime::config;

  if (config.ledger().backend() == LedgerConfig::LEDGER_BACKEND_SQLITE && config.ledger().sqlite().path().empty()) {
    throw util::ValidationError("ledger.sqlite.path is required for the sqlite ledger backend");
  }
  if (config.graph_store().backend() == GraphStoreConfig::GRAPH_BACKEND_SQLITE && config.graph_store().sqlite().path().empty()) {
    throw util::ValidationError("graph_store.sqlite.path is required for the sqlite graph backend");
  }

  const auto& retry = config.coordinator().retry();
  if (retry.multiplier() < 1.0) {
    throw util::ValidationError("coordinator.retry.multiplier must be >= 1");
  }
  if (retry.max_backoff_ms() < retry.initial_backoff_ms()) {
    throw util::ValidationError("coordinator.retry.max_backoff_ms must be >= initial_backoff_ms");
  }
}

} // namespace storykb::config
