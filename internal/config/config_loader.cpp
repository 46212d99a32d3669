#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "internal/db/sql/sql_queries.hpp"

namespace strata::config {

using strata::runtime::config::RuntimeConfig;

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

void ToProtoValue(const YAML::Node& node, google::protobuf::Value* out);

// Plain scalars are typed by their spelling; quoted ones are always strings
// so "0644" or "true" survive as text.
void ScalarToProtoValue(const YAML::Node& node, google::protobuf::Value* out) {
  const auto& text = node.Scalar();

  if (node.Tag() == "!") {
    out->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && end != nullptr && *end == '\0') {
    out->set_number_value(number);
    return;
  }

  out->set_string_value(text);
}

void ToProtoValue(const YAML::Node& node, google::protobuf::Value* out) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ScalarToProtoValue(node, out);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = out->mutable_list_value();
      for (const auto& item : node) {
        ToProtoValue(item, list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto& fields = *out->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ToProtoValue(entry.second, &fields[entry.first.Scalar()]);
      }
      return;
    }

    default:
      throw std::runtime_error("Unsupported YAML node in config");
  }
}

void Reject(const std::string& what) {
  throw std::runtime_error("Invalid configuration: " + what);
}

void Validate(const RuntimeConfig& config) {
  const auto& level = config.logging().level();
  if (!level.empty()) {
    bool known = false;
    for (auto name : kLogLevels) {
      known = known || name == level;
    }
    if (!known) Reject("logging.level '" + level + "' is not a log level");
  }

  const auto& ledger = config.ledger();
  if (!ledger.table_name().empty() && !db::sql::IsValidTableName(ledger.table_name())) {
    Reject("ledger.table_name '" + ledger.table_name() + "' is not a plain SQL identifier");
  }
  if (ledger.has_sqlite() && ledger.sqlite().path().empty()) {
    Reject("ledger.sqlite.path is required");
  }
  if (ledger.has_postgres() && ledger.postgres().connection_uri().empty()) {
    Reject("ledger.postgres.connection_uri is required");
  }

  if (config.lock().name().find('/') != std::string::npos) {
    Reject("lock.name '" + config.lock().name() + "' must not contain '/'");
  }
}

RuntimeConfig FromYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // empty document: everything defaulted
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    Reject("top level must be a mapping");
  }

  google::protobuf::Value root;
  ToProtoValue(yaml, &root);

  std::string json;
  auto        serialized = google::protobuf::util::MessageToJsonString(root, &json);
  if (!serialized.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(serialized.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    Reject(std::string(parsed.message()));
  }

  Validate(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }
  return FromYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node node;
  try {
    node = YAML::Load(yaml);
  } catch (const std::exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML config: ") + e.what());
  }
  return FromYaml(node);
}

} // namespace strata::config
