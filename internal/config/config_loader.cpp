#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace settleup::config {

namespace {

void ToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

// Plain scalars are typed by their spelling; quoted ones ("0.5") stay strings.
void ScalarToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();

  if (node.Tag() == "!") {
    value->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && end != nullptr && *end == '\0' && std::isfinite(number)) {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(text);
}

void ToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ScalarToProtoValue(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        ToProtoValue(item, list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto& fields = *value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ToProtoValue(entry.second, &fields[entry.first.Scalar()]);
      }
      return;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

settleup::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  settleup::runtime::config::RuntimeConfig config;

  // An empty file is a valid config made of defaults.
  if (!yaml.IsNull()) {
    if (!yaml.IsMap()) {
      throw std::runtime_error("Invalid configuration: top level must be a mapping");
    }

    google::protobuf::Value root;
    ToProtoValue(yaml, &root);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(root, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  if (config.ledger().settle_threshold() < 0.0) {
    throw std::runtime_error("Invalid configuration: ledger.settle_threshold must not be negative");
  }

  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(settleup::runtime::config::RuntimeConfig& config) {
  auto* ledger = config.mutable_ledger();
  if (ledger->default_description().empty()) {
    ledger->set_default_description("Expense");
  }
  if (ledger->settle_threshold() == 0.0) {
    ledger->set_settle_threshold(0.01);
  }

  auto* directory = config.mutable_directory();
  if (directory->fallback_prefix().empty()) {
    directory->set_fallback_prefix("User ");
  }
}

} // namespace settleup::config
