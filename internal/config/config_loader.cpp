#include "internal/config/config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

namespace blueshare::config {

using blueshare::runtime::config::RuntimeConfig;

namespace {

constexpr std::array<std::string_view, 10> kLogLevels = {"",     "trace", "debug", "info",     "warn",
                                                         "warning", "err", "error", "critical", "off"};

void ToValue(const YAML::Node& node, google::protobuf::Value* out);

void ScalarToValue(const YAML::Node& node, google::protobuf::Value* out) {
  const std::string& text = node.Scalar();

  // quoted scalars stay strings ("007" must not become 7)
  if (node.Tag() == "!") {
    out->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
    return;
  }

  // strtod also accepts nan/inf spellings; those stay text so ids and names survive.
  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && end != nullptr && *end == '\0' && std::isfinite(number)) {
    out->set_number_value(number);
    return;
  }

  out->set_string_value(text);
}

void ToValue(const YAML::Node& node, google::protobuf::Value* out) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      out->set_null_value(google::protobuf::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      ScalarToValue(node, out);
      break;

    case YAML::NodeType::Sequence: {
      auto* list = out->mutable_list_value();
      for (const auto& item : node) {
        ToValue(item, list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto& fields = *out->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ToValue(entry.second, &fields[entry.first.Scalar()]);
      }
      break;
    }
  }
}

// Checks that the schema cannot express.
void Validate(const RuntimeConfig& config) {
  const auto& level = config.logging().level();
  bool        known = false;
  for (const auto candidate : kLogLevels) {
    known = known || candidate == level;
  }
  if (!known) {
    throw std::runtime_error("Invalid configuration: unknown logging.level '" + level + "'");
  }
}

RuntimeConfig Parse(const YAML::Node& root) {
  google::protobuf::Value value;
  ToValue(root, &value);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config '" + path + "': " + e.what());
  }
  return Parse(root);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML config: ") + e.what());
  }
  return Parse(root);
}

} // namespace blueshare::config
