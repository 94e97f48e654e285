#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdlib>

#include "internal/config/config_error.hpp"

namespace logship::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // "!" marks a quoted scalar: never reinterpret it
  if (node.Tag() == "!") {
    value->set_string_value(ExpandEnvironment(scalar_value));
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (!scalar_value.empty()) {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
  }

  value->set_string_value(ExpandEnvironment(scalar_value));
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
      throw ConfigError("Unsupported YAML node");
  }
}

std::string ExpandEnvironment(std::string_view value) {
  std::string input(value);

  if (!input.empty() && input[0] == '~' && (input.size() == 1 || input[1] == '/')) {
    if (const char* home = std::getenv("HOME")) {
      input = std::string(home) + input.substr(1);
    }
  }

  auto is_name_char = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; };

  std::string out;
  out.reserve(input.size());
  for (size_t i = 0; i < input.size();) {
    if (input[i] != '$' || i + 1 >= input.size()) {
      out.push_back(input[i++]);
      continue;
    }

    size_t      name_begin = i + 1;
    size_t      name_end   = name_begin;
    size_t      next       = name_begin;
    if (input[name_begin] == '{') {
      const auto close = input.find('}', name_begin);
      if (close == std::string::npos) {
        out.push_back(input[i++]);
        continue;
      }
      name_begin = name_begin + 1;
      name_end   = close;
      next       = close + 1;
    } else {
      while (name_end < input.size() && is_name_char(input[name_end])) {
        ++name_end;
      }
      next = name_end;
    }

    const std::string name = input.substr(name_begin, name_end - name_begin);
    const char*       env  = name.empty() ? nullptr : std::getenv(name.c_str());
    if (env) {
      out += env;
    } else {
      out += input.substr(i, next - i);
    }
    i = next;
  }
  return out;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

logship::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  if (!yaml.IsMap()) {
    throw ConfigError("Config file is empty or not a mapping: " + path);
  }

  // every yaml-cpp failure surfaces as a ConfigError
  google::protobuf::Value json_value;
  try {
    YamlToProtoValue(yaml, &json_value);
  } catch (const YAML::Exception& e) {
    throw ConfigError("Failed to read YAML config " + path + ": " + std::string(e.what()));
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  logship::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

} // namespace logship::config
