#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>

namespace shardfeed::config {

namespace {

// consumer keys holding google.protobuf.Duration values
constexpr std::array<std::string_view, 4> kDurationKeys = {
    "idle_time_between_reads",
    "lease_refresh_period",
    "lease_duration",
    "parent_shard_poll_interval",
};

bool IsDurationKey(std::string_view key) {
  for (auto candidate : kDurationKeys) {
    if (candidate == key) return true;
  }
  return false;
}

/*
  Protobuf JSON only understands seconds ("1.5s"). Config files may also
  use "250ms", "2m" or "1h"; anything else passes through untouched and is
  rejected later by the JSON parser.
*/
std::string NormalizeDuration(const std::string& text) {
  static const std::regex kPattern(R"(^(-?[0-9]+(?:\.[0-9]+)?)(ms|m|h)$)");

  std::smatch match;
  if (!std::regex_match(text, match, kPattern)) {
    return text;
  }

  const double amount = std::strtod(match[1].str().c_str(), nullptr);
  double       seconds = amount;
  if (match[2] == "ms") {
    seconds = amount / 1000.0;
  } else if (match[2] == "m") {
    seconds = amount * 60.0;
  } else {
    seconds = amount * 3600.0;
  }

  // nanosecond precision is all a Duration holds
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.9fs", seconds);
  return buffer;
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars are always strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = std::strtod(scalar_value.c_str(), &endptr);
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
      for (const auto& item : node) {
        YamlToProtoValue(item, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

void NormalizeConsumerDurations(google::protobuf::Value* root) {
  auto* top = root->mutable_struct_value()->mutable_fields();
  auto  it  = top->find("consumer");
  if (it == top->end() || !it->second.has_struct_value()) {
    return;
  }

  for (auto& [key, field] : *it->second.mutable_struct_value()->mutable_fields()) {
    if (IsDurationKey(key) && field.kind_case() == google::protobuf::Value::kStringValue) {
      field.set_string_value(NormalizeDuration(field.string_value()));
    }
  }
}

// Fleet deployments share one file and set identity per process.
void ApplyEnvironmentOverrides(shardfeed::runtime::config::RuntimeConfig* config) {
  if (const char* worker_id = std::getenv("SHARDFEED_WORKER_ID")) {
    config->mutable_consumer()->set_worker_id(worker_id);
  }
  if (const char* stream_name = std::getenv("SHARDFEED_STREAM_NAME")) {
    config->mutable_consumer()->set_stream_name(stream_name);
  }
}

shardfeed::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  shardfeed::runtime::config::RuntimeConfig config;
  if (yaml.IsNull()) {
    ApplyEnvironmentOverrides(&config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top-level YAML node must be a map");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);
  NormalizeConsumerDurations(&json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyEnvironmentOverrides(&config);
  return config;
}

} // namespace

shardfeed::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + std::string(e.what()));
  }

  return FromYamlNode(yaml);
}

shardfeed::runtime::config::RuntimeConfig ConfigLoader::ParseYaml(const std::string& content) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(content);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return FromYamlNode(yaml);
}

} // namespace shardfeed::config
