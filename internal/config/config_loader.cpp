#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdlib>
#include <set>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace discovery::config {

using namespace std::chrono_literals;

namespace {

constexpr uint32_t kDefaultMaxRetries              = 3;
constexpr uint32_t kDefaultQueueCapacity           = 10000;
constexpr uint32_t kDefaultSubscriptionBuffer      = 4096;
constexpr double   kDefaultRenewalPercentThreshold = 0.85;

void SetIfUnset(google::protobuf::Duration* d, std::chrono::milliseconds value) {
  if (d->seconds() == 0 && d->nanos() == 0) {
    *d = discovery::util::ToProto(value);
  }
}

void RequirePositive(const google::protobuf::Duration& d, const char* field) {
  if (discovery::util::FromProto(d) <= std::chrono::milliseconds::zero()) {
    throw std::runtime_error(std::string("Invalid configuration: ") + field + " must be positive");
  }
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
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

discovery::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
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

  discovery::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(discovery::runtime::config::RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:8761");
  // peers must list this node under the same URL for self exclusion to work
  if (server->node_id().empty()) server->set_node_id(server->bind_address());

  auto* peers = config->mutable_peers();
  SetIfUnset(peers->mutable_reconcile_interval(), 10min);

  auto* replication = peers->mutable_replication();
  if (!replication->has_max_retries()) replication->set_max_retries(kDefaultMaxRetries);
  if (replication->queue_capacity() == 0) replication->set_queue_capacity(kDefaultQueueCapacity);
  SetIfUnset(replication->mutable_backoff(), 1s);
  SetIfUnset(replication->mutable_timeout(), 5s);

  auto* registry = config->mutable_registry();
  if (!registry->has_self_preservation_enabled()) registry->set_self_preservation_enabled(true);
  if (registry->renewal_percent_threshold() <= 0.0) registry->set_renewal_percent_threshold(kDefaultRenewalPercentThreshold);
  if (registry->subscription_buffer() == 0) registry->set_subscription_buffer(kDefaultSubscriptionBuffer);
  SetIfUnset(registry->mutable_expected_renewal_interval(), 30s);
  SetIfUnset(registry->mutable_eviction_interval(), 60s);
  SetIfUnset(registry->mutable_default_lease_duration(), 90s);

  SetIfUnset(config->mutable_interest_client()->mutable_retry_wait(), 500ms);
}

void ConfigLoader::Validate(const discovery::runtime::config::RuntimeConfig& config) {
  const auto& registry = config.registry();
  if (registry.renewal_percent_threshold() <= 0.0 || registry.renewal_percent_threshold() > 1.0) {
    throw std::runtime_error("Invalid configuration: registry.renewal_percent_threshold must be in (0, 1]");
  }
  RequirePositive(registry.expected_renewal_interval(), "registry.expected_renewal_interval");
  RequirePositive(registry.eviction_interval(), "registry.eviction_interval");
  RequirePositive(registry.default_lease_duration(), "registry.default_lease_duration");

  const auto& peers = config.peers();
  RequirePositive(peers.reconcile_interval(), "peers.reconcile_interval");
  RequirePositive(peers.replication().timeout(), "peers.replication.timeout");

  std::set<std::string> seen;
  for (const auto& url : peers.urls()) {
    if (url.empty()) {
      throw std::runtime_error("Invalid configuration: peers.urls contains an empty entry");
    }
    if (!seen.insert(url).second) {
      throw std::runtime_error("Invalid configuration: duplicate peer url " + url);
    }
  }
}

} // namespace discovery::config
