#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace callscribe::config {

using callscribe::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("0001" fragment numbers, phone numbers)
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

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

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
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address("0.0.0.0:50061");
  }

  auto* media = config.mutable_media();
  if (media->fragment_tag_name().empty()) {
    media->set_fragment_tag_name("AWS_KINESISVIDEO_FRAGMENT_NUMBER");
  }
  if (media->read_chunk_bytes() == 0) media->set_read_chunk_bytes(64 * 1024);
  if (media->poll_interval_ms() == 0) media->set_poll_interval_ms(200);
  if (media->inactivity_timeout_ms() == 0) media->set_inactivity_timeout_ms(5 * 60 * 1000);
  if (media->max_element_bytes() == 0) media->set_max_element_bytes(4 * 1024 * 1024);
  if (media->track_roles().empty()) {
    (*media->mutable_track_roles())["AUDIO_FROM_CUSTOMER"] = "caller";
    (*media->mutable_track_roles())["AUDIO_TO_CUSTOMER"]   = "agent";
  }

  auto* audio = config.mutable_audio();
  if (audio->sample_rate_hz() == 0) audio->set_sample_rate_hz(8000);
  if (audio->interleave_period_ms() == 0) audio->set_interleave_period_ms(100);
  if (audio->channel_buffer_capacity() == 0) audio->set_channel_buffer_capacity(256);
  if (audio->audio_pipe_capacity() == 0) audio->set_audio_pipe_capacity(64);
  if (audio->pipe_push_timeout_ms() == 0) audio->set_pipe_push_timeout_ms(500);
  if (audio->keep_alive_interval_ms() == 0) audio->set_keep_alive_interval_ms(10000);
  if (audio->max_gap_ms() == 0) audio->set_max_gap_ms(5000);

  auto* speech = config.mutable_speech();
  if (speech->language_code().empty()) speech->set_language_code("en-US");
  if (speech->start_attempts() == 0) speech->set_start_attempts(3);
  if (speech->start_backoff_ms() == 0) speech->set_start_backoff_ms(1000);
  if (speech->start_timeout_ms() == 0) speech->set_start_timeout_ms(10000);
  if (speech->content_redaction().type().empty()) {
    speech->mutable_content_redaction()->set_type("PII");
  }

  auto* events = config.mutable_events();
  if (events->backend_case() == callscribe::runtime::config::EventsConfig::BACKEND_NOT_SET) {
    events->set_memory(true);
  }

  auto* registry = config.mutable_registry();
  if (registry->backend_case() == callscribe::runtime::config::RegistryConfig::BACKEND_NOT_SET) {
    registry->set_memory(true);
  }
  if (registry->lookup_attempts() == 0) registry->set_lookup_attempts(100);
  if (registry->lookup_backoff_ms() == 0) registry->set_lookup_backoff_ms(100);

  auto* recording = config.mutable_recording();
  if (recording->raw_prefix().empty()) recording->set_raw_prefix("raw/");
  if (recording->recording_prefix().empty()) recording->set_recording_prefix("recordings/");
  if (recording->temp_path().empty()) recording->set_temp_path("/tmp/");

  auto* work_unit = config.mutable_work_unit();
  if (work_unit->time_budget_ms() == 0) work_unit->set_time_budget_ms(900000);
  if (work_unit->safety_margin_ms() == 0) work_unit->set_safety_margin_ms(180000);
  if (work_unit->max_work_units() == 0) work_unit->set_max_work_units(30);
  if (work_unit->worker_threads() == 0) work_unit->set_worker_threads(4);

  auto* hook = config.mutable_hook();
  if (hook->timeout_ms() == 0) hook->set_timeout_ms(5000);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.media().root_uri().empty()) {
    throw std::invalid_argument("media.root_uri is required");
  }
  if (config.recording().root_uri().empty()) {
    throw std::invalid_argument("recording.root_uri is required");
  }
  if (config.audio().interleave_period_ms() * static_cast<uint64_t>(config.audio().sample_rate_hz()) % 1000 != 0) {
    throw std::invalid_argument("audio.interleave_period_ms must cover a whole number of samples");
  }
  if (config.work_unit().safety_margin_ms() >= config.work_unit().time_budget_ms()) {
    throw std::invalid_argument("work_unit.safety_margin_ms must be smaller than work_unit.time_budget_ms");
  }
  for (const auto& [track, role] : config.media().track_roles()) {
    if (role != "caller" && role != "agent") {
      throw std::invalid_argument("media.track_roles[" + track + "] must be caller or agent");
    }
  }
  if (config.speech().target().empty()) {
    throw std::invalid_argument("speech.target is required");
  }
}

} // namespace callscribe::config
