#include "speech_client.hpp"

namespace callscribe::speech {

namespace pb = callscribe::speech::v1;

pb::StartSession BuildStartSession(const SessionConfig& config) {
  pb::StartSession start;
  start.set_sample_rate_hz(config.sample_rate_hz);
  start.set_encoding("pcm_s16le");
  start.set_channel_count(config.channel_count);
  start.set_enable_channel_identification(!config.analytics);
  start.set_session_id(config.resume_session_id);
  start.set_analytics(config.analytics);

  if (config.identify_language) {
    start.set_identify_language(true);
    start.set_language_options(config.language_options);
    start.set_preferred_language(config.preferred_language);
  } else {
    start.set_language_code(config.language_code);
  }

  start.set_content_redaction_type(config.content_redaction_type);
  if (!config.content_redaction_type.empty()) {
    start.set_pii_entity_types(config.pii_entity_types);
  }
  start.set_vocabulary_name(config.vocabulary_name);
  start.set_language_model_name(config.language_model_name);
  return start;
}

std::optional<pb::Configuration> BuildConfiguration(const SessionConfig& config) {
  if (!config.analytics) {
    return std::nullopt;
  }

  pb::Configuration configuration;
  auto*             customer = configuration.add_channel_definitions();
  customer->set_channel_id(0);
  customer->set_participant_role("CUSTOMER");
  auto* agent = configuration.add_channel_definitions();
  agent->set_channel_id(1);
  agent->set_participant_role("AGENT");

  if (config.post_call_analytics) {
    auto* post_call = configuration.mutable_post_call_analytics();
    post_call->set_output_location(config.post_call_output_location);
    post_call->set_data_access_role(config.post_call_data_access_role);
    if (!config.content_redaction_type.empty()) {
      post_call->set_content_redaction_output(config.post_call_redaction_output);
    }
  }
  return configuration;
}

} // namespace callscribe::speech
