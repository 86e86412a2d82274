#include "customization_hook.hpp"

#include <utility>

namespace callscribe::hooks {

HookDecision ApplyHookResponse(const callscribe::v1::HookResponse& response, callscribe::v1::CallSession* session) {
  HookDecision decision;

  if (!response.call_id().empty() && response.call_id() != session->call_id()) {
    if (session->original_call_id().empty()) session->set_original_call_id(session->call_id());
    session->set_call_id(response.call_id());
  }
  if (!response.agent_id().empty()) session->set_agent_id(response.agent_id());
  if (!response.from_number().empty()) session->set_from_number(response.from_number());
  if (!response.to_number().empty()) session->set_to_number(response.to_number());
  if (!response.metadata_json().empty()) session->set_metadata_json(response.metadata_json());

  if (response.has_should_record()) *session->mutable_should_record() = response.should_record();
  if (response.has_should_process()) decision.should_process = response.should_process().value();

  // is_caller=false: the stream registered as the caller is really the agent
  if (response.has_is_caller() && !response.is_caller().value()) {
    std::string caller = session->caller_source_id();
    session->set_caller_source_id(session->agent_source_id());
    session->set_agent_source_id(std::move(caller));

    std::string caller_fragment = session->last_caller_fragment();
    session->set_last_caller_fragment(session->last_agent_fragment());
    session->set_last_agent_fragment(std::move(caller_fragment));
    decision.swapped_roles = true;
  }

  return decision;
}

} // namespace callscribe::hooks
