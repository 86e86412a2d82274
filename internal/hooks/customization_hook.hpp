#pragma once

#include "callscribe/v1/call.pb.h"
#include "callscribe/v1/hook_service.pb.h"

namespace callscribe::hooks {

/*
  Optional customer hook consulted once, before a call's first work unit
  reads any audio. It may rename the call, swap the channel roles, attach
  participant identifiers, or veto processing altogether.
*/
class CustomizationHook {
 public:
  virtual ~CustomizationHook() = default;

  // Throws when the hook cannot be reached or fails.
  virtual callscribe::v1::HookResponse OnCallStart(const callscribe::v1::CallSession& session) = 0;
};

struct HookDecision {
  bool should_process = true;
  bool swapped_roles  = false;
};

/*
  Applies a hook response to the session. A role swap exchanges the source
  bindings (and their resume markers), so it only ever happens before any
  channel data is read.
*/
HookDecision ApplyHookResponse(const callscribe::v1::HookResponse& response, callscribe::v1::CallSession* session);

} // namespace callscribe::hooks
