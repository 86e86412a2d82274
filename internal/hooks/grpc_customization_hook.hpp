#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>

#include "callscribe/v1/hook_service.grpc.pb.h"
#include "customization_hook.hpp"

namespace callscribe::hooks {

class GrpcCustomizationHook final : public CustomizationHook {
 public:
  GrpcCustomizationHook(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout);

  callscribe::v1::HookResponse OnCallStart(const callscribe::v1::CallSession& session) override;

 private:
  std::unique_ptr<callscribe::v1::CallHook::Stub> stub_;
  std::chrono::milliseconds                       timeout_;
};

} // namespace callscribe::hooks
