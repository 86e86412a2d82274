#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>

#include "callscribe/v1/work_unit_service.grpc.pb.h"
#include "launcher.hpp"

namespace callscribe::continuity {

// Hands work units to a (possibly remote, possibly this) WorkUnitService.
class GrpcLauncher final : public WorkUnitLauncher {
 public:
  GrpcLauncher(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout);

  void InvokeAsync(const callscribe::v1::WorkUnitDescriptor& descriptor) override;

 private:
  std::unique_ptr<callscribe::v1::WorkUnitService::Stub> stub_;
  std::chrono::milliseconds                              timeout_;
};

} // namespace callscribe::continuity
