#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "callscribe/v1/work_unit_service.grpc.pb.h"
#include "internal/continuity/work_unit_scheduler.hpp"
#include "internal/registry/source_registry.hpp"

namespace callscribe::grpc {

class WorkUnitServer final : public callscribe::v1::WorkUnitService::Service {
 public:
  WorkUnitServer(std::shared_ptr<continuity::WorkUnitScheduler> scheduler, std::shared_ptr<registry::SourceRegistry> registry);

  ::grpc::Status Launch(::grpc::ServerContext*, const callscribe::v1::WorkUnitDescriptor* req,
                        callscribe::v1::LaunchResponse* resp) override;

  ::grpc::Status RegisterSource(::grpc::ServerContext*, const callscribe::v1::SourceRegistration* req,
                                callscribe::v1::RegisterSourceResponse* resp) override;

 private:
  std::shared_ptr<continuity::WorkUnitScheduler> scheduler_;
  std::shared_ptr<registry::SourceRegistry>      registry_;
};

} // namespace callscribe::grpc
