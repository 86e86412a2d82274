#include "grpc_launcher.hpp"

#include "internal/grpc/grpc_error.hpp"
#include "internal/util/errors.hpp"

namespace callscribe::continuity {

GrpcLauncher::GrpcLauncher(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout)
    : stub_(callscribe::v1::WorkUnitService::NewStub(channel)), timeout_(timeout) {
}

void GrpcLauncher::InvokeAsync(const callscribe::v1::WorkUnitDescriptor& descriptor) {
  ::grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + timeout_);

  callscribe::v1::LaunchResponse resp;
  callscribe::grpc::ThrowIfError(stub_->Launch(&context, descriptor, &resp), "launch work unit");
  if (!resp.accepted()) {
    throw util::ResourceExhausted("work unit service rejected the launch");
  }
}

} // namespace callscribe::continuity
