#include "grpc_customization_hook.hpp"

#include "internal/grpc/grpc_error.hpp"

namespace callscribe::hooks {

GrpcCustomizationHook::GrpcCustomizationHook(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout)
    : stub_(callscribe::v1::CallHook::NewStub(channel)), timeout_(timeout) {
}

callscribe::v1::HookResponse GrpcCustomizationHook::OnCallStart(const callscribe::v1::CallSession& session) {
  ::grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + timeout_);

  callscribe::v1::HookRequest req;
  *req.mutable_session() = session;

  callscribe::v1::HookResponse resp;
  callscribe::grpc::ThrowIfError(stub_->OnCallStart(&context, req, &resp), "customization hook");
  return resp;
}

} // namespace callscribe::hooks
