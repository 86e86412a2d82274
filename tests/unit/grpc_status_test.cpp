#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/continuity/work_unit_scheduler.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/work_unit_server.hpp"
#include "internal/registry/memory_source_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using callscribe::grpc::ThrowIfError;
using callscribe::grpc::ToStatus;
using callscribe::grpc::WorkUnitServer;

struct ServerFixture {
  std::shared_ptr<callscribe::continuity::WorkUnitScheduler>   scheduler = std::make_shared<callscribe::continuity::WorkUnitScheduler>();
  std::shared_ptr<callscribe::registry::MemorySourceRegistry> registry  = std::make_shared<callscribe::registry::MemorySourceRegistry>();
  WorkUnitServer                                               server{scheduler, registry};
};

template <typename E>
bool Throws(const ::grpc::Status& status) {
  try {
    ThrowIfError(status, "launch");
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestExceptionsMapToStatusCodes() {
  assert(ToStatus(callscribe::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(callscribe::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(callscribe::util::PolicyRejected("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(callscribe::util::ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(callscribe::util::TransientError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::invalid_argument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestClientStatusMapsBackToExceptions() {
  ThrowIfError(::grpc::Status::OK, "launch");
  assert(Throws<callscribe::util::TransientError>(::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "down")));
  assert(Throws<callscribe::util::TransientError>(::grpc::Status(::grpc::StatusCode::DEADLINE_EXCEEDED, "slow")));
  assert(Throws<callscribe::util::NotFound>(::grpc::Status(::grpc::StatusCode::NOT_FOUND, "gone")));
  assert(Throws<callscribe::util::PolicyRejected>(::grpc::Status(::grpc::StatusCode::PERMISSION_DENIED, "no")));
  assert(Throws<std::runtime_error>(::grpc::Status(::grpc::StatusCode::INTERNAL, "bug")));
}

void TestLaunchValidatesAndEnqueues() {
  ServerFixture fixture;

  callscribe::v1::WorkUnitDescriptor req;
  callscribe::v1::LaunchResponse     resp;
  ::grpc::ServerContext              grpc_ctx;

  assert(fixture.server.Launch(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_action(callscribe::v1::WORK_UNIT_ACTION_CONTINUE);
  req.mutable_session()->set_call_id("call-1");
  assert(fixture.server.Launch(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.mutable_session()->set_work_unit_sequence(2);
  assert(fixture.server.Launch(&grpc_ctx, &req, &resp).ok());
  assert(resp.accepted());
  assert(resp.queue_depth() == 1);
  assert(fixture.scheduler->Dequeue()->session().work_unit_sequence() == 2);

  fixture.scheduler->Shutdown();
  assert(fixture.server.Launch(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestRegisterSourceFillsRegistry() {
  ServerFixture fixture;

  callscribe::v1::SourceRegistration     req;
  callscribe::v1::RegisterSourceResponse resp;
  ::grpc::ServerContext                  grpc_ctx;

  req.set_call_id("call-1");
  req.set_source_id("stream-a");
  assert(fixture.server.RegisterSource(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_channel(callscribe::v1::CHANNEL_ROLE_CALLER);
  assert(fixture.server.RegisterSource(&grpc_ctx, &req, &resp).ok());
  req.set_channel(callscribe::v1::CHANNEL_ROLE_AGENT);
  req.set_source_id("stream-b");
  assert(fixture.server.RegisterSource(&grpc_ctx, &req, &resp).ok());

  const auto sources = fixture.registry->Query("call-1");
  assert(sources.Complete());
  assert(*sources.caller == "stream-a");
  assert(*sources.agent == "stream-b");
}

} // namespace

int main() {
  TestExceptionsMapToStatusCodes();
  TestClientStatusMapsBackToExceptions();
  TestLaunchValidatesAndEnqueues();
  TestRegisterSourceFillsRegistry();

  std::cout << "callscribe_unit_grpc_status: pass\n";
  return 0;
}
