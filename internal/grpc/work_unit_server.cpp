#include "work_unit_server.hpp"

#include <stdexcept>

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace callscribe::grpc {

using observability::IntField;
using observability::StringField;

WorkUnitServer::WorkUnitServer(std::shared_ptr<continuity::WorkUnitScheduler> scheduler, std::shared_ptr<registry::SourceRegistry> registry)
    : scheduler_(std::move(scheduler)), registry_(std::move(registry)) {
}

::grpc::Status WorkUnitServer::Launch(::grpc::ServerContext*, const callscribe::v1::WorkUnitDescriptor* req,
                                      callscribe::v1::LaunchResponse* resp) {
  try {
    if (req->action() != callscribe::v1::WORK_UNIT_ACTION_START && req->action() != callscribe::v1::WORK_UNIT_ACTION_CONTINUE) {
      throw std::invalid_argument("action must be START or CONTINUE");
    }
    if (req->session().call_id().empty()) {
      throw std::invalid_argument("session.call_id is required");
    }
    if (req->action() == callscribe::v1::WORK_UNIT_ACTION_CONTINUE && req->session().work_unit_sequence() == 0) {
      throw std::invalid_argument("continuation requires session.work_unit_sequence");
    }
    if (!scheduler_->Enqueue(*req)) {
      throw util::InvalidState("work unit queue is shut down");
    }

    resp->set_accepted(true);
    resp->set_queue_depth(static_cast<uint32_t>(scheduler_->Depth()));
    CALLSCRIBE_LOG_INFO("Work unit accepted", {StringField("call_id", req->session().call_id()),
                                               IntField("sequence", req->session().work_unit_sequence()),
                                               IntField("queue_depth", resp->queue_depth())});
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkUnitServer::RegisterSource(::grpc::ServerContext*, const callscribe::v1::SourceRegistration* req,
                                              callscribe::v1::RegisterSourceResponse*) {
  try {
    if (req->call_id().empty() || req->source_id().empty()) {
      throw std::invalid_argument("call_id and source_id are required");
    }
    audio::Channel channel;
    switch (req->channel()) {
      case callscribe::v1::CHANNEL_ROLE_CALLER:
        channel = audio::Channel::kCaller;
        break;
      case callscribe::v1::CHANNEL_ROLE_AGENT:
        channel = audio::Channel::kAgent;
        break;
      default:
        throw std::invalid_argument("channel must be CALLER or AGENT");
    }
    registry_->Register(req->call_id(), channel, req->source_id());
    CALLSCRIBE_LOG_INFO("Channel source registered", {StringField("call_id", req->call_id()), StringField("channel", audio::ToString(channel)),
                                                      StringField("source_id", req->source_id())});
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace callscribe::grpc
