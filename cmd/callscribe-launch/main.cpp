#include <grpcpp/grpcpp.h>

#include <iostream>
#include <string>

#include "callscribe/v1/work_unit_service.grpc.pb.h"

using namespace callscribe::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  callscribe-launch <addr> register <call_id> <caller|agent> <source_id>\n"
            << "  callscribe-launch <addr> start <call_id> [caller_source] [agent_source] [--no-record]\n";
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr    = argv[1];
  std::string cmd     = argv[2];
  std::string call_id = argv[3];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = WorkUnitService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "register") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    std::string role = argv[4];
    if (role != "caller" && role != "agent") {
      std::cerr << "unsupported channel: " << role << "\n";
      return 1;
    }

    SourceRegistration req;
    req.set_call_id(call_id);
    req.set_channel(role == "caller" ? CHANNEL_ROLE_CALLER : CHANNEL_ROLE_AGENT);
    req.set_source_id(argv[5]);

    RegisterSourceResponse resp;

    auto status = stub->RegisterSource(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "registered\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "start") {
    WorkUnitDescriptor req;
    req.set_action(WORK_UNIT_ACTION_START);

    auto* session = req.mutable_session();
    session->set_call_id(call_id);

    int positional = 0;
    for (int i = 4; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--no-record") {
        session->mutable_should_record()->set_value(false);
      } else if (positional == 0) {
        session->set_caller_source_id(arg);
        ++positional;
      } else if (positional == 1) {
        session->set_agent_source_id(arg);
        ++positional;
      } else {
        Usage();
        return 1;
      }
    }

    LaunchResponse resp;

    auto status = stub->Launch(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "accepted=" << (resp.accepted() ? "true" : "false") << " queue_depth=" << resp.queue_depth() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
