#include "internal/speech/grpc_speech_client.hpp"

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/runtime/server.hpp"
#include "internal/speech/session_driver.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace pb = callscribe::speech::v1;

using callscribe::speech::GrpcSpeechClient;
using callscribe::speech::RecognitionEvent;
using callscribe::speech::SessionConfig;
using callscribe::speech::SessionDriver;
using callscribe::speech::SessionDriverOptions;
using std::chrono::milliseconds;

// Accepts the call and reads requests without ever confirming the session.
class SilentRecognizer final : public pb::StreamingRecognizer::Service {
 public:
  ::grpc::Status Recognize(::grpc::ServerContext*, ::grpc::ServerReaderWriter<pb::RecognizeResponse, pb::RecognizeRequest>* stream) override {
    ++calls;
    pb::RecognizeRequest request;
    while (stream->Read(&request)) {
    }
    return ::grpc::Status::OK;
  }

  std::atomic<int> calls{0};
};

class ConfirmingRecognizer final : public pb::StreamingRecognizer::Service {
 public:
  ::grpc::Status Recognize(::grpc::ServerContext*, ::grpc::ServerReaderWriter<pb::RecognizeResponse, pb::RecognizeRequest>* stream) override {
    pb::RecognizeRequest request;
    if (!stream->Read(&request) || !request.has_start()) {
      return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, "start request expected first");
    }

    pb::RecognizeResponse started;
    started.mutable_session_started()->set_session_id("srv-1");
    stream->Write(started);

    while (stream->Read(&request)) {
      if (request.has_audio()) ++packets;
    }
    return ::grpc::Status::OK;
  }

  std::atomic<int> packets{0};
};

struct LocalRecognizer {
  explicit LocalRecognizer(std::unique_ptr<::grpc::Service> service) {
    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::move(service));
    server = std::make_unique<callscribe::runtime::Server>("127.0.0.1:0", std::move(services));
    server->Start();
    channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server->SelectedPort()), ::grpc::InsecureChannelCredentials());
  }

  std::unique_ptr<callscribe::runtime::Server> server;
  std::shared_ptr<::grpc::Channel>             channel;
};

void TestUnconfirmedStartTimesOut() {
  auto  service = std::make_unique<SilentRecognizer>();
  auto* silent  = service.get();

  LocalRecognizer  recognizer(std::move(service));
  GrpcSpeechClient client(recognizer.channel);

  SessionConfig config;
  config.start_timeout = milliseconds(200);

  const auto started = std::chrono::steady_clock::now();
  bool       threw   = false;
  try {
    client.Start(config);
  } catch (const callscribe::util::TransientError& e) {
    threw = std::string(e.what()).find("200 ms") != std::string::npos;
  }
  const auto elapsed = std::chrono::steady_clock::now() - started;
  assert(threw);
  assert(elapsed >= milliseconds(200));
  assert(elapsed < std::chrono::seconds(5));

  // a timed-out handshake is transient, so the driver spends every attempt on it
  SessionDriverOptions options;
  options.start_attempts        = 2;
  options.start_backoff         = milliseconds(1);
  options.session.start_timeout = milliseconds(100);
  SessionDriver driver(std::make_shared<GrpcSpeechClient>(recognizer.channel), options, [](const RecognitionEvent&) {});

  threw = false;
  try {
    driver.Start();
  } catch (const callscribe::util::TransientError&) {
    threw = true;
  }
  assert(threw);

  recognizer.server->Stop();
  assert(silent->calls == 3);
}

void TestConfirmedStartStreams() {
  auto  service    = std::make_unique<ConfirmingRecognizer>();
  auto* confirming = service.get();

  LocalRecognizer  recognizer(std::move(service));
  GrpcSpeechClient client(recognizer.channel);

  SessionConfig config;
  config.start_timeout = milliseconds(2000);
  auto stream          = client.Start(config);
  assert(stream->SessionId() == "srv-1");

  assert(stream->WriteAudio(std::string(320, '\0')));
  assert(stream->WriteAudio(std::string(320, '\0')));
  stream->WritesDone();

  pb::RecognizeResponse response;
  assert(!stream->Read(&response));
  stream->Finish();
  stream.reset();

  recognizer.server->Stop();
  assert(confirming->packets == 2);
}

} // namespace

int main() {
  TestUnconfirmedStartTimesOut();
  TestConfirmedStartStreams();

  std::cout << "callscribe_unit_grpc_speech_client: pass\n";
  return 0;
}
