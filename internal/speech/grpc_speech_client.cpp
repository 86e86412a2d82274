#include "grpc_speech_client.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "internal/grpc/grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace callscribe::speech {

namespace pb = callscribe::speech::v1;

GrpcSpeechClient::GrpcSpeechClient(std::shared_ptr<::grpc::Channel> channel) : stub_(pb::StreamingRecognizer::NewStub(channel)) {
}

std::unique_ptr<RecognitionStream> GrpcSpeechClient::Start(const SessionConfig& config) {
  pb::RecognizeRequest start;
  *start.mutable_start()   = BuildStartSession(config);
  const auto configuration = BuildConfiguration(config);

  auto context = std::make_unique<::grpc::ClientContext>();
  auto stream  = stub_->Recognize(context.get());

  // The stream outlives the handshake, so the wait for SessionStarted is bounded
  // by cancelling the call rather than by an RPC deadline.
  std::mutex              mutex;
  std::condition_variable cv;
  bool                    settled   = false;
  bool                    timed_out = false;
  std::thread             watchdog([&, deadline = std::chrono::steady_clock::now() + config.start_timeout] {
    std::unique_lock lock(mutex);
    if (cv.wait_until(lock, deadline, [&] { return settled; })) return;
    timed_out = true;
    context->TryCancel();
  });

  bool ok = stream->Write(start);
  if (ok && configuration) {
    pb::RecognizeRequest request;
    *request.mutable_configuration() = *configuration;
    ok                               = stream->Write(request);
  }

  pb::RecognizeResponse first;
  if (ok) {
    ok = stream->Read(&first);
  }

  {
    std::lock_guard lock(mutex);
    settled = true;
  }
  cv.notify_all();
  watchdog.join();

  if (timed_out || !ok || first.response_case() != pb::RecognizeResponse::kSessionStarted) {
    context->TryCancel();
    auto status = stream->Finish();
    if (timed_out) {
      throw util::TransientError("start recognition session: no confirmation within " +
                                 std::to_string(config.start_timeout.count()) + " ms");
    }
    if (status.error_code() == ::grpc::StatusCode::CANCELLED) {
      throw util::TransientError("start recognition session: cancelled before confirmation");
    }
    callscribe::grpc::ThrowIfError(status, "start recognition session");
    // the service closed cleanly without confirming the session
    throw util::TransientError("start recognition session: no session confirmation");
  }

  return std::make_unique<GrpcRecognitionStream>(std::move(context), std::move(stream), first.session_started().session_id());
}

// ------------------------------------------------------------------
// GrpcRecognitionStream
// ------------------------------------------------------------------

GrpcRecognitionStream::GrpcRecognitionStream(std::unique_ptr<::grpc::ClientContext> context, std::unique_ptr<Stream> stream,
                                             std::string session_id)
    : context_(std::move(context)), stream_(std::move(stream)), session_id_(std::move(session_id)) {
}

GrpcRecognitionStream::~GrpcRecognitionStream() {
  if (!finished_) {
    context_->TryCancel();
    auto status = stream_->Finish();
    if (!status.ok() && status.error_code() != ::grpc::StatusCode::CANCELLED) {
      CALLSCRIBE_LOG_WARN("Recognition stream closed with error", {observability::StringField("session_id", session_id_),
                                                                    observability::StringField("error", status.error_message())});
    }
  }
}

bool GrpcRecognitionStream::WriteAudio(const std::string& pcm) {
  pb::RecognizeRequest request;
  request.mutable_audio()->set_audio(pcm);
  return stream_->Write(request);
}

void GrpcRecognitionStream::WritesDone() {
  if (writes_done_) return;
  writes_done_ = true;
  stream_->WritesDone();
}

bool GrpcRecognitionStream::Read(pb::RecognizeResponse* response) {
  return stream_->Read(response);
}

void GrpcRecognitionStream::Finish() {
  finished_   = true;
  auto status = stream_->Finish();
  callscribe::grpc::ThrowIfError(status, "recognition session");
}

} // namespace callscribe::speech
