#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

#include "callscribe/speech/v1/recognizer.grpc.pb.h"
#include "speech_client.hpp"

namespace callscribe::speech {

/*
  SpeechClient over the StreamingRecognizer gRPC service.
*/
class GrpcSpeechClient final : public SpeechClient {
 public:
  explicit GrpcSpeechClient(std::shared_ptr<::grpc::Channel> channel);

  std::unique_ptr<RecognitionStream> Start(const SessionConfig& config) override;

 private:
  std::unique_ptr<callscribe::speech::v1::StreamingRecognizer::Stub> stub_;
};

class GrpcRecognitionStream final : public RecognitionStream {
 public:
  using Stream = ::grpc::ClientReaderWriter<callscribe::speech::v1::RecognizeRequest, callscribe::speech::v1::RecognizeResponse>;

  GrpcRecognitionStream(std::unique_ptr<::grpc::ClientContext> context, std::unique_ptr<Stream> stream, std::string session_id);
  ~GrpcRecognitionStream() override;

  const std::string& SessionId() const override {
    return session_id_;
  }

  bool WriteAudio(const std::string& pcm) override;
  void WritesDone() override;
  bool Read(callscribe::speech::v1::RecognizeResponse* response) override;
  void Finish() override;

 private:
  std::unique_ptr<::grpc::ClientContext> context_;
  std::unique_ptr<Stream>                stream_;
  std::string                            session_id_;
  bool                                   writes_done_ = false;
  bool                                   finished_    = false;
};

} // namespace callscribe::speech
