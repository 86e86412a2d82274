#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace callscribe::grpc {

/*
  Converts internal exceptions into gRPC status codes (server side), and
  failed client calls back into internal exceptions (client side).
*/

::grpc::Status ToStatus(const std::exception& e);

// Throws TransientError for retryable codes, std::runtime_error otherwise.
void ThrowIfError(const ::grpc::Status& status, const char* what);

} // namespace callscribe::grpc
