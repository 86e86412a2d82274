#include "grpc_error.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace callscribe::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace callscribe::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const PolicyRejected*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const TransientError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

void ThrowIfError(const ::grpc::Status& status, const char* what) {
  if (status.ok()) {
    return;
  }
  std::string message = std::string(what) + ": " + status.error_message();
  switch (status.error_code()) {
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
    case ::grpc::StatusCode::ABORTED:
      throw callscribe::util::TransientError(message);
    case ::grpc::StatusCode::NOT_FOUND:
      throw callscribe::util::NotFound(message);
    case ::grpc::StatusCode::PERMISSION_DENIED:
      throw callscribe::util::PolicyRejected(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace callscribe::grpc
