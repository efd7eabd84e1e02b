#include "grpc_error.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pulse::grpc {

namespace {

::grpc::StatusCode CodeFor(pulse::util::ErrorKind kind) {
  using pulse::util::ErrorKind;
  switch (kind) {
    case ErrorKind::kNotFound:
      return ::grpc::StatusCode::NOT_FOUND;
    case ErrorKind::kAlreadyExists:
      return ::grpc::StatusCode::ALREADY_EXISTS;
    // a rejected graph edit is a precondition on the stored graph, not a
    // malformed request
    case ErrorKind::kInvalidState:
    case ErrorKind::kInvalidGraph:
      return ::grpc::StatusCode::FAILED_PRECONDITION;
    case ErrorKind::kInvalidArgument:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
  }
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* domain = dynamic_cast<const pulse::util::Error*>(&e)) {
    return {CodeFor(domain->kind()), e.what()};
  }

  PULSE_LOG_ERROR("Internal error returned to client", {pulse::observability::StringField("error", e.what())});
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace pulse::grpc
