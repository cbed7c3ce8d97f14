#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace settle::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace settle::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (const auto* conflict = dynamic_cast<const Conflict*>(&e)) {
    return {conflict->Busy() ? ::grpc::StatusCode::UNAVAILABLE : ::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const ConsistencyError*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace settle::grpc
