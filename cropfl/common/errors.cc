#include "cropfl/common/errors.h"

#include <string>

#include "absl/strings/cord.h"

namespace cropfl {
namespace {

absl::StatusCode CodeForKind(ErrorKind kind) {
  switch (kind) {
    case INSUFFICIENT_DATA:
      return absl::StatusCode::kFailedPrecondition;
    case LOCAL_TRAINING:
      return absl::StatusCode::kInternal;
    case SHAPE_MISMATCH:
      return absl::StatusCode::kInvalidArgument;
    case QUORUM_TIMEOUT:
      return absl::StatusCode::kDeadlineExceeded;
    case RUN_ABORTED:
      return absl::StatusCode::kAborted;
    default:
      return absl::StatusCode::kUnknown;
  }
}

absl::Status MakeError(ErrorKind kind, absl::string_view message) {
  absl::Status status(CodeForKind(kind), message);
  status.SetPayload(kErrorKindTypeUrl, absl::Cord(ErrorKind_Name(kind)));
  return status;
}

}  // namespace

absl::Status InsufficientDataError(absl::string_view message) {
  return MakeError(INSUFFICIENT_DATA, message);
}

absl::Status LocalTrainingError(absl::string_view message) {
  return MakeError(LOCAL_TRAINING, message);
}

absl::Status ShapeMismatchError(absl::string_view message) {
  return MakeError(SHAPE_MISMATCH, message);
}

absl::Status QuorumTimeoutError(absl::string_view message) {
  return MakeError(QUORUM_TIMEOUT, message);
}

absl::Status RunAbortedError(absl::string_view message) {
  return MakeError(RUN_ABORTED, message);
}

ErrorKind GetErrorKind(const absl::Status &status) {
  auto payload = status.GetPayload(kErrorKindTypeUrl);
  if (!payload.has_value()) return ERROR_KIND_UNSPECIFIED;

  ErrorKind kind;
  if (!ErrorKind_Parse(std::string(*payload), &kind))
    return ERROR_KIND_UNSPECIFIED;
  return kind;
}

Error ToProto(const absl::Status &status) {
  Error error;
  error.set_kind(GetErrorKind(status));
  error.set_message(std::string(status.message()));
  return error;
}

absl::Status FromProto(const Error &error) {
  if (error.kind() == ERROR_KIND_UNSPECIFIED)
    return absl::UnknownError(error.message());
  return MakeError(error.kind(), error.message());
}

}  // namespace cropfl
