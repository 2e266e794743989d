#ifndef CROPFL_CROPFL_COMMON_ERRORS_H_
#define CROPFL_CROPFL_COMMON_ERRORS_H_

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "cropfl/proto/federation.pb.h"

namespace cropfl {

// Type url under which the ErrorKind of a status is stored as a payload.
inline constexpr absl::string_view kErrorKindTypeUrl =
    "type.googleapis.com/cropfl.ErrorKind";

// A partition would be empty. Fatal at worker startup.
absl::Status InsufficientDataError(absl::string_view message);

// The local trainer failed on its own shard. The worker is excluded from the
// current round only.
absl::Status LocalTrainingError(absl::string_view message);

// Parameter vectors of differing shapes met. Fatal for the run.
absl::Status ShapeMismatchError(absl::string_view message);

// A round gathered fewer than the minimum number of participants.
absl::Status QuorumTimeoutError(absl::string_view message);

// Round retries were exhausted and the run terminated early.
absl::Status RunAbortedError(absl::string_view message);

// Returns the kind attached to the status, or ERROR_KIND_UNSPECIFIED for
// statuses that carry none (e.g., transport failures).
ErrorKind GetErrorKind(const absl::Status &status);

inline bool IsErrorKind(const absl::Status &status, ErrorKind kind) {
  return !status.ok() && GetErrorKind(status) == kind;
}

Error ToProto(const absl::Status &status);

absl::Status FromProto(const Error &error);

}  // namespace cropfl

#endif  // CROPFL_CROPFL_COMMON_ERRORS_H_
