#ifndef CROPFL_CROPFL_COMMON_GRPC_STATUS_H_
#define CROPFL_CROPFL_COMMON_GRPC_STATUS_H_

#include <grpcpp/support/status.h>

#include <string>

#include "absl/status/status.h"

namespace cropfl {

// gRPC and absl share the canonical code numbering, so codes carry over
// unchanged. Error kind payloads do not cross the transport.
inline grpc::Status ToGrpcStatus(const absl::Status &status) {
  if (status.ok()) return grpc::Status::OK;
  return {static_cast<grpc::StatusCode>(status.code()),
          std::string(status.message())};
}

inline absl::Status FromGrpcStatus(const grpc::Status &status) {
  if (status.ok()) return absl::OkStatus();
  return {static_cast<absl::StatusCode>(status.error_code()),
          status.error_message()};
}

}  // namespace cropfl

#endif  // CROPFL_CROPFL_COMMON_GRPC_STATUS_H_
