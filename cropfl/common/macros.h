#ifndef CROPFL_CROPFL_COMMON_MACROS_H_
#define CROPFL_CROPFL_COMMON_MACROS_H_

#include <stdexcept>
#include <string>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

#define VALIDATE(value)                                            \
  do {                                                             \
    if (value == false) {                                          \
      throw std::runtime_error("Unable to load proto from text."); \
    }                                                              \
  } while (0)

// Run a command that returns a util::Status.  If the called code returns an
// error status, return that status up out of this method too.
//
// Example:
//   RETURN_IF_ERROR(DoThings(4));
#define RETURN_IF_ERROR(expr)                                                \
  do {                                                                       \
    /* Using _status below to avoid capture problems if expr is "status". */ \
    ::absl::Status _status = (expr);                                         \
    if (ABSL_PREDICT_FALSE(!_status.ok())) return _status;                   \
  } while (0)

#define CROPFL_STATUS_MACROS_CONCAT_INNER(x, y) x##y
#define CROPFL_STATUS_MACROS_CONCAT(x, y) CROPFL_STATUS_MACROS_CONCAT_INNER(x, y)

#define CROPFL_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                 \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                \
    return statusor.status();                              \
  }                                                        \
  lhs = std::move(statusor).value()

// Executes an expression that returns an absl::StatusOr<T>. On success the
// value is moved into `lhs`, otherwise the error status is returned.
//
// Example:
//   ASSIGN_OR_RETURN(auto partition, CreatePartition(dataset, 0, 2, 0.8));
#define ASSIGN_OR_RETURN(lhs, rexpr) \
  CROPFL_ASSIGN_OR_RETURN_IMPL(      \
      CROPFL_STATUS_MACROS_CONCAT(_status_or_value, __LINE__), lhs, rexpr)

#endif  // CROPFL_CROPFL_COMMON_MACROS_H_
