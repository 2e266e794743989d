#ifndef CROPFL_CROPFL_COMMON_PARAMS_UTILS_H_
#define CROPFL_CROPFL_COMMON_PARAMS_UTILS_H_

#include <google/protobuf/text_format.h>

#include <fstream>
#include <sstream>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "cropfl/common/macros.h"

namespace cropfl {

inline absl::Status ReadParseFile(std::string &file_content,
                                  const std::string &file_name) {
  std::ifstream _file;
  _file.open(file_name);

  std::stringstream buffer;
  if (_file.is_open()) {
    buffer << _file.rdbuf();
    file_content = buffer.str();
    return absl::OkStatus();
  }
  return absl::NotFoundError(absl::StrCat("Cannot open file ", file_name));
}

// Parses a text-format proto message from `file_name` on top of `defaults`,
// i.e., fields absent from the file keep their default value.
template <typename T>
absl::StatusOr<T> LoadParamsFromFile(const std::string &file_name,
                                     const T &defaults) {
  std::string content;
  RETURN_IF_ERROR(ReadParseFile(content, file_name));

  T params = defaults;
  if (!google::protobuf::TextFormat::MergeFromString(content, &params)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Malformed parameters file ", file_name));
  }
  return params;
}

}  // namespace cropfl

#endif  // CROPFL_CROPFL_COMMON_PARAMS_UTILS_H_
