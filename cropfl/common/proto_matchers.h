#ifndef CROPFL_CROPFL_COMMON_PROTO_MATCHERS_H_
#define CROPFL_CROPFL_COMMON_PROTO_MATCHERS_H_

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <google/protobuf/util/message_differencer.h>

#include <cmath>
#include <cstring>
#include <vector>

namespace testing::proto {
using ::google::protobuf::util::MessageDifferencer;

MATCHER_P(EqualsProto, expected, "EqualsProto") {
  return MessageDifferencer::Equals(arg, expected);
}

// Compares the deserialized values of a cropfl::Tensor against `expected`.
MATCHER_P(TensorValuesNear, expected, "TensorValuesNear") {
  if (arg.length() != expected.size()) return false;
  std::vector<double> values(arg.length());
  if (!values.empty())
    std::memcpy(values.data(), arg.value().data(),
                values.size() * sizeof(double));
  for (size_t i = 0; i < values.size(); ++i) {
    if (std::abs(values[i] - expected[i]) > 1e-9) {
      *result_listener << "value " << i << " is " << values[i];
      return false;
    }
  }
  return true;
}

}  // namespace testing::proto

#endif  // CROPFL_CROPFL_COMMON_PROTO_MATCHERS_H_
