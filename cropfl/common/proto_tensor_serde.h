#ifndef CROPFL_CROPFL_COMMON_PROTO_TENSOR_SERDE_H_
#define CROPFL_CROPFL_COMMON_PROTO_TENSOR_SERDE_H_

#include <google/protobuf/text_format.h>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "cropfl/common/macros.h"
#include "cropfl/proto/model.pb.h"

namespace cropfl {
namespace proto {

class TensorOps {
 public:
  static std::vector<double> DeserializeTensor(const cropfl::Tensor &tensor) {
    const auto tensor_elements_num = tensor.length();
    std::vector<double> deserialized_tensor(tensor_elements_num);
    if (tensor_elements_num == 0 ||
        tensor.value().size() < tensor_elements_num * sizeof(double))
      return deserialized_tensor;
    std::memcpy(deserialized_tensor.data(), tensor.value().data(),
                tensor_elements_num * sizeof(double));
    return deserialized_tensor;
  }

  static std::vector<char> SerializeTensor(const std::vector<double> &v) {
    auto num_elements = v.size();
    std::vector<char> serialized_tensor(num_elements * sizeof(double));
    if (num_elements > 0)
      std::memcpy(serialized_tensor.data(), v.data(),
                  num_elements * sizeof(double));
    return serialized_tensor;
  }

  // Builds a tensor holding the given values. When no dimensions are given
  // the tensor is one-dimensional.
  static cropfl::Tensor MakeTensor(const std::vector<double> &values,
                                   const std::vector<int64_t> &dimensions = {}) {
    cropfl::Tensor tensor;
    tensor.set_length(values.size());
    if (dimensions.empty()) {
      tensor.add_dimensions(static_cast<int64_t>(values.size()));
    } else {
      for (auto dim : dimensions) tensor.add_dimensions(dim);
    }
    auto serialized_tensor = SerializeTensor(values);
    tensor.set_value(
        std::string(serialized_tensor.begin(), serialized_tensor.end()));
    return tensor;
  }

  static void SetTensorValues(cropfl::Tensor *tensor,
                              const std::vector<double> &values) {
    auto serialized_tensor = SerializeTensor(values);
    tensor->set_length(values.size());
    tensor->set_value(
        std::string(serialized_tensor.begin(), serialized_tensor.end()));
  }

  // True when both vectors hold the same number of tensors with equal
  // lengths and dimensions.
  static bool SameShape(const cropfl::ParameterVector &left,
                        const cropfl::ParameterVector &right) {
    if (left.tensors_size() != right.tensors_size()) return false;
    for (int i = 0; i < left.tensors_size(); ++i) {
      const auto &l = left.tensors(i);
      const auto &r = right.tensors(i);
      if (l.length() != r.length() ||
          l.dimensions_size() != r.dimensions_size())
        return false;
      for (int d = 0; d < l.dimensions_size(); ++d) {
        if (l.dimensions(d) != r.dimensions(d)) return false;
      }
    }
    return true;
  }

  // True when every tensor carries exactly `length` serialized doubles.
  static bool IsWellFormed(const cropfl::ParameterVector &vector) {
    for (const auto &tensor : vector.tensors()) {
      if (tensor.value().size() != tensor.length() * sizeof(double))
        return false;
    }
    return true;
  }

  // False if any tensor holds a NaN or an infinity.
  static bool AllFinite(const cropfl::ParameterVector &vector) {
    for (const auto &tensor : vector.tensors()) {
      for (auto value : DeserializeTensor(tensor)) {
        if (!std::isfinite(value)) return false;
      }
    }
    return true;
  }

  static std::string ShapeString(const cropfl::ParameterVector &vector) {
    std::string shape = "[";
    for (int i = 0; i < vector.tensors_size(); ++i) {
      if (i > 0) shape += ", ";
      shape += std::to_string(vector.tensors(i).length());
    }
    return shape + "]";
  }

  static uint64_t NumValues(const cropfl::ParameterVector &vector) {
    uint64_t num_values = 0;
    for (const auto &tensor : vector.tensors()) num_values += tensor.length();
    return num_values;
  }

  static void PrintSerializedTensor(const std::string &str,
                                    const uint32_t num_values) {
    std::vector<double> loaded_values(num_values);
    if (num_values > 0)
      std::memcpy(loaded_values.data(), str.c_str(),
                  num_values * sizeof(double));
    for (auto val : loaded_values) {
      std::cout << val << ", ";
    }
    std::cout << std::endl;
  }

  template <typename T>
  static T ParseTextOrDie(const std::string &input) {
    T result;
    VALIDATE(google::protobuf::TextFormat::ParseFromString(input, &result));
    return result;
  }
};
}  // namespace proto

}  // namespace cropfl

#endif  // CROPFL_CROPFL_COMMON_PROTO_TENSOR_SERDE_H_
