#include "cropfl/common/proto_tensor_serde.h"

#include <gtest/gtest.h>

#include "cropfl/proto/model.pb.h"

namespace proto {
namespace {
using cropfl::proto::TensorOps;

// The value below shows the byte representation of doubles [1.0 to 4.0].
char kTensor_1to4_as_FLOAT64[] = R"pb(
  length: 4
  dimensions: 2
  dimensions: 2
  value: "\000\000\000\000\000\000\360?\000\000\000\000\000\000\000@\000\000\000\000\000\000\010@\000\000\000\000\000\000\020@"
)pb";

class ProtoTensorSerDe : public ::testing::Test {};

TEST_F(ProtoTensorSerDe, DeSerFLOAT64) /* NOLINT */ {
  auto tensor = TensorOps::ParseTextOrDie<cropfl::Tensor>(kTensor_1to4_as_FLOAT64);
  auto deserialized_tensor = TensorOps::DeserializeTensor(tensor);
  EXPECT_EQ(deserialized_tensor, std::vector<double>({1.0, 2.0, 3.0, 4.0}));

  auto serialized_tensor = TensorOps::SerializeTensor(deserialized_tensor);
  EXPECT_EQ(std::string(serialized_tensor.begin(), serialized_tensor.end()),
            tensor.value());
}

TEST_F(ProtoTensorSerDe, MakeTensorKeepsDimensions) /* NOLINT */ {
  auto tensor = TensorOps::MakeTensor({1.0, 2.0, 3.0, 4.0}, {2, 2});
  auto expected =
      TensorOps::ParseTextOrDie<cropfl::Tensor>(kTensor_1to4_as_FLOAT64);

  EXPECT_EQ(tensor.SerializeAsString(), expected.SerializeAsString());
  EXPECT_EQ(TensorOps::MakeTensor({1.0, 2.0}).dimensions_size(), 1);
}

TEST_F(ProtoTensorSerDe, TruncatedTensorDeserializesToZeros) /* NOLINT */ {
  cropfl::Tensor tensor;
  tensor.set_length(3);
  tensor.set_value("short");

  EXPECT_EQ(TensorOps::DeserializeTensor(tensor),
            std::vector<double>(3, 0.0));
}

TEST_F(ProtoTensorSerDe, SameShape) /* NOLINT */ {
  cropfl::ParameterVector left;
  *left.add_tensors() = TensorOps::MakeTensor({1.0, 2.0, 3.0, 4.0}, {2, 2});
  *left.add_tensors() = TensorOps::MakeTensor({1.0});

  auto right = left;
  TensorOps::SetTensorValues(right.mutable_tensors(1), {7.0});
  EXPECT_TRUE(TensorOps::SameShape(left, right));

  auto transposed = left;
  *transposed.mutable_tensors(0) =
      TensorOps::MakeTensor({1.0, 2.0, 3.0, 4.0}, {4, 1});
  EXPECT_FALSE(TensorOps::SameShape(left, transposed));

  auto shorter = left;
  shorter.mutable_tensors()->RemoveLast();
  EXPECT_FALSE(TensorOps::SameShape(left, shorter));
  EXPECT_EQ(TensorOps::ShapeString(left), "[4, 1]");
  EXPECT_EQ(TensorOps::NumValues(left), 5);
}

TEST_F(ProtoTensorSerDe, IsWellFormed) /* NOLINT */ {
  cropfl::ParameterVector parameters;
  *parameters.add_tensors() = TensorOps::MakeTensor({1.0, 2.0});
  EXPECT_TRUE(TensorOps::IsWellFormed(parameters));

  parameters.mutable_tensors(0)->set_length(3);
  EXPECT_FALSE(TensorOps::IsWellFormed(parameters));
}

}  // namespace
}  // namespace proto
