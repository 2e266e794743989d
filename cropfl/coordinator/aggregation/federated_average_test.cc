#include "cropfl/coordinator/aggregation/federated_average.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <vector>

#include "cropfl/common/errors.h"
#include "cropfl/common/proto_matchers.h"
#include "cropfl/common/proto_tensor_serde.h"
#include "cropfl/proto/model.pb.h"

namespace cropfl::coordinator {
namespace {

using cropfl::proto::TensorOps;
using ::testing::DoubleEq;
using ::testing::ElementsAre;
using ::testing::proto::EqualsProto;
using ::testing::proto::TensorValuesNear;

const char kParameters_with_values_1to10[] = R"pb(
  tensors {
    length: 10
    dimensions: 10
    value: "\000\000\000\000\000\000\360?\000\000\000\000\000\000\000@\000\000\000\000\000\000\010@\000\000\000\000\000\000\020@\000\000\000\000\000\000\024@\000\000\000\000\000\000\030@\000\000\000\000\000\000\034@\000\000\000\000\000\000 @\000\000\000\000\000\000\"@\000\000\000\000\000\000$@"
  }
)pb";

ParameterVector MakeParameters(const std::vector<double> &values) {
  ParameterVector parameters;
  *parameters.add_tensors() = TensorOps::MakeTensor(values);
  return parameters;
}

class FederatedAverageTest : public ::testing::Test {};

TEST_F(FederatedAverageTest, IdenticalVectorsAverageToThemselves) {
  auto parameters1 =
      TensorOps::ParseTextOrDie<ParameterVector>(kParameters_with_values_1to10);
  auto parameters2 =
      TensorOps::ParseTextOrDie<ParameterVector>(kParameters_with_values_1to10);

  AggregationPairs to_aggregate({{&parameters1, 5}, {&parameters2, 5}});

  FederatedAverage avg = FederatedAverage();
  auto averaged = avg.Aggregate(to_aggregate);
  ASSERT_TRUE(averaged.ok()) << averaged.status();

  EXPECT_THAT(*averaged, EqualsProto(parameters1));
}

TEST_F(FederatedAverageTest, WeightedBySampleCount) {
  auto parameters1 = MakeParameters({1, 2});
  auto parameters2 = MakeParameters({4, 6});

  FederatedAverage avg;
  auto averaged = avg.Aggregate({{&parameters1, 3}, {&parameters2, 1}});
  ASSERT_TRUE(averaged.ok()) << averaged.status();

  EXPECT_THAT(TensorOps::DeserializeTensor(averaged->tensors(0)),
              ElementsAre(DoubleEq(1.75), DoubleEq(3.0)));
}

TEST_F(FederatedAverageTest, KeepsTensorLayout) {
  ParameterVector parameters1;
  *parameters1.add_tensors() = TensorOps::MakeTensor({1, 2, 3, 4}, {2, 2});
  *parameters1.add_tensors() = TensorOps::MakeTensor({10});
  ParameterVector parameters2;
  *parameters2.add_tensors() = TensorOps::MakeTensor({3, 4, 5, 6}, {2, 2});
  *parameters2.add_tensors() = TensorOps::MakeTensor({20});

  FederatedAverage avg;
  auto averaged = avg.Aggregate({{&parameters1, 1}, {&parameters2, 1}});
  ASSERT_TRUE(averaged.ok()) << averaged.status();

  ASSERT_EQ(averaged->tensors_size(), 2);
  EXPECT_THAT(averaged->tensors(0).dimensions(), ElementsAre(2, 2));
  EXPECT_THAT(averaged->tensors(0),
              TensorValuesNear(std::vector<double>{2, 3, 4, 5}));
  EXPECT_THAT(averaged->tensors(1),
              TensorValuesNear(std::vector<double>{15}));
}

TEST_F(FederatedAverageTest, IndependentOfContributionOrder) {
  auto parameters1 = MakeParameters({0.1, 0.7, -3.3});
  auto parameters2 = MakeParameters({1e-8, 2.5, 1e8});
  auto parameters3 = MakeParameters({0.3, -0.2, 0.6});
  auto parameters4 = MakeParameters({0.3, -0.1, 0.6});

  AggregationPairs pairs({{&parameters1, 7},
                          {&parameters2, 3},
                          {&parameters3, 11},
                          {&parameters4, 11}});
  std::sort(pairs.begin(), pairs.end());

  FederatedAverage avg;
  auto reference = avg.Aggregate(pairs);
  ASSERT_TRUE(reference.ok()) << reference.status();

  while (std::next_permutation(pairs.begin(), pairs.end())) {
    auto averaged = avg.Aggregate(pairs);
    ASSERT_TRUE(averaged.ok()) << averaged.status();
    // Bit-exact equality of the serialized values.
    EXPECT_EQ(averaged->tensors(0).value(), reference->tensors(0).value());
  }
}

TEST_F(FederatedAverageTest, DifferentShapesAreRejected) {
  auto parameters1 = MakeParameters({1, 2});
  auto parameters2 = MakeParameters({1, 2, 3});

  FederatedAverage avg;
  auto averaged = avg.Aggregate({{&parameters1, 1}, {&parameters2, 1}});

  EXPECT_TRUE(IsErrorKind(averaged.status(), SHAPE_MISMATCH));
  EXPECT_EQ(averaged.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(FederatedAverageTest, DifferentTensorCountsAreRejected) {
  auto parameters1 = MakeParameters({1, 2});
  auto parameters2 = MakeParameters({1, 2});
  *parameters2.add_tensors() = TensorOps::MakeTensor({3});

  FederatedAverage avg;
  auto averaged = avg.Aggregate({{&parameters1, 1}, {&parameters2, 1}});

  EXPECT_TRUE(IsErrorKind(averaged.status(), SHAPE_MISMATCH));
}

TEST_F(FederatedAverageTest, EmptyInputIsRejected) {
  FederatedAverage avg;
  EXPECT_EQ(avg.Aggregate({}).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(avg.AggregateMetric({}).status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST_F(FederatedAverageTest, ZeroWeightIsRejected) {
  auto parameters1 = MakeParameters({1, 2});
  auto parameters2 = MakeParameters({4, 6});

  FederatedAverage avg;
  auto averaged = avg.Aggregate({{&parameters1, 0}, {&parameters2, 1}});
  EXPECT_EQ(averaged.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(FederatedAverageTest, NonFiniteParametersAreRejected) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  std::vector<ParameterVector> parameters;
  for (int i = 0; i < 40; ++i) {
    parameters.push_back(MakeParameters(
        {i % 3 == 0 ? nan : 1.0, (i % 2 == 0 ? 1e16 : -1e16) + i}));
  }
  AggregationPairs pairs;
  for (const auto &vector : parameters) pairs.emplace_back(&vector, 1);

  FederatedAverage avg;
  auto averaged = avg.Aggregate(pairs);
  EXPECT_EQ(averaged.status().code(), absl::StatusCode::kInvalidArgument);

  std::reverse(pairs.begin(), pairs.end());
  EXPECT_EQ(avg.Aggregate(pairs).status().code(),
            absl::StatusCode::kInvalidArgument);

  auto finite = MakeParameters({1, 2});
  auto infinite = MakeParameters({inf, 2});
  EXPECT_EQ(avg.Aggregate({{&finite, 1}, {&infinite, 1}}).status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST_F(FederatedAverageTest, NonFiniteMetricsAreRejected) {
  FederatedAverage avg;
  auto metric = avg.AggregateMetric(
      {{0.5, 3}, {std::numeric_limits<double>::quiet_NaN(), 1}, {1.0, 2}});
  EXPECT_EQ(metric.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(FederatedAverageTest, MetricIsWeightedMean) {
  FederatedAverage avg;
  auto metric = avg.AggregateMetric({{0.5, 3}, {1.0, 1}});
  ASSERT_TRUE(metric.ok()) << metric.status();
  EXPECT_DOUBLE_EQ(*metric, 0.625);
}

}  // namespace
}  // namespace cropfl::coordinator
