#include "cropfl/worker/worker.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "cropfl/common/errors.h"
#include "cropfl/common/proto_matchers.h"
#include "cropfl/common/proto_tensor_serde.h"
#include "cropfl/worker/training/nearest_centroid.h"

namespace cropfl::worker {
namespace {

using cropfl::proto::TensorOps;
using ::testing::_;
using ::testing::DoubleEq;
using ::testing::Return;
using ::testing::proto::EqualsProto;

class MockModelTrainer : public ModelTrainer {
 public:
  using ModelTrainer::ModelTrainer;

  MOCK_METHOD(ParameterVector, InitialParameters, (), (const, override));
  MOCK_METHOD(absl::StatusOr<ParameterVector>, Train,
              (const ParameterVector &, const std::vector<Row> &,
               const Hyperparameters &),
              (const, override));
  MOCK_METHOD(absl::StatusOr<std::vector<int>>, Predict,
              (const ParameterVector &, const std::vector<Row> &),
              (const, override));
  MOCK_METHOD(std::string, Name, (), (const, override));
};

Partition MakePartition(std::vector<Row> train_rows,
                        std::vector<Row> eval_rows) {
  Partition partition;
  partition.worker_id = "worker-3";
  partition.total_size = train_rows.size() + eval_rows.size();
  partition.train_rows = std::move(train_rows);
  partition.eval_rows = std::move(eval_rows);
  return partition;
}

class WorkerTest : public ::testing::Test {
 protected:
  static Worker MakeWorker(std::vector<Row> eval_rows) {
    return Worker(
        MakePartition({{{0.0, 0.0}, "maize"},
                       {{2.0, 2.0}, "maize"},
                       {{10.0, 10.0}, "rice"}},
                      std::move(eval_rows)),
        std::make_unique<NearestCentroid>(ClassTable({"maize", "rice"}), 2));
  }

  static RoundConfig MakeConfig(const Worker &worker) {
    RoundConfig config;
    config.set_round_number(4);
    *config.mutable_parameters() = worker.GetParameters();
    return config;
  }
};

// NOLINTNEXTLINE
TEST_F(WorkerTest, FitTrainsOnTheTrainSlice) {
  auto worker = MakeWorker({{{9.0, 9.0}, "maize"}});

  auto result = worker.Fit(MakeConfig(worker));
  ASSERT_TRUE(result.ok()) << result.status();

  EXPECT_EQ(result->worker_id(), "worker-3");
  EXPECT_EQ(result->sample_count(), 3);
  EXPECT_THAT(result->train_metric(), DoubleEq(1.0));

  ParameterVector expected;
  *expected.add_tensors() = TensorOps::MakeTensor({1, 1, 10, 10}, {2, 2});
  EXPECT_THAT(result->parameters(), EqualsProto(expected));
}

// NOLINTNEXTLINE
TEST_F(WorkerTest, EvaluateScoresTheHeldOutSlice) {
  auto worker = MakeWorker({{{9.0, 9.0}, "maize"}, {{1.0, 2.0}, "maize"}});
  auto trained = worker.Fit(MakeConfig(worker));
  ASSERT_TRUE(trained.ok()) << trained.status();

  auto result = worker.Evaluate(4, trained->parameters());
  ASSERT_TRUE(result.ok()) << result.status();

  EXPECT_EQ(result->worker_id(), "worker-3");
  EXPECT_EQ(result->sample_count(), 2);
  EXPECT_THAT(result->eval_metric(), DoubleEq(0.5));
  EXPECT_THAT(result->loss(), DoubleEq(0.5));
}

// NOLINTNEXTLINE
TEST_F(WorkerTest, EmptyHeldOutSliceCannotEvaluate) {
  auto worker = MakeWorker({});

  auto result = worker.Evaluate(1, worker.GetParameters());
  EXPECT_TRUE(IsErrorKind(result.status(), LOCAL_TRAINING)) << result.status();
}

// NOLINTNEXTLINE
TEST_F(WorkerTest, ShapeMismatchIsReportedAsSuch) {
  auto worker = MakeWorker({{{9.0, 9.0}, "maize"}});
  auto config = MakeConfig(worker);
  *config.mutable_parameters()->add_tensors() = TensorOps::MakeTensor({1.0});

  EXPECT_TRUE(IsErrorKind(worker.Fit(config).status(), SHAPE_MISMATCH));
  EXPECT_TRUE(IsErrorKind(worker.Evaluate(1, config.parameters()).status(),
                          SHAPE_MISMATCH));
}

// NOLINTNEXTLINE
TEST_F(WorkerTest, TrainerFailuresBecomeLocalTrainingErrors) {
  auto trainer = std::make_unique<MockModelTrainer>(
      ClassTable({"maize", "rice"}), 2);
  EXPECT_CALL(*trainer, Name()).WillRepeatedly(Return("Mock"));
  EXPECT_CALL(*trainer, Train(_, _, _))
      .WillOnce(Return(absl::ResourceExhaustedError("Out of memory.")));

  Worker worker(MakePartition({{{0.0, 0.0}, "maize"}}, {}), std::move(trainer));

  auto result = worker.Fit(RoundConfig());
  EXPECT_TRUE(IsErrorKind(result.status(), LOCAL_TRAINING)) << result.status();
  EXPECT_EQ(result.status().message(), "Out of memory.");
}

}  // namespace
}  // namespace cropfl::worker
