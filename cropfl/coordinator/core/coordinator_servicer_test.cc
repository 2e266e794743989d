#include "cropfl/coordinator/core/coordinator_servicer.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "cropfl/common/errors.h"
#include "cropfl/common/grpc_status.h"
#include "cropfl/common/proto_matchers.h"
#include "cropfl/common/proto_tensor_serde.h"
#include "cropfl/coordinator/core/coordinator_mock.h"
#include "cropfl/coordinator/core/worker_client_mock.h"

namespace cropfl::coordinator {
namespace {

using ::grpc::ServerContext;
using cropfl::proto::TensorOps;
using ::testing::_;
using ::testing::Eq;
using ::testing::Exactly;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::proto::EqualsProto;

const char kRegisterRequest[] = R"pb(
  worker_id: "worker-0"
  server_entity { hostname: "localhost" port: 50052 }
)pb";

const char kRunStatus[] = R"pb(
  state: COLLECTING_FIT
  current_round: 1
  total_rounds: 3
  connected_workers: "worker-0"
  connected_workers: "worker-1"
  history {
    round_number: 1
    aggregated_train_metric: 0.5
    aggregated_loss: 0.4
    aggregated_eval_metric: 0.6
    participant_count: 2
    eval_participant_count: 2
    attempts: 1
  }
  outcome { status: RUNNING }
)pb";

class CoordinatorServicerTest : public ::testing::Test {
 protected:
  ServerContext ctx_;
  std::vector<ServerEntity> created_clients_;

  NiceMock<MockCoordinator> coordinator_;
  std::unique_ptr<CoordinatorServicer> service_ =
      std::make_unique<CoordinatorServicer>(
          TensorOps::ParseTextOrDie<ServerEntity>(
              R"pb(hostname: "0.0.0.0" port: 8080)pb"),
          &coordinator_, [this](const ServerEntity &worker_entity) {
            created_clients_.push_back(worker_entity);
            return std::make_shared<NiceMock<MockWorkerClient>>();
          });
};

// NOLINTNEXTLINE
TEST_F(CoordinatorServicerTest, GetHealthStatus) {
  Empty req_;
  Ack res_;
  auto status = service_->GetHealthStatus(&ctx_, &req_, &res_);

  EXPECT_TRUE(status.ok());
  EXPECT_TRUE(res_.status());
}

// NOLINTNEXTLINE
TEST_F(CoordinatorServicerTest, RegisterEmptyRequest) {
  EXPECT_CALL(coordinator_, RegisterWorker(_, _)).Times(Exactly(0));

  RegisterRequest req_;
  RegisterResponse res_;
  auto status = service_->Register(&ctx_, &req_, &res_);

  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

// NOLINTNEXTLINE
TEST_F(CoordinatorServicerTest, RegisterNewWorker) {
  RegisterAck ack;
  ack.set_accepted_round_start(1);
  EXPECT_CALL(coordinator_, RegisterWorker(Eq("worker-0"), _))
      .Times(Exactly(1))
      .WillOnce(Return(ack));

  auto req_ = TensorOps::ParseTextOrDie<RegisterRequest>(kRegisterRequest);
  RegisterResponse res_;
  auto status = service_->Register(&ctx_, &req_, &res_);

  EXPECT_TRUE(status.ok());
  EXPECT_THAT(res_.ack(), EqualsProto(ack));
  ASSERT_EQ(created_clients_.size(), 1);
  EXPECT_THAT(created_clients_[0], EqualsProto(req_.server_entity()));
}

// NOLINTNEXTLINE
TEST_F(CoordinatorServicerTest, RegisterDuplicateWorker) {
  EXPECT_CALL(coordinator_, RegisterWorker(Eq("worker-0"), _))
      .Times(Exactly(1))
      .WillOnce(Return(absl::AlreadyExistsError("Already registered.")));

  auto req_ = TensorOps::ParseTextOrDie<RegisterRequest>(kRegisterRequest);
  RegisterResponse res_;
  auto status = service_->Register(&ctx_, &req_, &res_);

  EXPECT_EQ(status.error_code(), grpc::StatusCode::ALREADY_EXISTS);
  EXPECT_FALSE(res_.has_ack());
}

// NOLINTNEXTLINE
TEST_F(CoordinatorServicerTest, RegisterAfterTermination) {
  EXPECT_CALL(coordinator_, RegisterWorker(_, _))
      .WillOnce(Return(absl::FailedPreconditionError("Terminated.")));

  auto req_ = TensorOps::ParseTextOrDie<RegisterRequest>(kRegisterRequest);
  RegisterResponse res_;
  auto status = service_->Register(&ctx_, &req_, &res_);

  EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
}

// NOLINTNEXTLINE
TEST_F(CoordinatorServicerTest, DeregisterEmptyRequest) {
  DeregisterRequest req_;
  Ack res_;
  auto status = service_->Deregister(&ctx_, &req_, &res_);

  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_FALSE(res_.status());
}

// NOLINTNEXTLINE
TEST_F(CoordinatorServicerTest, DeregisterUnknownWorker) {
  EXPECT_CALL(coordinator_, DeregisterWorker(Eq("worker-7")))
      .WillOnce(Return(absl::NotFoundError("Not connected.")));

  DeregisterRequest req_;
  req_.set_worker_id("worker-7");
  Ack res_;
  auto status = service_->Deregister(&ctx_, &req_, &res_);

  EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);
  EXPECT_FALSE(res_.status());
}

// NOLINTNEXTLINE
TEST_F(CoordinatorServicerTest, DeregisterConnectedWorker) {
  EXPECT_CALL(coordinator_, DeregisterWorker(Eq("worker-0")))
      .WillOnce(Return(absl::OkStatus()));

  DeregisterRequest req_;
  req_.set_worker_id("worker-0");
  Ack res_;
  auto status = service_->Deregister(&ctx_, &req_, &res_);

  EXPECT_TRUE(status.ok());
  EXPECT_TRUE(res_.status());
}

// NOLINTNEXTLINE
TEST_F(CoordinatorServicerTest, GetRunStatus) {
  auto run_status = TensorOps::ParseTextOrDie<RunStatus>(kRunStatus);
  EXPECT_CALL(coordinator_, GetRunStatus()).WillOnce(Return(run_status));

  Empty req_;
  RunStatus res_;
  auto status = service_->GetRunStatus(&ctx_, &req_, &res_);

  EXPECT_TRUE(status.ok());
  EXPECT_THAT(res_, EqualsProto(run_status));
}

// NOLINTNEXTLINE
TEST_F(CoordinatorServicerTest, ShutDownStopsTheRun) {
  EXPECT_CALL(coordinator_, Shutdown()).Times(Exactly(1));

  Empty req_;
  Ack res_;
  auto status = service_->ShutDown(&ctx_, &req_, &res_);

  EXPECT_TRUE(status.ok());
  EXPECT_TRUE(res_.status());
  EXPECT_TRUE(service_->ShutdownRequestReceived());

  // Waits for the scheduled shutdown tasks.
  service_.reset();
}

// NOLINTNEXTLINE
TEST(GrpcStatus, KeepsCodeAndMessage) {
  auto status = ToGrpcStatus(QuorumTimeoutError("Too few results."));
  EXPECT_EQ(status.error_code(), grpc::StatusCode::DEADLINE_EXCEEDED);
  EXPECT_EQ(status.error_message(), "Too few results.");

  auto back = FromGrpcStatus(status);
  EXPECT_EQ(back.code(), absl::StatusCode::kDeadlineExceeded);
  EXPECT_TRUE(ToGrpcStatus(absl::OkStatus()).ok());
}

}  // namespace
}  // namespace cropfl::coordinator
