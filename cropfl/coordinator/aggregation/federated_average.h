#ifndef CROPFL_CROPFL_COORDINATOR_AGGREGATION_FEDERATED_AVERAGE_H_
#define CROPFL_CROPFL_COORDINATOR_AGGREGATION_FEDERATED_AVERAGE_H_

#include <vector>

#include "cropfl/common/proto_tensor_serde.h"
#include "cropfl/coordinator/aggregation/aggregation_function.h"
#include "cropfl/proto/model.pb.h"

using cropfl::proto::TensorOps;

namespace cropfl::coordinator {

// Weighted mean sum(v_i * w_i) / sum(w_i), computed element-wise for
// parameter vectors. Contributions are accumulated in a canonical order
// (ascending weight, then ascending values) so the result does not depend on
// the order in which the participants replied. Non-finite inputs are
// rejected.
class FederatedAverage : public AggregationFunction {
 public:
  absl::StatusOr<ParameterVector> Aggregate(
      const AggregationPairs &pairs) override;

  absl::StatusOr<double> AggregateMetric(const MetricPairs &pairs) override;

  inline std::string Name() const override { return "FedAvg"; }

 private:
  std::vector<double> AggregateTensorAtIndex(const AggregationPairs &pairs,
                                             int var_idx,
                                             uint32_t var_num_values,
                                             double total_weight) const;
};

}  // namespace cropfl::coordinator

#endif  // CROPFL_CROPFL_COORDINATOR_AGGREGATION_FEDERATED_AVERAGE_H_
