#ifndef CROPFL_CROPFL_COMMON_DATASET_H_
#define CROPFL_CROPFL_COMMON_DATASET_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"

namespace cropfl {

// A labeled feature row.
struct Row {
  std::vector<double> features;
  std::string label;
};

// Maps labels to dense class indices. Labels are kept sorted, so every worker
// holding the same dataset derives the same table.
class ClassTable {
 public:
  ClassTable() = default;

  explicit ClassTable(std::vector<std::string> labels);

  // Returns -1 for labels outside the table.
  int IndexOf(const std::string &label) const;

  const std::string &Name(int index) const { return labels_[index]; }

  int size() const { return static_cast<int>(labels_.size()); }

  const std::vector<std::string> &labels() const { return labels_; }

 private:
  std::vector<std::string> labels_;
  absl::flat_hash_map<std::string, int> index_;
};

// An ordered, immutable table of labeled rows with a fixed feature count.
class Dataset {
 public:
  static absl::StatusOr<std::shared_ptr<const Dataset>> Create(
      std::vector<std::string> feature_names, std::vector<Row> rows);

  size_t size() const { return rows_.size(); }

  const Row &row(size_t index) const { return rows_[index]; }

  const std::vector<Row> &rows() const { return rows_; }

  int num_features() const { return static_cast<int>(feature_names_.size()); }

  const std::vector<std::string> &feature_names() const {
    return feature_names_;
  }

  const ClassTable &class_table() const { return class_table_; }

 private:
  Dataset(std::vector<std::string> feature_names, std::vector<Row> rows);

  std::vector<std::string> feature_names_;
  std::vector<Row> rows_;
  ClassTable class_table_;
};

// Reads a CSV file whose first line is a header. All columns but the one
// named `label_column` must be numeric.
absl::StatusOr<std::shared_ptr<const Dataset>> LoadCsvDataset(
    const std::string &file_name, const std::string &label_column = "label");

// Same as above, reading from an in-memory CSV document.
absl::StatusOr<std::shared_ptr<const Dataset>> ParseCsvDataset(
    const std::string &content, const std::string &label_column = "label");

}  // namespace cropfl

#endif  // CROPFL_CROPFL_COMMON_DATASET_H_
