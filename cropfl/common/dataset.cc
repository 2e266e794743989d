#include "cropfl/common/dataset.h"

#include <algorithm>
#include <utility>

#include "absl/container/btree_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "cropfl/common/params_utils.h"

namespace cropfl {

ClassTable::ClassTable(std::vector<std::string> labels)
    : labels_(std::move(labels)) {
  std::sort(labels_.begin(), labels_.end());
  labels_.erase(std::unique(labels_.begin(), labels_.end()), labels_.end());
  for (int i = 0; i < static_cast<int>(labels_.size()); ++i) {
    index_[labels_[i]] = i;
  }
}

int ClassTable::IndexOf(const std::string &label) const {
  auto it = index_.find(label);
  if (it == index_.end()) return -1;
  return it->second;
}

Dataset::Dataset(std::vector<std::string> feature_names, std::vector<Row> rows)
    : feature_names_(std::move(feature_names)), rows_(std::move(rows)) {
  absl::btree_set<std::string> labels;
  for (const auto &row : rows_) labels.insert(row.label);
  class_table_ =
      ClassTable(std::vector<std::string>(labels.begin(), labels.end()));
}

absl::StatusOr<std::shared_ptr<const Dataset>> Dataset::Create(
    std::vector<std::string> feature_names, std::vector<Row> rows) {
  for (size_t i = 0; i < rows.size(); ++i) {
    if (rows[i].features.size() != feature_names.size()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Row ", i, " has ", rows[i].features.size(),
                       " features, expected ", feature_names.size(), "."));
    }
    if (rows[i].label.empty()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Row ", i, " has an empty label."));
    }
  }
  return std::shared_ptr<const Dataset>(
      new Dataset(std::move(feature_names), std::move(rows)));
}

absl::StatusOr<std::shared_ptr<const Dataset>> ParseCsvDataset(
    const std::string &content, const std::string &label_column) {
  std::vector<std::string> lines =
      absl::StrSplit(content, absl::ByAnyChar("\r\n"), absl::SkipWhitespace());
  if (lines.empty()) return absl::InvalidArgumentError("Empty CSV document.");

  std::vector<std::string> header = absl::StrSplit(lines.front(), ',');
  int label_idx = -1;
  std::vector<std::string> feature_names;
  for (int i = 0; i < static_cast<int>(header.size()); ++i) {
    auto column = std::string(absl::StripAsciiWhitespace(header[i]));
    if (column == label_column) {
      label_idx = i;
    } else {
      feature_names.push_back(column);
    }
  }
  if (label_idx < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("CSV header has no '", label_column, "' column."));
  }

  std::vector<Row> rows;
  rows.reserve(lines.size() - 1);
  for (size_t line_no = 1; line_no < lines.size(); ++line_no) {
    std::vector<absl::string_view> cells = absl::StrSplit(lines[line_no], ',');
    if (cells.size() != header.size()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Line ", line_no + 1, " has ", cells.size(),
                       " columns, expected ", header.size(), "."));
    }

    Row row;
    row.features.reserve(feature_names.size());
    for (int i = 0; i < static_cast<int>(cells.size()); ++i) {
      auto cell = absl::StripAsciiWhitespace(cells[i]);
      if (i == label_idx) {
        row.label = std::string(cell);
        continue;
      }
      double value;
      if (!absl::SimpleAtod(cell, &value)) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Line ", line_no + 1, ": '", cell, "' is not a number."));
      }
      row.features.push_back(value);
    }
    rows.push_back(std::move(row));
  }

  return Dataset::Create(std::move(feature_names), std::move(rows));
}

absl::StatusOr<std::shared_ptr<const Dataset>> LoadCsvDataset(
    const std::string &file_name, const std::string &label_column) {
  std::string content;
  RETURN_IF_ERROR(ReadParseFile(content, file_name));
  return ParseCsvDataset(content, label_column);
}

}  // namespace cropfl
