#pragma once

#include "tabload/date_format.h"
#include "tabload/row_reader.h"
#include "tabload/schema.h"
#include "tabload/types.h"

#include <string_view>
#include <vector>

namespace tabload {

/// Default share of non-empty cells that must parse for a non-String type.
inline constexpr double DEFAULT_INFERENCE_THRESHOLD = 0.95;

/// Per-column parse counts. Each parser is tried independently, so a cell
/// like "20230101" counts as both a date and an integer.
struct ColumnTypeStats {
  size_t total_count = 0;
  size_t empty_count = 0;
  size_t date_count = 0;
  size_t int64_count = 0;
  size_t float64_count = 0;

  size_t non_empty() const { return total_count - empty_count; }

  /// Date, then Int64, then Float64: the first whose share of non-empty
  /// cells is >= threshold. String otherwise, including all-empty columns.
  SemanticType dominant_type(double threshold = DEFAULT_INFERENCE_THRESHOLD) const;

  void add(std::string_view cell, const DateParser& dates);
};

struct InferenceOptions {
  double threshold = DEFAULT_INFERENCE_THRESHOLD;
};

/// Infers column types by scanning every remaining row of a reader once.
class TypeInference {
public:
  explicit TypeInference(const DateParser& dates, const InferenceOptions& options = {});

  /// Consume the reader and return one stats entry per column. Throws
  /// SchemaMismatchError when rows are not `width` wide.
  std::vector<ColumnTypeStats> scan(RowReader& reader, size_t width);

  /// Scan the reader and assign the dominant type to every column of the
  /// builder whose type is still Unknown.
  void infer(RowReader& reader, SchemaBuilder& builder);

  size_t rows_scanned() const { return rows_scanned_; }

private:
  const DateParser& dates_;
  InferenceOptions options_;
  size_t rows_scanned_ = 0;
};

} // namespace tabload
