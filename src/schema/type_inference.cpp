#include "tabload/type_inference.h"

#include "tabload/error.h"
#include "tabload/logging.h"
#include "tabload/value_coercer.h"

namespace tabload {

SemanticType ColumnTypeStats::dominant_type(double threshold) const {
  size_t n = non_empty();
  if (n == 0)
    return SemanticType::STRING;

  // Date is checked first so YYYYMMDD values are not taken for integers
  if (static_cast<double>(date_count) / n >= threshold)
    return SemanticType::DATE;
  if (static_cast<double>(int64_count) / n >= threshold)
    return SemanticType::INT64;
  if (static_cast<double>(float64_count) / n >= threshold)
    return SemanticType::FLOAT64;
  return SemanticType::STRING;
}

void ColumnTypeStats::add(std::string_view cell, const DateParser& dates) {
  ++total_count;
  if (cell.empty()) {
    ++empty_count;
    return;
  }
  if (dates.parse(cell))
    ++date_count;
  if (parse_int64(cell))
    ++int64_count;
  if (parse_float64(cell))
    ++float64_count;
}

TypeInference::TypeInference(const DateParser& dates, const InferenceOptions& options)
    : dates_(dates), options_(options) {}

std::vector<ColumnTypeStats> TypeInference::scan(RowReader& reader, size_t width) {
  std::vector<ColumnTypeStats> stats(width);
  while (auto row = reader.next()) {
    if (row->size() != width)
      throw SchemaMismatchError("source rows have " + std::to_string(row->size()) +
                                " fields but the schema has " + std::to_string(width) +
                                " columns");
    for (size_t i = 0; i < width; ++i)
      stats[i].add((*row)[i], dates_);
    ++rows_scanned_;
  }
  return stats;
}

void TypeInference::infer(RowReader& reader, SchemaBuilder& builder) {
  auto stats = scan(reader, builder.size());
  for (size_t i = 0; i < builder.size(); ++i) {
    if (builder.column(i).type != SemanticType::UNKNOWN)
      continue;
    SemanticType type = stats[i].dominant_type(options_.threshold);
    builder.set_type(i, type, ColumnOrigin::INFERRED);
    logger()->debug("column {}: {} of {} non-empty cells; inferred {}", builder.column(i).name,
                    stats[i].non_empty(), stats[i].total_count, semantic_type_to_string(type));
  }
}

} // namespace tabload
