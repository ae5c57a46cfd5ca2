#include "tabload/value_coercer.h"

#include <cctype>
#include <charconv>

#include <fast_float/fast_float.h>

namespace tabload {

static std::string_view trim_blanks(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
    value.remove_prefix(1);
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
    value.remove_suffix(1);
  return value;
}

std::optional<int64_t> parse_int64(std::string_view value) {
  value = trim_blanks(value);
  // from_chars rejects a leading '+'
  if (!value.empty() && value.front() == '+') {
    value.remove_prefix(1);
    if (!value.empty() && value.front() == '-')
      return std::nullopt;
  }
  if (value.empty())
    return std::nullopt;

  int64_t result = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
  if (ec != std::errc() || ptr != value.data() + value.size())
    return std::nullopt;
  return result;
}

std::optional<double> parse_float64(std::string_view value) {
  value = trim_blanks(value);
  // Strip leading '+' that fast_float doesn't accept
  if (!value.empty() && value.front() == '+') {
    value.remove_prefix(1);
    if (!value.empty() && value.front() == '-')
      return std::nullopt;
  }
  if (value.empty())
    return std::nullopt;

  double result = 0.0;
  auto [ptr, ec] = fast_float::from_chars(value.data(), value.data() + value.size(), result);
  if (ec != std::errc() || ptr != value.data() + value.size())
    return std::nullopt;
  return result;
}

ValueCoercer::ValueCoercer(const TableSchema& schema, const DateParser& dates)
    : schema_(schema), dates_(dates) {}

Value ValueCoercer::coerce_cell(std::string_view cell, const ColumnDefinition& column) const {
  if (cell.empty())
    return column.sentinel;

  switch (column.type) {
  case SemanticType::INT64:
    if (auto v = parse_int64(cell))
      return *v;
    return column.sentinel;
  case SemanticType::FLOAT64:
    if (auto v = parse_float64(cell))
      return *v;
    return column.sentinel;
  case SemanticType::DATE:
    if (auto v = dates_.parse(cell))
      return *v;
    return column.sentinel;
  default:
    return std::string(cell);
  }
}

CoercedRow ValueCoercer::coerce(const RawRow& row) const {
  CoercedRow out;
  out.reserve(row.size());
  const auto& columns = schema_.columns();
  for (size_t i = 0; i < row.size() && i < columns.size(); ++i)
    out.push_back(coerce_cell(row[i], columns[i]));
  return out;
}

} // namespace tabload
