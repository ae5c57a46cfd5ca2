#pragma once

#include "tabload/date_format.h"
#include "tabload/schema.h"
#include "tabload/types.h"

#include <optional>
#include <string_view>

namespace tabload {

/// Base-10 integer; surrounding blanks and a leading '+' are accepted.
std::optional<int64_t> parse_int64(std::string_view value);

/// Floating-point literal; surrounding blanks, a leading '+', inf and nan
/// are accepted.
std::optional<double> parse_float64(std::string_view value);

/// Turns RawRows into CoercedRows for a fixed schema.
///
/// Never fails on cell content: an empty cell or one that does not parse as
/// its column's type becomes the column sentinel.
class ValueCoercer {
public:
  ValueCoercer(const TableSchema& schema, const DateParser& dates);

  /// Row width must equal the schema size (the reader guarantees a fixed
  /// width; the caller checks it against the schema once).
  CoercedRow coerce(const RawRow& row) const;

  Value coerce_cell(std::string_view cell, const ColumnDefinition& column) const;

  const TableSchema& schema() const { return schema_; }

private:
  const TableSchema& schema_;
  const DateParser& dates_;
};

} // namespace tabload
