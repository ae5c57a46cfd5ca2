#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tabload {

/// Semantic column type. UNKNOWN only exists while a schema is being built.
enum class SemanticType : uint8_t { UNKNOWN = 0, STRING, INT64, FLOAT64, DATE };

/// Source format families accepted by the resolver.
enum class SourceFormat : uint8_t { TEXT, CSV, XLSX, XLS };

/// Calendar date as days since 1970-01-01.
struct Date {
  int32_t days = 0;

  bool operator==(const Date& other) const { return days == other.days; }
  bool operator!=(const Date& other) const { return days != other.days; }
};

/// One typed cell. The alternative always matches the column's SemanticType.
using Value = std::variant<std::string, int64_t, double, Date>;

/// Ordered raw cells of one source row.
using RawRow = std::vector<std::string>;

/// Typed values aligned 1:1 with a TableSchema.
using CoercedRow = std::vector<Value>;

const char* semantic_type_to_string(SemanticType type);
const char* source_format_to_string(SourceFormat format);

/// Type tokens for supplied column types: s, i, f, d.
std::optional<SemanticType> type_from_token(std::string_view token);

/// Format tokens: text, csv, xlsx, xls (case-insensitive).
std::optional<SourceFormat> format_from_token(std::string_view token);

/// Field separator used when reading a format's delimited form.
char default_separator(SourceFormat format);

/// Illegal-value sentinel for a type: DBL_MAX, INT64_MAX, 1970-01-01, "!".
/// UNKNOWN maps to the String sentinel.
Value sentinel_for(SemanticType type);

/// Days since epoch for a proleptic Gregorian date.
Date date_from_civil(int year, unsigned month, unsigned day);

/// YYYY-MM-DD
std::string format_date(Date date);

/// Text form of a value, as written to text-based destinations.
std::string value_to_string(const Value& value);

} // namespace tabload
