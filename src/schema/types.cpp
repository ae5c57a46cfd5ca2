#include "tabload/types.h"

#include <algorithm>
#include <cctype>
#include <cfloat>
#include <charconv>
#include <cstdio>
#include <limits>
#include <unordered_map>

namespace tabload {

namespace {

const std::unordered_map<std::string_view, SemanticType> TYPE_TOKENS = {
    {"s", SemanticType::STRING},
    {"i", SemanticType::INT64},
    {"f", SemanticType::FLOAT64},
    {"d", SemanticType::DATE},
};

const std::unordered_map<std::string_view, SourceFormat> FORMAT_TOKENS = {
    {"text", SourceFormat::TEXT},
    {"csv", SourceFormat::CSV},
    {"xlsx", SourceFormat::XLSX},
    {"xls", SourceFormat::XLS},
};

} // namespace

const char* semantic_type_to_string(SemanticType type) {
  switch (type) {
  case SemanticType::UNKNOWN:
    return "Unknown";
  case SemanticType::STRING:
    return "String";
  case SemanticType::INT64:
    return "Int64";
  case SemanticType::FLOAT64:
    return "Float64";
  case SemanticType::DATE:
    return "Date";
  default:
    return "Unknown";
  }
}

const char* source_format_to_string(SourceFormat format) {
  switch (format) {
  case SourceFormat::TEXT:
    return "text";
  case SourceFormat::CSV:
    return "csv";
  case SourceFormat::XLSX:
    return "xlsx";
  case SourceFormat::XLS:
    return "xls";
  default:
    return "unknown";
  }
}

std::optional<SemanticType> type_from_token(std::string_view token) {
  auto it = TYPE_TOKENS.find(token);
  if (it == TYPE_TOKENS.end())
    return std::nullopt;
  return it->second;
}

std::optional<SourceFormat> format_from_token(std::string_view token) {
  std::string lower(token);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto it = FORMAT_TOKENS.find(lower);
  if (it == FORMAT_TOKENS.end())
    return std::nullopt;
  return it->second;
}

char default_separator(SourceFormat format) {
  return format == SourceFormat::CSV ? ',' : '\t';
}

Value sentinel_for(SemanticType type) {
  switch (type) {
  case SemanticType::INT64:
    return std::numeric_limits<int64_t>::max();
  case SemanticType::FLOAT64:
    return DBL_MAX;
  case SemanticType::DATE:
    return Date{0};
  default:
    return std::string("!");
  }
}

// Howard Hinnant's days_from_civil / civil_from_days
Date date_from_civil(int year, unsigned month, unsigned day) {
  int y = year - (month <= 2 ? 1 : 0);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return Date{static_cast<int32_t>(era * 146097 + static_cast<int>(doe) - 719468)};
}

std::string format_date(Date date) {
  int z = date.days + 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  int y = static_cast<int>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  if (m <= 2)
    ++y;

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
  return buf;
}

std::string value_to_string(const Value& value) {
  switch (value.index()) {
  case 0:
    return std::get<std::string>(value);
  case 1:
    return std::to_string(std::get<int64_t>(value));
  case 2: {
    // Shortest representation that round-trips
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), std::get<double>(value));
    if (ec != std::errc())
      return "0";
    return std::string(buf, ptr);
  }
  default:
    return format_date(std::get<Date>(value));
  }
}

} // namespace tabload
