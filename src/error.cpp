#include "tabload/error.h"

#include <sstream>

namespace tabload {

const char* error_code_to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::NONE:
    return "NONE";
  case ErrorCode::CONFIGURATION:
    return "CONFIGURATION";
  case ErrorCode::FETCH_FAILED:
    return "FETCH_FAILED";
  case ErrorCode::NOT_FOUND:
    return "NOT_FOUND";
  case ErrorCode::CONVERSION_FAILED:
    return "CONVERSION_FAILED";
  case ErrorCode::MALFORMED_ROW:
    return "MALFORMED_ROW";
  case ErrorCode::INVALID_WORKBOOK:
    return "INVALID_WORKBOOK";
  case ErrorCode::SCHEMA_MISMATCH:
    return "SCHEMA_MISMATCH";
  case ErrorCode::TABLE_CREATION:
    return "TABLE_CREATION";
  case ErrorCode::EXPORT_FAILED:
    return "EXPORT_FAILED";
  case ErrorCode::DESTINATION_FAILED:
    return "DESTINATION_FAILED";
  case ErrorCode::ROW_SKIPPED:
    return "ROW_SKIPPED";
  case ErrorCode::IO_ERROR:
    return "IO_ERROR";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  default:
    return "UNKNOWN";
  }
}

static std::string malformed_row_message(size_t row, size_t expected, size_t actual) {
  std::ostringstream ss;
  ss << "row " << row << " has " << actual << " fields, expected " << expected;
  return ss.str();
}

MalformedRowError::MalformedRowError(size_t row_number, size_t expected_width,
                                     size_t actual_width)
    : Error(ErrorCode::MALFORMED_ROW,
            malformed_row_message(row_number, expected_width, actual_width)),
      row_number_(row_number), expected_width_(expected_width), actual_width_(actual_width) {}

std::string RowRejection::to_string() const {
  std::ostringstream ss;
  ss << "[" << error_code_to_string(ErrorCode::ROW_SKIPPED) << "] row " << row_number << ": "
     << message;
  return ss.str();
}

std::string RejectionLog::summary(size_t max_details) const {
  if (count_ == 0) {
    return "No rows skipped";
  }

  std::ostringstream ss;
  ss << "Rows skipped: " << count_ << "\n";
  size_t shown = 0;
  for (const auto& r : rejections_) {
    if (shown == max_details)
      break;
    ss << "  " << r.to_string() << "\n";
    ++shown;
  }
  if (shown < count_)
    ss << "  ... " << (count_ - shown) << " more\n";
  return ss.str();
}

} // namespace tabload
