#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace tabload {

// Ingestion error types
enum class ErrorCode {
  NONE = 0,

  // Raised before any I/O
  CONFIGURATION,      // Invalid option value or combination

  // Source access
  FETCH_FAILED,       // HTTP retrieval failed
  NOT_FOUND,          // Local source missing or unreadable
  CONVERSION_FAILED,  // Legacy spreadsheet conversion failed or unsupported

  // Row stream
  MALFORMED_ROW,      // Row width differs from the first observed row
  INVALID_WORKBOOK,   // Spreadsheet container or XML could not be decoded

  // Schema and destination
  SCHEMA_MISMATCH,    // Supplied types disagree with the column count
  TABLE_CREATION,     // Destination refused to create the table
  EXPORT_FAILED,      // Strict-mode abort after a rejected row
  DESTINATION_FAILED, // Connection-fatal destination failure

  // Non-fatal
  ROW_SKIPPED,        // Row rejected and skipped in tolerant mode

  IO_ERROR,
  INTERNAL_ERROR
};

const char* error_code_to_string(ErrorCode code);

/// Base class of every error raised by tabload.
class Error : public std::runtime_error {
public:
  Error(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

class ConfigurationError : public Error {
public:
  explicit ConfigurationError(const std::string& message)
      : Error(ErrorCode::CONFIGURATION, message) {}
};

/// Source could not be reached. Use the FetchError / NotFoundError subclasses.
class SourceAccessError : public Error {
protected:
  SourceAccessError(ErrorCode code, const std::string& message) : Error(code, message) {}
};

class FetchError : public SourceAccessError {
public:
  explicit FetchError(const std::string& message)
      : SourceAccessError(ErrorCode::FETCH_FAILED, message) {}
};

class NotFoundError : public SourceAccessError {
public:
  explicit NotFoundError(const std::string& message)
      : SourceAccessError(ErrorCode::NOT_FOUND, message) {}
};

class ConversionError : public Error {
public:
  explicit ConversionError(const std::string& message)
      : Error(ErrorCode::CONVERSION_FAILED, message) {}
};

class WorkbookError : public Error {
public:
  explicit WorkbookError(const std::string& message)
      : Error(ErrorCode::INVALID_WORKBOOK, message) {}
};

class MalformedRowError : public Error {
public:
  MalformedRowError(size_t row_number, size_t expected_width, size_t actual_width);

  size_t row_number() const { return row_number_; }
  size_t expected_width() const { return expected_width_; }
  size_t actual_width() const { return actual_width_; }

private:
  size_t row_number_;
  size_t expected_width_;
  size_t actual_width_;
};

class SchemaMismatchError : public Error {
public:
  explicit SchemaMismatchError(const std::string& message)
      : Error(ErrorCode::SCHEMA_MISMATCH, message) {}
};

class TableCreationError : public Error {
public:
  explicit TableCreationError(const std::string& message)
      : Error(ErrorCode::TABLE_CREATION, message) {}
};

/// Strict-mode abort. rows_written() reports what reached the destination
/// before the rejected row.
class ExportError : public Error {
public:
  ExportError(const std::string& message, size_t rows_written)
      : Error(ErrorCode::EXPORT_FAILED, message), rows_written_(rows_written) {}

  size_t rows_written() const { return rows_written_; }

private:
  size_t rows_written_;
};

/// Connection-fatal destination failure. Aborts the run in every mode.
class DestinationError : public Error {
public:
  explicit DestinationError(const std::string& message)
      : Error(ErrorCode::DESTINATION_FAILED, message) {}
};

// A row the destination refused (RowSkipped diagnostic)
struct RowRejection {
  size_t row_number; // 1-indexed data row
  std::string message;

  RowRejection(size_t row, const std::string& msg) : row_number(row), message(msg) {}

  std::string to_string() const;
};

// Accumulates rejected rows during an export. Only the first max_kept
// rejections keep their details; later ones are only counted.
class RejectionLog {
public:
  static constexpr size_t DEFAULT_MAX_KEPT = 1000;

  explicit RejectionLog(size_t max_kept = DEFAULT_MAX_KEPT) : max_kept_(max_kept) {}

  void add(const RowRejection& rejection) {
    ++count_;
    if (rejections_.size() < max_kept_)
      rejections_.push_back(rejection);
  }
  void add(size_t row_number, const std::string& message) {
    add(RowRejection(row_number, message));
  }

  bool empty() const { return count_ == 0; }
  // Every rejection added, including those whose details were dropped
  size_t count() const { return count_; }
  size_t dropped() const { return count_ - rejections_.size(); }
  const std::vector<RowRejection>& rejections() const { return rejections_; }

  // Human-readable summary (first max_details rows listed)
  std::string summary(size_t max_details = 20) const;

  void clear() {
    rejections_.clear();
    count_ = 0;
  }

private:
  size_t max_kept_;
  size_t count_ = 0;
  std::vector<RowRejection> rejections_;
};

} // namespace tabload
