#pragma once

#include "tabload/types.h"

#include <cstddef>
#include <optional>

namespace tabload {

/// Lazy, finite, one-pass stream of RawRows.
///
/// Concrete readers implement read_row(); this class applies the leading
/// skip and enforces the fixed row width. The width is set by the first row
/// observed after the skip (the header row counts), and any later row of a
/// different width raises MalformedRowError.
class RowReader {
public:
  explicit RowReader(size_t skip = 0) : skip_(skip) {}
  virtual ~RowReader() = default;

  RowReader(const RowReader&) = delete;
  RowReader& operator=(const RowReader&) = delete;

  /// Next row, or nullopt at end of stream.
  std::optional<RawRow> next();

  /// Consume the next row as column names. Returns an empty row when the
  /// stream has no rows. Must be called before any data row is read.
  RawRow read_header();

  /// Established row width; 0 before the first row.
  size_t width() const { return width_; }

  /// Rows consumed from the source so far, skipped rows included.
  size_t rows_consumed() const { return rows_consumed_; }

  /// Data rows returned by next() so far.
  size_t data_rows() const { return data_rows_; }

protected:
  /// Produce the next physical row, or nullopt at end of stream.
  virtual std::optional<RawRow> read_row() = 0;

private:
  std::optional<RawRow> read_checked();

  size_t skip_;
  bool skipped_ = false;
  size_t width_ = 0;
  size_t rows_consumed_ = 0;
  size_t data_rows_ = 0;
};

} // namespace tabload
