#pragma once

#include "tabload/row_reader.h"
#include "tabload/workbook.h"

#include <cstddef>
#include <string>

namespace tabload {

/// Inclusive, 0-based rectangle of cells. An end of 0 means "to the last
/// populated row/column of the sheet".
struct CellRange {
  size_t row_start = 0;
  size_t row_end = 0;
  size_t col_start = 0;
  size_t col_end = 0;

  /// Throws ConfigurationError when a bounded end precedes its start.
  void validate() const;
};

/// Parse "S:E" (both non-negative integers). Throws ConfigurationError.
void parse_range_bounds(const std::string& text, size_t& start, size_t& end);

/// Reader over one worksheet restricted to a CellRange.
///
/// Every row spans the full column range; absent cells are empty strings.
/// Rows with no populated cell inside the range are not returned.
class SpreadsheetReader : public RowReader {
public:
  SpreadsheetReader(SheetGrid grid, const CellRange& range, size_t skip = 0);

  /// Resolved last row/column (after applying "0 = unbounded").
  size_t last_row() const { return last_row_; }
  size_t last_col() const { return last_col_; }

protected:
  std::optional<RawRow> read_row() override;

private:
  SheetGrid grid_;
  CellRange range_;
  size_t last_row_ = 0;
  size_t last_col_ = 0;
  size_t next_row_ = 0;
  bool exhausted_ = false;
};

} // namespace tabload
