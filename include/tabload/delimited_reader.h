#pragma once

#include "tabload/row_reader.h"

#include <istream>
#include <memory>

namespace tabload {

struct DelimitedOptions {
  char separator = '\t';
  char quote = '"'; // '\0' disables quoting
  size_t skip = 0;
};

/// Reader for tab- and comma-delimited text.
///
/// Inside a quoted span separators and line breaks are literal and a doubled
/// quote yields one quote character. Every CR byte is discarded, so CRLF and
/// LF files read the same. Blank lines are ignored, except once the width is
/// known to be one column: there a blank line is a row with one empty cell.
class DelimitedReader : public RowReader {
public:
  DelimitedReader(std::unique_ptr<std::istream> input, const DelimitedOptions& options);

protected:
  std::optional<RawRow> read_row() override;

private:
  std::unique_ptr<std::istream> input_;
  DelimitedOptions options_;
};

} // namespace tabload
