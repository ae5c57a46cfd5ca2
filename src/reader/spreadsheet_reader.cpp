#include "tabload/spreadsheet_reader.h"

#include "tabload/error.h"

#include <cerrno>
#include <cstdlib>

namespace tabload {

void CellRange::validate() const {
  if (row_end != 0 && row_end < row_start)
    throw ConfigurationError("row range end " + std::to_string(row_end) + " precedes start " +
                             std::to_string(row_start));
  if (col_end != 0 && col_end < col_start)
    throw ConfigurationError("column range end " + std::to_string(col_end) +
                             " precedes start " + std::to_string(col_start));
}

static size_t parse_bound(const std::string& text, const std::string& whole) {
  if (text.empty() || text[0] == '-' || text[0] == '+')
    throw ConfigurationError("invalid range '" + whole + "': expected START:END");
  char* endptr = nullptr;
  errno = 0;
  unsigned long long val = std::strtoull(text.c_str(), &endptr, 10);
  if (*endptr != '\0' || errno == ERANGE)
    throw ConfigurationError("invalid range '" + whole + "': expected START:END");
  return static_cast<size_t>(val);
}

void parse_range_bounds(const std::string& text, size_t& start, size_t& end) {
  auto colon = text.find(':');
  if (colon == std::string::npos)
    throw ConfigurationError("invalid range '" + text + "': expected START:END");
  start = parse_bound(text.substr(0, colon), text);
  end = parse_bound(text.substr(colon + 1), text);
  if (end != 0 && end < start)
    throw ConfigurationError("invalid range '" + text + "': end precedes start");
}

SpreadsheetReader::SpreadsheetReader(SheetGrid grid, const CellRange& range, size_t skip)
    : RowReader(skip), grid_(std::move(grid)), range_(range) {
  range_.validate();
  if (grid_.empty()) {
    exhausted_ = true;
    return;
  }
  last_row_ = range_.row_end == 0 ? grid_.max_row : range_.row_end;
  last_col_ = range_.col_end == 0 ? grid_.max_col : range_.col_end;
  if (range_.row_start > last_row_ || range_.col_start > last_col_)
    exhausted_ = true;
  next_row_ = range_.row_start;
}

std::optional<RawRow> SpreadsheetReader::read_row() {
  while (!exhausted_) {
    auto it = grid_.rows.lower_bound(next_row_);
    if (it == grid_.rows.end() || it->first > last_row_) {
      exhausted_ = true;
      break;
    }
    next_row_ = it->first + 1;

    const auto& cells = it->second;
    auto first = cells.lower_bound(range_.col_start);
    if (first == cells.end() || first->first > last_col_)
      continue; // nothing populated inside the column range

    RawRow row(last_col_ - range_.col_start + 1);
    for (auto c = first; c != cells.end() && c->first <= last_col_; ++c)
      row[c->first - range_.col_start] = c->second;
    return row;
  }
  return std::nullopt;
}

} // namespace tabload
