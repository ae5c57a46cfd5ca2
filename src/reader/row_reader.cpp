#include "tabload/row_reader.h"

#include "tabload/error.h"

namespace tabload {

std::optional<RawRow> RowReader::read_checked() {
  if (!skipped_) {
    skipped_ = true;
    for (size_t i = 0; i < skip_; ++i) {
      if (!read_row())
        return std::nullopt;
      ++rows_consumed_;
    }
  }

  auto row = read_row();
  if (!row)
    return std::nullopt;
  ++rows_consumed_;

  if (width_ == 0) {
    width_ = row->size();
  } else if (row->size() != width_) {
    throw MalformedRowError(rows_consumed_, width_, row->size());
  }
  return row;
}

std::optional<RawRow> RowReader::next() {
  auto row = read_checked();
  if (row)
    ++data_rows_;
  return row;
}

RawRow RowReader::read_header() {
  auto row = read_checked();
  if (!row)
    return {};
  return std::move(*row);
}

} // namespace tabload
