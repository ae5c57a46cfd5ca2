#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace tabload {

/// Sparse grid of cell text for one worksheet. Coordinates are 0-based.
struct SheetGrid {
  std::map<size_t, std::map<size_t, std::string>> rows;
  size_t max_row = 0; // valid only when !empty()
  size_t max_col = 0;

  bool empty() const { return rows.empty(); }

  void set(size_t row, size_t col, std::string value);

  /// Cell text, or nullptr when the cell is absent.
  const std::string* cell(size_t row, size_t col) const;
};

/// Spreadsheet document: an ordered list of sheets.
class Workbook {
public:
  virtual ~Workbook() = default;

  virtual std::vector<std::string> sheet_names() const = 0;

  /// Cell text of a sheet. An empty name selects the first sheet.
  /// Throws ConfigurationError if the sheet does not exist.
  virtual SheetGrid sheet(const std::string& name) const = 0;
};

} // namespace tabload
