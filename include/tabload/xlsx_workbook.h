#pragma once

#include "tabload/workbook.h"
#include "tabload/zip_archive.h"

#include <cstdint>
#include <string>
#include <vector>

namespace tabload {

/// Office Open XML workbook (.xlsx).
///
/// Cells are rendered as text: shared and inline strings verbatim, booleans as
/// TRUE/FALSE, numbers as stored, and numbers carrying a date number format as
/// YYYY-MM-DD (with HH:MM:SS when the serial has a time part).
class XlsxWorkbook : public Workbook {
public:
  struct SheetRef {
    std::string name;
    std::string part; // path inside the package, e.g. xl/worksheets/sheet1.xml
  };

  /// Throws WorkbookError if the package or its workbook part is unreadable.
  explicit XlsxWorkbook(std::string bytes);

  std::vector<std::string> sheet_names() const override;
  SheetGrid sheet(const std::string& name) const override;

  const std::vector<SheetRef>& sheets() const { return sheets_; }

private:
  void load_workbook();
  void load_shared_strings();
  void load_styles();
  SheetGrid parse_sheet(const std::string& part) const;

  ZipArchive archive_;
  std::vector<SheetRef> sheets_;
  std::vector<std::string> shared_strings_;
  std::vector<bool> date_styles_; // indexed by cell style (cellXfs position)
};

/// Render an Excel serial date (1900 date system) as YYYY-MM-DD or
/// YYYY-MM-DD HH:MM:SS when a time of day is present.
std::string excel_serial_to_string(double serial);

/// True for built-in date format ids and custom format codes that contain
/// day or year fields.
bool is_date_number_format(int format_id, const std::string& format_code);

} // namespace tabload
