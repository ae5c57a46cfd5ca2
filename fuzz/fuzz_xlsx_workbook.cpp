/**
 * @file fuzz_xlsx_workbook.cpp
 * @brief LibFuzzer target for the ZIP container and workbook XML parser.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "tabload/error.h"
#include "tabload/spreadsheet_reader.h"
#include "tabload/xlsx_workbook.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    constexpr size_t MAX_INPUT_SIZE = 256 * 1024;
    if (size > MAX_INPUT_SIZE) return 0;

    std::string bytes(reinterpret_cast<const char*>(data), size);
    try {
        tabload::XlsxWorkbook book(bytes);
        tabload::SpreadsheetReader reader(book.sheet(""), tabload::CellRange{});
        while (reader.next()) {
        }
    } catch (const tabload::Error&) {
        // WorkbookError and ConfigurationError are the expected outcomes
    }
    return 0;
}
