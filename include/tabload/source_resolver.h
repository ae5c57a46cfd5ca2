#pragma once

#include "tabload/http_client.h"
#include "tabload/row_reader.h"
#include "tabload/spreadsheet_reader.h"
#include "tabload/types.h"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tabload {

/// Where and how to read a source. Immutable once built.
struct SourceSpec {
  std::string identifier; // local path or http(s) URL
  SourceFormat format = SourceFormat::TEXT;
  char quote = '"';       // delimited formats only; '\0' disables quoting
  size_t skip = 0;        // leading rows to drop
  CellRange range;        // spreadsheet formats only
  std::string sheet;      // spreadsheet formats only; empty = first sheet
};

/// Retrieves the full body of a URL.
class HttpFetcher {
public:
  virtual ~HttpFetcher() = default;

  /// Throws FetchError on any failure, including non-2xx responses.
  virtual std::string fetch(const std::string& url) = 0;
};

/// HttpFetcher backed by HttpClient.
class BeastHttpFetcher : public HttpFetcher {
public:
  explicit BeastHttpFetcher(const HttpClientOptions& options = HttpClientOptions());

  std::string fetch(const std::string& url) override;

private:
  HttpClient client_;
};

/// Converts a legacy .xls workbook to .xlsx.
class SpreadsheetConverter {
public:
  virtual ~SpreadsheetConverter() = default;

  /// Write the converted workbook into out_dir and return its path.
  /// Throws ConversionError.
  virtual std::filesystem::path convert(const std::filesystem::path& xls,
                                        const std::filesystem::path& out_dir) = 0;
};

/// Runs `libreoffice --headless --convert-to xlsx`. Linux only; elsewhere
/// every conversion raises ConversionError.
class LibreOfficeConverter : public SpreadsheetConverter {
public:
  std::filesystem::path convert(const std::filesystem::path& xls,
                                const std::filesystem::path& out_dir) override;
};

/// First executable named `command` on PATH, or an empty string.
std::string find_executable_in_path(const std::string& command);

/// Turns a SourceSpec into a RowReader.
///
/// Fetched bodies and converted workbooks are kept for the life of the
/// resolver, so resolving the same spec again (the second pass) reuses them.
/// Temporary files are recorded and removed by remove_temporary_artifacts()
/// or the destructor.
class SourceResolver {
public:
  SourceResolver(std::shared_ptr<HttpFetcher> fetcher,
                 std::shared_ptr<SpreadsheetConverter> converter);
  ~SourceResolver();

  SourceResolver(const SourceResolver&) = delete;
  SourceResolver& operator=(const SourceResolver&) = delete;

  /// Throws NotFoundError, FetchError, ConversionError, WorkbookError or
  /// ConfigurationError (unknown sheet, bad range).
  std::unique_ptr<RowReader> resolve(const SourceSpec& spec);

  const std::vector<std::filesystem::path>& temporary_artifacts() const { return artifacts_; }

  /// Best-effort removal; failures are logged.
  void remove_temporary_artifacts();

private:
  std::shared_ptr<const std::string> fetch_body(const std::string& url);
  std::shared_ptr<const std::string> xlsx_bytes(const SourceSpec& spec);
  std::shared_ptr<const std::string> convert_legacy(const SourceSpec& spec);
  const std::filesystem::path& work_dir();

  std::shared_ptr<HttpFetcher> fetcher_;
  std::shared_ptr<SpreadsheetConverter> converter_;
  std::map<std::string, std::shared_ptr<const std::string>> bodies_;
  std::map<std::string, std::shared_ptr<const std::string>> converted_;
  std::filesystem::path work_dir_;
  std::vector<std::filesystem::path> artifacts_;
};

} // namespace tabload
