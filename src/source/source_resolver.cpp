#include "tabload/source_resolver.h"

#include "tabload/delimited_reader.h"
#include "tabload/error.h"
#include "tabload/io_util.h"
#include "tabload/logging.h"
#include "tabload/xlsx_workbook.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace tabload {

BeastHttpFetcher::BeastHttpFetcher(const HttpClientOptions& options) : client_(options) {}

std::string BeastHttpFetcher::fetch(const std::string& url) {
  HttpResponse res;
  try {
    res = client_.get(url);
  } catch (const HttpTransportError& e) {
    throw FetchError("could not fetch '" + url + "': " + e.what());
  }
  if (!res.ok())
    throw FetchError("could not fetch '" + url + "': HTTP " + std::to_string(res.status) + " " +
                     res.reason);
  return std::move(res.body);
}

SourceResolver::SourceResolver(std::shared_ptr<HttpFetcher> fetcher,
                               std::shared_ptr<SpreadsheetConverter> converter)
    : fetcher_(std::move(fetcher)), converter_(std::move(converter)) {}

SourceResolver::~SourceResolver() { remove_temporary_artifacts(); }

const fs::path& SourceResolver::work_dir() {
  if (work_dir_.empty())
    work_dir_ = make_temp_directory("tabload");
  return work_dir_;
}

std::shared_ptr<const std::string> SourceResolver::fetch_body(const std::string& url) {
  auto it = bodies_.find(url);
  if (it != bodies_.end()) {
    logger()->debug("reusing fetched body of {}", url);
    return it->second;
  }
  if (!fetcher_)
    throw FetchError("no HTTP fetcher configured for '" + url + "'");

  logger()->info("fetching {}", url);
  auto body = std::make_shared<const std::string>(fetcher_->fetch(url));
  logger()->debug("fetched {} bytes from {}", body->size(), url);
  bodies_.emplace(url, body);
  return body;
}

std::shared_ptr<const std::string> SourceResolver::convert_legacy(const SourceSpec& spec) {
  auto it = converted_.find(spec.identifier);
  if (it != converted_.end())
    return it->second;

#ifndef __linux__
  throw ConversionError("legacy .xls sources are only supported on Linux");
#endif
  if (!converter_)
    throw ConversionError("no spreadsheet converter configured");

  fs::path source;
  if (is_url(spec.identifier)) {
    // Converter only works on files: persist the download first
    auto body = fetch_body(spec.identifier);
    source = work_dir() / "download.xls";
    write_file(source, *body);
    artifacts_.push_back(source);
  } else {
    source = spec.identifier;
    std::error_code ec;
    if (!fs::is_regular_file(source, ec))
      throw NotFoundError("source not found: '" + spec.identifier + "'");
  }

  logger()->info("converting {} to xlsx", source.string());
  fs::path converted = converter_->convert(source, work_dir());
  artifacts_.push_back(converted);
  auto bytes = std::make_shared<const std::string>(read_file(converted));
  converted_.emplace(spec.identifier, bytes);
  return bytes;
}

std::shared_ptr<const std::string> SourceResolver::xlsx_bytes(const SourceSpec& spec) {
  if (spec.format == SourceFormat::XLS)
    return convert_legacy(spec);
  if (is_url(spec.identifier))
    return fetch_body(spec.identifier);
  return std::make_shared<const std::string>(read_file(spec.identifier));
}

std::unique_ptr<RowReader> SourceResolver::resolve(const SourceSpec& spec) {
  logger()->debug("resolving {} source {}", source_format_to_string(spec.format),
                  spec.identifier);

  if (spec.format == SourceFormat::TEXT || spec.format == SourceFormat::CSV) {
    std::unique_ptr<std::istream> input;
    if (is_url(spec.identifier)) {
      input = std::make_unique<std::istringstream>(*fetch_body(spec.identifier));
    } else {
      auto file = std::make_unique<std::ifstream>(spec.identifier, std::ios::binary);
      std::error_code ec;
      if (!*file || fs::is_directory(spec.identifier, ec))
        throw NotFoundError("source not found: '" + spec.identifier + "'");
      input = std::move(file);
    }
    DelimitedOptions options;
    options.separator = default_separator(spec.format);
    options.quote = spec.quote;
    options.skip = spec.skip;
    return std::make_unique<DelimitedReader>(std::move(input), options);
  }

  auto bytes = xlsx_bytes(spec);
  XlsxWorkbook workbook(*bytes);
  SheetGrid grid = workbook.sheet(spec.sheet);
  return std::make_unique<SpreadsheetReader>(std::move(grid), spec.range, spec.skip);
}

void SourceResolver::remove_temporary_artifacts() {
  std::error_code ec;
  for (const auto& path : artifacts_) {
    fs::remove(path, ec);
    if (ec)
      logger()->warn("could not remove temporary file {}: {}", path.string(), ec.message());
  }
  artifacts_.clear();
  if (!work_dir_.empty()) {
    fs::remove_all(work_dir_, ec);
    if (ec)
      logger()->warn("could not remove temporary directory {}: {}", work_dir_.string(),
                     ec.message());
    work_dir_.clear();
  }
}

} // namespace tabload
