#pragma once

#include "tabload/destination.h"
#include "tabload/export_engine.h"
#include "tabload/schema.h"
#include "tabload/source_resolver.h"
#include "tabload/type_inference.h"

#include <chrono>
#include <string>
#include <vector>

namespace tabload {

/// Everything one ingestion run needs, as validated configuration.
struct IngestConfig {
  SourceSpec source;
  std::string table;
  std::vector<std::string> names;       // empty: read names from the header row
  std::vector<std::string> type_tokens; // empty: infer types
  NamingOptions naming;
  std::string date_pattern; // empty: DateParser::default_patterns()
  InferenceOptions inference;
  ExportOptions export_options;

  /// Throws ConfigurationError for a missing source or table, a bad range,
  /// an unknown type token or a threshold outside (0, 1].
  void validate() const;
};

struct IngestReport {
  std::string table;
  size_t columns = 0;
  bool inferred_types = false;
  ExportResult result;
  std::chrono::steady_clock::duration elapsed{};

  size_t rows_skipped() const { return result.rows_skipped; }
};

/// Runs the whole pipeline: resolve, build the schema (inferring types in a
/// first pass when none were supplied), create the table, then resolve the
/// source again and export it.
class Ingestor {
public:
  explicit Ingestor(SourceResolver& resolver) : resolver_(resolver) {}

  IngestReport run(const IngestConfig& config, Destination& destination);

private:
  SourceResolver& resolver_;
};

/// "elapsed time: M minutes S seconds"
std::string format_elapsed(std::chrono::steady_clock::duration elapsed);

} // namespace tabload
