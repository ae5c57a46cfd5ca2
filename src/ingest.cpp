#include "tabload/ingest.h"

#include "tabload/logging.h"
#include "tabload/value_coercer.h"

#include <optional>

namespace tabload {

void IngestConfig::validate() const {
  if (source.identifier.empty())
    throw ConfigurationError("no source given");
  if (table.empty())
    throw ConfigurationError("no destination table given");
  if (!(inference.threshold > 0.0 && inference.threshold <= 1.0))
    throw ConfigurationError("inference threshold must be in (0, 1], got " +
                             std::to_string(inference.threshold));
  for (const auto& token : type_tokens) {
    if (!type_from_token(token))
      throw ConfigurationError("unknown column type '" + token + "' (expected s, i, f or d)");
  }
  if (source.format == SourceFormat::XLSX || source.format == SourceFormat::XLS)
    source.range.validate();
}

IngestReport Ingestor::run(const IngestConfig& config, Destination& destination) {
  config.validate();
  const auto start = std::chrono::steady_clock::now();
  logger()->info("loading {} source {} into {} ({})", source_format_to_string(config.source.format),
                 config.source.identifier, config.table, destination.describe());

  const DateParser dates =
      config.date_pattern.empty() ? DateParser() : DateParser(config.date_pattern);

  // Supplied names and types are checked against each other before the
  // source is touched.
  std::optional<SchemaBuilder> builder;
  if (!config.names.empty()) {
    builder = SchemaBuilder::from_names(config.names);
    if (!config.type_tokens.empty())
      builder->apply_type_tokens(config.type_tokens);
  }

  auto reader = resolver_.resolve(config.source);
  const bool has_header = config.names.empty();
  if (has_header) {
    RawRow header = reader->read_header();
    if (header.empty())
      throw SchemaMismatchError("source " + config.source.identifier + " has no header row");
    builder = SchemaBuilder::from_header(header, config.naming);
    if (!config.type_tokens.empty())
      builder->apply_type_tokens(config.type_tokens);
  }

  IngestReport report;
  report.table = config.table;
  report.inferred_types = config.type_tokens.empty();
  if (report.inferred_types) {
    TypeInference inference(dates, config.inference);
    inference.infer(*reader, *builder);
    const auto scanned = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    logger()->info("inferred column types from {} rows in {} ms", inference.rows_scanned(),
                   scanned.count());

    // Inference consumed the stream: start the second pass over
    reader = resolver_.resolve(config.source);
    if (has_header)
      reader->read_header();
  }

  const TableSchema schema = builder->build();
  report.columns = schema.size();
  logger()->info("schema: {}", schema.to_string());

  destination.create_table(config.table, schema);

  ValueCoercer coercer(schema, dates);
  ExportEngine engine(config.export_options);
  report.result = engine.run(*reader, coercer, destination);
  report.elapsed = std::chrono::steady_clock::now() - start;
  return report;
}

std::string format_elapsed(std::chrono::steady_clock::duration elapsed) {
  const auto total = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
  return "elapsed time: " + std::to_string(total / 60) + " minutes " +
         std::to_string(total % 60) + " seconds";
}

} // namespace tabload
