/**
 * tabload - load text, CSV, XLSX and XLS sources into a columnar store
 *
 * Column names come from the first row (after -skip) unless -h supplies them;
 * column types are inferred from the data unless -t supplies them.
 */

#include "tabload/clickhouse_destination.h"
#include "tabload/error.h"
#include "tabload/ingest.h"
#include "tabload/logging.h"
#include "tabload/source_resolver.h"

#ifdef TABLOAD_ENABLE_ARROW
#include "tabload/arrow_destination.h"
#endif

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace std;

constexpr const char* VERSION = "0.1.0";

namespace {

enum OptionId {
  OPT_SOURCE = 1000,
  OPT_TYPE,
  OPT_TABLE,
  OPT_STORE,
  OPT_HOST,
  OPT_PORT,
  OPT_USER,
  OPT_PASSWORD,
  OPT_OUT,
  OPT_CAMEL,
  OPT_LOWER,
  OPT_IGNORE,
  OPT_SKIP,
  OPT_QUOTE,
  OPT_HEADERS,
  OPT_TYPES,
  OPT_SHEET,
  OPT_ROWS,
  OPT_COLS,
  OPT_DATES,
  OPT_BATCH,
  OPT_THRESHOLD,
  OPT_LOG_LEVEL,
  OPT_LOG_FILE,
  OPT_HELP,
  OPT_VERSION,
};

struct CliOptions {
  tabload::IngestConfig ingest;
  string format_token;
  string store = "clickhouse";
  tabload::ClickHouseOptions clickhouse;
  string out_dir = ".";
  tabload::LogOptions log;
  bool help = false;
  bool version = false;
};

void printVersion() { cout << "tabload " << VERSION << endl; }

void printUsage(const char* prog) {
  cerr << "tabload - load a tabular source into a columnar store\n\n";
  cerr << "Usage: " << prog << " -s <source> -type <type> -table <name> [options]\n\n";
  cerr << "Required:\n";
  cerr << "  -s <src>          File path or http(s) URL\n";
  cerr << "  -type <t>         Source type: text (tab separated), csv, xlsx, xls\n";
  cerr << "  -table <name>     Destination table (replaced if it exists)\n";
  cerr << "\nDestination:\n";
  cerr << "  -store <s>        clickhouse, parquet or feather (default: clickhouse)\n";
  cerr << "  -host <h>         ClickHouse host (default: 127.0.0.1)\n";
  cerr << "  -port <p>         ClickHouse HTTP port (default: 8123)\n";
  cerr << "  -user <u>         ClickHouse user (default: default)\n";
  cerr << "  -password <p>     ClickHouse password (default: empty)\n";
  cerr << "  -out <dir>        Output directory for parquet/feather (default: .)\n";
  cerr << "\nColumns:\n";
  cerr << "  -h 'a,b,c'        Column names; the source then has no header row\n";
  cerr << "  -t 's,i,f,d'      Column types: s String, i Int64, f Float64, d Date\n";
  cerr << "  -c Y/N            Convert header names to camel case (default: N)\n";
  cerr << "  -lower Y/N        Store lower-cased header names (default: N)\n";
  cerr << "  -dates <fmt>      Date pattern, e.g. %m/%d/%Y (default: common formats)\n";
  cerr << "  -threshold <x>    Share of cells that must parse to infer a type (default: "
       << tabload::DEFAULT_INFERENCE_THRESHOLD << ")\n";
  cerr << "\nReading:\n";
  cerr << "  -skip <n>         Rows to skip before the header (default: 0)\n";
  cerr << "  -q <char>         Quote character for text/csv; '' disables (default: \")\n";
  cerr << "  -sheet <name>     Worksheet for xlsx/xls (default: first sheet)\n";
  cerr << "  -rows S:E         0-based inclusive row range; E = 0 means to the end\n";
  cerr << "  -cols S:E         0-based inclusive column range; E = 0 means to the end\n";
  cerr << "\nExport:\n";
  cerr << "  -i Y/N            Skip rows the store rejects instead of stopping (default: N)\n";
  cerr << "  -batch <n>        Rows per insert, 0 for a single insert (default: "
       << tabload::DEFAULT_BATCH_SIZE << ")\n";
  cerr << "\nGeneral:\n";
  cerr << "  -log-level <l>    trace, debug, info, warn, error, off (default: info)\n";
  cerr << "  -log-file <path>  Also write the log to a file\n";
  cerr << "  -help             Show this help message\n";
  cerr << "  -version          Show version information\n";
  cerr << "\nExamples:\n";
  cerr << "  " << prog << " -s data.csv -type csv -table sales\n";
  cerr << "  " << prog << " -s book.xlsx -type xlsx -table t -rows 4:0 -cols 2:0 -skip 1\n";
  cerr << "  " << prog << " -s https://example.com/series.txt -type text -table series "
       << "-h 'id,name,value' -skip 1\n";
  cerr << "  " << prog << " -s data.txt -type text -table t -store parquet -out /tmp\n";
}

bool parseToggle(const string& option, const char* value) {
  string v(value);
  if (v == "Y" || v == "y")
    return true;
  if (v == "N" || v == "n")
    return false;
  throw tabload::ConfigurationError("-" + option + " must be Y or N, got '" + v + "'");
}

long parseInteger(const string& option, const char* value, long min, long max) {
  char* endptr;
  errno = 0;
  long val = strtol(value, &endptr, 10);
  if (*value == '\0' || *endptr != '\0' || errno == ERANGE || val < min || val > max)
    throw tabload::ConfigurationError("invalid value '" + string(value) + "' for -" + option);
  return val;
}

// "'a', b,c" -> {a, b, c}: blanks and single quotes are dropped
vector<string> parseList(const char* value) {
  string cleaned;
  for (const char* p = value; *p; ++p) {
    if (*p != ' ' && *p != '\t' && *p != '\'')
      cleaned += *p;
  }
  vector<string> items;
  if (cleaned.empty())
    return items;
  size_t start = 0;
  while (true) {
    size_t comma = cleaned.find(',', start);
    items.push_back(cleaned.substr(start, comma - start));
    if (comma == string::npos)
      break;
    start = comma + 1;
  }
  return items;
}

CliOptions parseArguments(int argc, char** argv) {
  static const struct option long_options[] = {
      {"s", required_argument, nullptr, OPT_SOURCE},
      {"type", required_argument, nullptr, OPT_TYPE},
      {"table", required_argument, nullptr, OPT_TABLE},
      {"store", required_argument, nullptr, OPT_STORE},
      {"host", required_argument, nullptr, OPT_HOST},
      {"port", required_argument, nullptr, OPT_PORT},
      {"user", required_argument, nullptr, OPT_USER},
      {"password", required_argument, nullptr, OPT_PASSWORD},
      {"out", required_argument, nullptr, OPT_OUT},
      {"c", required_argument, nullptr, OPT_CAMEL},
      {"lower", required_argument, nullptr, OPT_LOWER},
      {"i", required_argument, nullptr, OPT_IGNORE},
      {"skip", required_argument, nullptr, OPT_SKIP},
      {"q", required_argument, nullptr, OPT_QUOTE},
      {"h", required_argument, nullptr, OPT_HEADERS},
      {"t", required_argument, nullptr, OPT_TYPES},
      {"sheet", required_argument, nullptr, OPT_SHEET},
      {"rows", required_argument, nullptr, OPT_ROWS},
      {"cols", required_argument, nullptr, OPT_COLS},
      {"dates", required_argument, nullptr, OPT_DATES},
      {"batch", required_argument, nullptr, OPT_BATCH},
      {"threshold", required_argument, nullptr, OPT_THRESHOLD},
      {"log-level", required_argument, nullptr, OPT_LOG_LEVEL},
      {"log-file", required_argument, nullptr, OPT_LOG_FILE},
      {"help", no_argument, nullptr, OPT_HELP},
      {"version", no_argument, nullptr, OPT_VERSION},
      {nullptr, 0, nullptr, 0},
  };

  CliOptions opts;
  tabload::IngestConfig& cfg = opts.ingest;

  opterr = 0;
  int c;
  int current = optind; // argv index of the option being parsed, for messages
  while ((c = getopt_long_only(argc, argv, ":", long_options, nullptr)) != -1) {
    switch (c) {
    case OPT_SOURCE:
      cfg.source.identifier = optarg;
      break;
    case OPT_TYPE:
      opts.format_token = optarg;
      break;
    case OPT_TABLE:
      cfg.table = optarg;
      break;
    case OPT_STORE:
      opts.store = optarg;
      break;
    case OPT_HOST:
      opts.clickhouse.host = optarg;
      break;
    case OPT_PORT:
      opts.clickhouse.port = static_cast<uint16_t>(parseInteger("port", optarg, 1, 65535));
      break;
    case OPT_USER:
      opts.clickhouse.user = optarg;
      break;
    case OPT_PASSWORD:
      opts.clickhouse.password = optarg;
      break;
    case OPT_OUT:
      opts.out_dir = optarg;
      break;
    case OPT_CAMEL:
      cfg.naming.camel_case = parseToggle("c", optarg);
      break;
    case OPT_LOWER:
      cfg.naming.lowercase_names = parseToggle("lower", optarg);
      break;
    case OPT_IGNORE:
      cfg.export_options.tolerate_row_errors = parseToggle("i", optarg);
      break;
    case OPT_SKIP:
      cfg.source.skip = static_cast<size_t>(parseInteger("skip", optarg, 0, LONG_MAX));
      break;
    case OPT_QUOTE:
      if (strlen(optarg) > 1)
        throw tabload::ConfigurationError("quote character must be a single character");
      cfg.source.quote = optarg[0]; // '\0' for an empty argument disables quoting
      break;
    case OPT_HEADERS:
      cfg.names = parseList(optarg);
      break;
    case OPT_TYPES:
      cfg.type_tokens = parseList(optarg);
      break;
    case OPT_SHEET:
      cfg.source.sheet = optarg;
      break;
    case OPT_ROWS:
      tabload::parse_range_bounds(optarg, cfg.source.range.row_start, cfg.source.range.row_end);
      break;
    case OPT_COLS:
      tabload::parse_range_bounds(optarg, cfg.source.range.col_start, cfg.source.range.col_end);
      break;
    case OPT_DATES:
      cfg.date_pattern = optarg;
      break;
    case OPT_BATCH:
      cfg.export_options.batch_size =
          static_cast<size_t>(parseInteger("batch", optarg, 0, LONG_MAX));
      break;
    case OPT_THRESHOLD: {
      char* endptr;
      double val = strtod(optarg, &endptr);
      if (*optarg == '\0' || *endptr != '\0')
        throw tabload::ConfigurationError("invalid value '" + string(optarg) +
                                          "' for -threshold");
      cfg.inference.threshold = val;
      break;
    }
    case OPT_LOG_LEVEL:
      opts.log.level = tabload::parse_log_level(optarg);
      break;
    case OPT_LOG_FILE:
      opts.log.file = optarg;
      break;
    case OPT_HELP:
      opts.help = true;
      return opts;
    case OPT_VERSION:
      opts.version = true;
      return opts;
    case ':':
      throw tabload::ConfigurationError(string("missing value for ") + argv[current]);
    default:
      throw tabload::ConfigurationError(string("unknown option ") + argv[current]);
    }
    current = optind;
  }
  if (optind < argc)
    throw tabload::ConfigurationError(string("unexpected argument '") + argv[optind] + "'");

  if (cfg.source.identifier.empty())
    throw tabload::ConfigurationError("-s is required");
  if (opts.format_token.empty())
    throw tabload::ConfigurationError("-type is required");
  if (cfg.table.empty())
    throw tabload::ConfigurationError("-table is required");

  auto format = tabload::format_from_token(opts.format_token);
  if (!format)
    throw tabload::ConfigurationError("unknown source type '" + opts.format_token +
                                      "' (expected text, csv, xlsx or xls)");
  cfg.source.format = *format;

  if (opts.store != "clickhouse" && opts.store != "parquet" && opts.store != "feather")
    throw tabload::ConfigurationError("unknown store '" + opts.store +
                                      "' (expected clickhouse, parquet or feather)");
  if (!cfg.names.empty() && !cfg.type_tokens.empty() &&
      cfg.names.size() != cfg.type_tokens.size())
    throw tabload::SchemaMismatchError(to_string(cfg.type_tokens.size()) +
                                       " column types given for " +
                                       to_string(cfg.names.size()) + " columns");

  cfg.validate();
  return opts;
}

unique_ptr<tabload::Destination> makeDestination(const CliOptions& opts) {
  if (opts.store == "clickhouse")
    return make_unique<tabload::ClickHouseDestination>(opts.clickhouse);
#ifdef TABLOAD_ENABLE_ARROW
  auto format = opts.store == "parquet" ? tabload::ColumnarFormat::PARQUET
                                        : tabload::ColumnarFormat::FEATHER;
  return make_unique<tabload::ArrowTableDestination>(opts.out_dir, format);
#else
  throw tabload::ConfigurationError("-store " + opts.store +
                                    " is not available. This build was compiled without Arrow "
                                    "support.");
#endif
}

// Removes downloaded and converted files however the run ends
class ArtifactCleanup {
public:
  explicit ArtifactCleanup(tabload::SourceResolver& resolver) : resolver_(resolver) {}
  ~ArtifactCleanup() { resolver_.remove_temporary_artifacts(); }

  ArtifactCleanup(const ArtifactCleanup&) = delete;
  ArtifactCleanup& operator=(const ArtifactCleanup&) = delete;

private:
  tabload::SourceResolver& resolver_;
};

int runIngest(const CliOptions& opts) {
  auto destination = makeDestination(opts);

  tabload::SourceResolver resolver(make_shared<tabload::BeastHttpFetcher>(),
                                   make_shared<tabload::LibreOfficeConverter>());
  ArtifactCleanup cleanup(resolver);

  tabload::Ingestor ingestor(resolver);
  tabload::IngestReport report = ingestor.run(opts.ingest, *destination);

  if (opts.ingest.export_options.tolerate_row_errors && report.rows_skipped() > 0)
    cerr << report.result.rejections.summary() << endl;
  cout << tabload::format_elapsed(report.elapsed) << endl;
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  // Unbuffered stderr and line-buffered stdout keep popen() captures complete
  setvbuf(stderr, nullptr, _IONBF, 0);
  setvbuf(stdout, nullptr, _IOLBF, 0);

  CliOptions opts;
  try {
    opts = parseArguments(argc, argv);
  } catch (const tabload::Error& e) {
    cerr << "Error: " << e.what() << "\n\n";
    printUsage(argv[0]);
    return 1;
  }
  if (opts.help) {
    printUsage(argv[0]);
    return 0;
  }
  if (opts.version) {
    printVersion();
    return 0;
  }

  int result = 1;
  try {
    tabload::init_logging(opts.log);
    result = runIngest(opts);
  } catch (const tabload::ConfigurationError& e) {
    cerr << "Error: " << e.what() << "\n\n";
    printUsage(argv[0]);
  } catch (const tabload::Error& e) {
    tabload::logger()->error("[{}] {}", tabload::error_code_to_string(e.code()), e.what());
  } catch (const std::exception& e) {
    tabload::logger()->error("{}", e.what());
  }

  std::cout.flush();
  std::cerr.flush();
  fflush(stdout);
  fflush(stderr);
  return result;
}
