/**
 * @file ingest_test.cpp
 * @brief End-to-end ingestion runs against an in-memory destination.
 */

#include "tabload/error.h"
#include "tabload/ingest.h"

#include "test_helpers.h"

#include <cfloat>
#include <climits>
#include <gtest/gtest.h>

using namespace tabload;
using tabload_test::build_xlsx;
using tabload_test::FakeConverter;
using tabload_test::FakeFetcher;
using tabload_test::RecordingDestination;
using tabload_test::SheetBuilder;
using tabload_test::TempDir;

class IngestTest : public ::testing::Test {
protected:
  IngestConfig csv_config(const std::string& content) {
    IngestConfig config;
    config.source.identifier = dir.write("input.csv", content);
    config.source.format = SourceFormat::CSV;
    config.table = "people";
    return config;
  }

  IngestReport run(const IngestConfig& config) {
    SourceResolver resolver(fetcher, converter);
    Ingestor ingestor(resolver);
    return ingestor.run(config, destination);
  }

  TempDir dir;
  std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
  std::shared_ptr<FakeConverter> converter = std::make_shared<FakeConverter>(std::string());
  RecordingDestination destination;
};

// =============================================================================
// Header and inference
// =============================================================================

TEST_F(IngestTest, HeaderNamesAndInferredTypes) {
  IngestReport report = run(csv_config("id,price,when,label\n"
                                       "1,2.5,2023-01-15,a\n"
                                       "2,,2023-02-01,b\n"
                                       "3,4,2023-03-01,c\n"));

  EXPECT_EQ(report.table, "people");
  EXPECT_EQ(report.columns, 4u);
  EXPECT_TRUE(report.inferred_types);
  EXPECT_EQ(report.result.rows_read, 3u);
  EXPECT_EQ(report.result.rows_written, 3u);

  EXPECT_EQ(destination.table, "people");
  EXPECT_EQ(destination.key, "id");
  EXPECT_EQ(destination.columns, (std::vector<std::string>{"id", "price", "when", "label"}));
  EXPECT_EQ(destination.types,
            (std::vector<SemanticType>{SemanticType::INT64, SemanticType::FLOAT64,
                                       SemanticType::DATE, SemanticType::STRING}));

  ASSERT_EQ(destination.rows.size(), 3u);
  EXPECT_EQ(std::get<int64_t>(destination.rows[0][0]), 1);
  EXPECT_DOUBLE_EQ(std::get<double>(destination.rows[0][1]), 2.5);
  EXPECT_EQ(std::get<Date>(destination.rows[0][2]), date_from_civil(2023, 1, 15));
  EXPECT_EQ(std::get<double>(destination.rows[1][1]), DBL_MAX);
  EXPECT_EQ(std::get<std::string>(destination.rows[2][3]), "c");
}

TEST_F(IngestTest, CamelCaseAndReservedNames) {
  IngestConfig config = csv_config("Index,First Name\n1,x\n");
  config.naming.camel_case = true;
  run(config);
  EXPECT_EQ(destination.columns, (std::vector<std::string>{"index1", "firstName"}));
  EXPECT_EQ(destination.key, "index1");
}

TEST_F(IngestTest, SkipBeforeHeader) {
  IngestConfig config = csv_config("Report generated 2024-05-01\nid,v\n1,2\n3,4\n");
  config.source.skip = 1;
  IngestReport report = run(config);
  EXPECT_EQ(destination.columns, (std::vector<std::string>{"id", "v"}));
  EXPECT_EQ(report.result.rows_written, 2u);
}

TEST_F(IngestTest, HeaderWithSuppliedTypes) {
  IngestConfig config = csv_config("zip,city\n02134,Boston\n");
  config.type_tokens = {"s", "s"};
  IngestReport report = run(config);
  EXPECT_FALSE(report.inferred_types);
  ASSERT_EQ(destination.rows.size(), 1u);
  EXPECT_EQ(std::get<std::string>(destination.rows[0][0]), "02134");
}

TEST_F(IngestTest, EmptySourceHasNoHeader) {
  EXPECT_THROW(run(csv_config("")), SchemaMismatchError);
  EXPECT_TRUE(destination.table.empty());
}

// =============================================================================
// Supplied names
// =============================================================================

TEST_F(IngestTest, SuppliedNamesAndTypesReadEveryRow) {
  IngestConfig config;
  config.source.identifier = dir.write("input.txt", "x\t1\ny\tzz\n");
  config.source.format = SourceFormat::TEXT;
  config.table = "t";
  config.names = {"label", "n"};
  config.type_tokens = {"s", "i"};

  IngestReport report = run(config);
  EXPECT_EQ(report.result.rows_written, 2u);
  ASSERT_EQ(destination.rows.size(), 2u);
  EXPECT_EQ(std::get<std::string>(destination.rows[0][0]), "x");
  EXPECT_EQ(std::get<int64_t>(destination.rows[0][1]), 1);
  EXPECT_EQ(std::get<int64_t>(destination.rows[1][1]), INT64_MAX);
}

TEST_F(IngestTest, SuppliedNamesWithInference) {
  IngestConfig config = csv_config("1,2020-01-01\n2,2020-01-02\n");
  config.names = {"n", "day"};
  IngestReport report = run(config);
  EXPECT_TRUE(report.inferred_types);
  EXPECT_EQ(destination.types, (std::vector<SemanticType>{SemanticType::INT64, SemanticType::DATE}));
  EXPECT_EQ(report.result.rows_written, 2u);
}

TEST_F(IngestTest, NameTypeCountMismatchBeforeAnyIo) {
  IngestConfig config;
  config.source.identifier = (dir.path() / "does-not-exist.csv").string();
  config.source.format = SourceFormat::CSV;
  config.table = "t";
  config.names = {"a", "b", "c"};
  config.type_tokens = {"s", "i"};
  EXPECT_THROW(run(config), SchemaMismatchError);
}

TEST_F(IngestTest, SuppliedNamesWiderThanRows) {
  IngestConfig config = csv_config("1,2\n3,4\n");
  config.names = {"a", "b", "c"};
  EXPECT_THROW(run(config), SchemaMismatchError);
}

// =============================================================================
// Options and failures
// =============================================================================

TEST_F(IngestTest, CustomDatePattern) {
  IngestConfig config = csv_config("day\n15.01.2023\n16.01.2023\n");
  config.date_pattern = "%d.%m.%Y";
  run(config);
  EXPECT_EQ(destination.types, (std::vector<SemanticType>{SemanticType::DATE}));
  EXPECT_EQ(std::get<Date>(destination.rows[1][0]), date_from_civil(2023, 1, 16));
}

TEST_F(IngestTest, TolerantRunReportsSkippedRows) {
  IngestConfig config = csv_config("id\n1\n2\n3\n4\n");
  config.export_options.tolerate_row_errors = true;
  destination.reject = [](size_t row) { return row == 2; };
  IngestReport report = run(config);
  EXPECT_EQ(report.rows_skipped(), 1u);
  EXPECT_EQ(report.result.rows_written, 3u);
}

TEST_F(IngestTest, StrictRunAborts) {
  IngestConfig config = csv_config("id\n1\n2\n3\n");
  destination.reject = [](size_t row) { return row == 2; };
  EXPECT_THROW(run(config), ExportError);
  EXPECT_EQ(destination.rows.size(), 1u);
}

TEST_F(IngestTest, TableCreationFailure) {
  destination.fail_create = true;
  EXPECT_THROW(run(csv_config("id\n1\n")), TableCreationError);
}

TEST_F(IngestTest, RemoteWorkbookFetchedOnce) {
  SheetBuilder sheet("Prices");
  sheet.rows(1, 0, {{"item", "cost"}, {"tea", "3"}, {"cake", "4.5"}});
  const std::string url = "https://data.example.com/prices.xlsx";
  fetcher->serve(url, build_xlsx({sheet}));

  IngestConfig config;
  config.source.identifier = url;
  config.source.format = SourceFormat::XLSX;
  config.source.range.row_start = 1;
  config.table = "prices";

  IngestReport report = run(config);
  EXPECT_EQ(fetcher->calls(url), 1);
  EXPECT_EQ(destination.columns, (std::vector<std::string>{"item", "cost"}));
  EXPECT_EQ(destination.types,
            (std::vector<SemanticType>{SemanticType::STRING, SemanticType::FLOAT64}));
  EXPECT_EQ(report.result.rows_written, 2u);
}

TEST(IngestConfigTest, Validation) {
  IngestConfig config;
  config.source.identifier = "in.csv";
  config.table = "t";
  EXPECT_NO_THROW(config.validate());

  IngestConfig no_source = config;
  no_source.source.identifier.clear();
  EXPECT_THROW(no_source.validate(), ConfigurationError);

  IngestConfig no_table = config;
  no_table.table.clear();
  EXPECT_THROW(no_table.validate(), ConfigurationError);

  IngestConfig zero = config;
  zero.inference.threshold = 0.0;
  EXPECT_THROW(zero.validate(), ConfigurationError);

  IngestConfig over = config;
  over.inference.threshold = 1.5;
  EXPECT_THROW(over.validate(), ConfigurationError);

  IngestConfig bad_token = config;
  bad_token.type_tokens = {"s", "int"};
  EXPECT_THROW(bad_token.validate(), ConfigurationError);

  IngestConfig bad_range = config;
  bad_range.source.format = SourceFormat::XLSX;
  bad_range.source.range.row_start = 9;
  bad_range.source.range.row_end = 3;
  EXPECT_THROW(bad_range.validate(), ConfigurationError);
}

TEST(FormatElapsedTest, MinutesAndSeconds) {
  EXPECT_EQ(format_elapsed(std::chrono::seconds(125)), "elapsed time: 2 minutes 5 seconds");
  EXPECT_EQ(format_elapsed(std::chrono::milliseconds(999)), "elapsed time: 0 minutes 0 seconds");
}
