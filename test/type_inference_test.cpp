/**
 * @file type_inference_test.cpp
 * @brief Tests for per-column type inference over a full scan.
 */

#include "tabload/error.h"
#include "tabload/type_inference.h"

#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace tabload;
using tabload_test::VectorReader;

namespace {

std::vector<RawRow> column_of(const std::vector<std::string>& cells) {
  std::vector<RawRow> rows;
  rows.reserve(cells.size());
  for (const auto& c : cells)
    rows.push_back(RawRow{c});
  return rows;
}

std::vector<std::string> repeated(size_t ints, size_t strings) {
  std::vector<std::string> cells;
  for (size_t i = 0; i < ints; ++i)
    cells.push_back(std::to_string(i * 3));
  for (size_t i = 0; i < strings; ++i)
    cells.push_back("n/a");
  return cells;
}

SemanticType infer_single(const std::vector<std::string>& cells) {
  DateParser dates;
  TypeInference inference(dates);
  VectorReader reader(column_of(cells));
  auto stats = inference.scan(reader, 1);
  return stats[0].dominant_type();
}

} // namespace

TEST(ColumnTypeStatsTest, CountsEachParserIndependently) {
  DateParser dates;
  ColumnTypeStats stats;
  stats.add("20230101", dates);
  stats.add("", dates);
  stats.add("2.5", dates);

  EXPECT_EQ(stats.total_count, 3u);
  EXPECT_EQ(stats.empty_count, 1u);
  EXPECT_EQ(stats.non_empty(), 2u);
  EXPECT_EQ(stats.date_count, 1u);
  EXPECT_EQ(stats.int64_count, 1u);
  EXPECT_EQ(stats.float64_count, 2u);
}

TEST(TypeInferenceTest, ThresholdIsInclusive) {
  EXPECT_EQ(infer_single(repeated(95, 5)), SemanticType::INT64);
}

TEST(TypeInferenceTest, BelowThresholdFallsBackToString) {
  EXPECT_EQ(infer_single(repeated(949, 51)), SemanticType::STRING);
}

TEST(TypeInferenceTest, CompactDatesWinOverIntegers) {
  EXPECT_EQ(infer_single({"20230101", "20230102", "20231231"}), SemanticType::DATE);
}

TEST(TypeInferenceTest, SevenDigitIntegersAreNotDates) {
  EXPECT_EQ(infer_single({"2023111", "1000111", "2024121"}), SemanticType::INT64);
}

TEST(TypeInferenceTest, MixedIntegersAndDecimalsAreFloat) {
  EXPECT_EQ(infer_single({"1", "2.5", "-3", "4e2"}), SemanticType::FLOAT64);
}

TEST(TypeInferenceTest, EmptyCellsDoNotCount) {
  std::vector<std::string> cells(10, "");
  cells.push_back("7");
  cells.push_back("8");
  EXPECT_EQ(infer_single(cells), SemanticType::INT64);
}

TEST(TypeInferenceTest, AllEmptyColumnIsString) {
  EXPECT_EQ(infer_single({"", "", ""}), SemanticType::STRING);
  EXPECT_EQ(infer_single({}), SemanticType::STRING);
}

TEST(TypeInferenceTest, CustomThreshold) {
  DateParser dates;
  InferenceOptions options;
  options.threshold = 0.5;
  TypeInference inference(dates, options);
  VectorReader reader(column_of({"1", "2", "x", "y"}));
  auto stats = inference.scan(reader, 1);
  EXPECT_EQ(stats[0].dominant_type(options.threshold), SemanticType::INT64);
}

TEST(TypeInferenceTest, InferOnlyAssignsUnknownColumns) {
  auto builder = SchemaBuilder::from_header({"id", "when", "label", "price"});
  builder.set_type(2, SemanticType::STRING, ColumnOrigin::SUPPLIED);

  DateParser dates;
  TypeInference inference(dates);
  VectorReader reader({{"1", "2024-02-29", "10", "9.99"},
                       {"2", "2024-03-01", "11", "1"},
                       {"3", "", "12", "0.5"}});
  inference.infer(reader, builder);

  EXPECT_EQ(inference.rows_scanned(), 3u);
  EXPECT_EQ(builder.column(0).type, SemanticType::INT64);
  EXPECT_EQ(builder.column(1).type, SemanticType::DATE);
  EXPECT_EQ(builder.column(2).type, SemanticType::STRING);
  EXPECT_EQ(builder.column(2).origin, ColumnOrigin::SUPPLIED);
  EXPECT_EQ(builder.column(3).type, SemanticType::FLOAT64);
  EXPECT_EQ(builder.column(3).origin, ColumnOrigin::INFERRED);
}

TEST(TypeInferenceTest, CustomDatePattern) {
  DateParser dates("%d.%m.%Y");
  TypeInference inference(dates);
  VectorReader reader(column_of({"15.01.2023", "31.12.1999"}));
  auto stats = inference.scan(reader, 1);
  EXPECT_EQ(stats[0].dominant_type(), SemanticType::DATE);
}

TEST(TypeInferenceTest, WidthMismatchIsSchemaMismatch) {
  DateParser dates;
  TypeInference inference(dates);
  VectorReader reader({{"1", "2"}, {"3", "4"}});
  EXPECT_THROW(inference.scan(reader, 3), SchemaMismatchError);
}
