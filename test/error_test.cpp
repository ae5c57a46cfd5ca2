/**
 * @file error_test.cpp
 * @brief Tests for the error taxonomy and the rejected-row log.
 */

#include "tabload/error.h"

#include <gtest/gtest.h>

using namespace tabload;

TEST(ErrorTest, CodesRoundTripToStrings) {
  EXPECT_STREQ(error_code_to_string(ErrorCode::NONE), "NONE");
  EXPECT_STREQ(error_code_to_string(ErrorCode::CONFIGURATION), "CONFIGURATION");
  EXPECT_STREQ(error_code_to_string(ErrorCode::MALFORMED_ROW), "MALFORMED_ROW");
  EXPECT_STREQ(error_code_to_string(ErrorCode::DESTINATION_FAILED), "DESTINATION_FAILED");
  EXPECT_STREQ(error_code_to_string(ErrorCode::ROW_SKIPPED), "ROW_SKIPPED");
}

TEST(ErrorTest, SourceAccessErrorsShareABase) {
  try {
    throw NotFoundError("source not found: 'x.csv'");
  } catch (const SourceAccessError& e) {
    EXPECT_EQ(e.code(), ErrorCode::NOT_FOUND);
    EXPECT_STREQ(e.what(), "source not found: 'x.csv'");
  }

  try {
    throw FetchError("could not fetch");
  } catch (const SourceAccessError& e) {
    EXPECT_EQ(e.code(), ErrorCode::FETCH_FAILED);
  }
}

TEST(ErrorTest, AllErrorsDeriveFromError) {
  EXPECT_THROW(throw ConfigurationError("x"), Error);
  EXPECT_THROW(throw ConversionError("x"), Error);
  EXPECT_THROW(throw SchemaMismatchError("x"), Error);
  EXPECT_THROW(throw TableCreationError("x"), Error);
  EXPECT_THROW(throw DestinationError("x"), Error);
  EXPECT_THROW(throw WorkbookError("x"), std::runtime_error);
}

TEST(ErrorTest, MalformedRowCarriesWidths) {
  MalformedRowError e(7, 3, 5);
  EXPECT_EQ(e.code(), ErrorCode::MALFORMED_ROW);
  EXPECT_EQ(e.row_number(), 7u);
  EXPECT_EQ(e.expected_width(), 3u);
  EXPECT_EQ(e.actual_width(), 5u);
  EXPECT_STREQ(e.what(), "row 7 has 5 fields, expected 3");
}

TEST(ErrorTest, ExportErrorCarriesRowsWritten) {
  ExportError e("row 3 rejected", 2);
  EXPECT_EQ(e.code(), ErrorCode::EXPORT_FAILED);
  EXPECT_EQ(e.rows_written(), 2u);
}

TEST(RejectionLogTest, EmptyLog) {
  RejectionLog log;
  EXPECT_TRUE(log.empty());
  EXPECT_EQ(log.count(), 0u);
  EXPECT_EQ(log.summary(), "No rows skipped");
}

TEST(RejectionLogTest, SummaryListsRows) {
  RejectionLog log;
  log.add(3, "bad value");
  log.add(RowRejection(9, "too long"));

  EXPECT_FALSE(log.empty());
  EXPECT_EQ(log.count(), 2u);
  std::string summary = log.summary();
  EXPECT_NE(summary.find("Rows skipped: 2"), std::string::npos);
  EXPECT_NE(summary.find("[ROW_SKIPPED] row 3: bad value"), std::string::npos);
  EXPECT_NE(summary.find("[ROW_SKIPPED] row 9: too long"), std::string::npos);

  log.clear();
  EXPECT_TRUE(log.empty());
}

TEST(RejectionLogTest, SummaryTruncatesDetails) {
  RejectionLog log;
  for (size_t i = 1; i <= 5; ++i)
    log.add(i, "rejected");
  std::string summary = log.summary(2);
  EXPECT_NE(summary.find("row 2:"), std::string::npos);
  EXPECT_EQ(summary.find("row 3:"), std::string::npos);
  EXPECT_NE(summary.find("... 3 more"), std::string::npos);
}

TEST(RejectionLogTest, KeepsOnlyFirstDetails) {
  RejectionLog log(3);
  for (size_t i = 1; i <= 10; ++i)
    log.add(i, "rejected");
  EXPECT_EQ(log.count(), 10u);
  EXPECT_EQ(log.dropped(), 7u);
  ASSERT_EQ(log.rejections().size(), 3u);
  EXPECT_EQ(log.rejections().back().row_number, 3u);

  std::string summary = log.summary();
  EXPECT_NE(summary.find("Rows skipped: 10"), std::string::npos);
  EXPECT_NE(summary.find("row 3:"), std::string::npos);
  EXPECT_NE(summary.find("... 7 more"), std::string::npos);

  log.clear();
  EXPECT_TRUE(log.empty());
  EXPECT_EQ(log.dropped(), 0u);
}
