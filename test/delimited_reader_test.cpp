/**
 * @file delimited_reader_test.cpp
 * @brief Tests for DelimitedReader and the RowReader width/skip contract.
 */

#include "tabload/delimited_reader.h"
#include "tabload/error.h"
#include "tabload/value_coercer.h"

#include "test_helpers.h"

#include <gtest/gtest.h>
#include <sstream>

using namespace tabload;
using tabload_test::VectorReader;

namespace {

DelimitedReader make_reader(const std::string& text, char sep = ',', char quote = '"',
                            size_t skip = 0) {
  DelimitedOptions options;
  options.separator = sep;
  options.quote = quote;
  options.skip = skip;
  return DelimitedReader(std::make_unique<std::istringstream>(text), options);
}

std::vector<RawRow> read_all(RowReader& reader) {
  std::vector<RawRow> rows;
  while (auto row = reader.next())
    rows.push_back(std::move(*row));
  return rows;
}

} // namespace

// =============================================================================
// Field splitting
// =============================================================================

TEST(DelimitedReaderTest, CommaSeparated) {
  auto reader = make_reader("a,b,c\n1,2,3\n");
  auto rows = read_all(reader);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0], (RawRow{"a", "b", "c"}));
  EXPECT_EQ(rows[1], (RawRow{"1", "2", "3"}));
  EXPECT_EQ(reader.width(), 3u);
}

TEST(DelimitedReaderTest, TabSeparatedKeepsCommas) {
  auto reader = make_reader("x\ty\n1,5\t2\n", '\t');
  auto rows = read_all(reader);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[1], (RawRow{"1,5", "2"}));
}

TEST(DelimitedReaderTest, EmptyFieldsArePreserved) {
  auto reader = make_reader(",,\na,,c\n");
  auto rows = read_all(reader);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0], (RawRow{"", "", ""}));
  EXPECT_EQ(rows[1], (RawRow{"a", "", "c"}));
}

TEST(DelimitedReaderTest, FinalLineWithoutNewline) {
  auto reader = make_reader("a,b\n1,2");
  auto rows = read_all(reader);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[1], (RawRow{"1", "2"}));
}

TEST(DelimitedReaderTest, EmptyInput) {
  auto reader = make_reader("");
  EXPECT_FALSE(reader.next().has_value());
  EXPECT_EQ(reader.width(), 0u);
}

TEST(DelimitedReaderTest, BlankLinesIgnored) {
  auto reader = make_reader("a,b\n\n1,2\n\r\n3,4\n\n");
  auto rows = read_all(reader);
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[2], (RawRow{"3", "4"}));
}

TEST(DelimitedReaderTest, BlankLineInSingleColumnIsEmptyCell) {
  auto reader = make_reader("name\na\n\r\nb\n");
  EXPECT_EQ(reader.read_header(), (RawRow{"name"}));
  auto rows = read_all(reader);
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0], (RawRow{"a"}));
  EXPECT_EQ(rows[1], (RawRow{""}));
  EXPECT_EQ(rows[2], (RawRow{"b"}));
  EXPECT_EQ(reader.data_rows(), 3u);

  auto builder = SchemaBuilder::from_names({"name"});
  builder.apply_type_tokens({"s"});
  TableSchema schema = builder.build();
  DateParser dates;
  ValueCoercer coercer(schema, dates);
  EXPECT_EQ(std::get<std::string>(coercer.coerce(rows[1])[0]), "!");
}

TEST(DelimitedReaderTest, BlankLinesBeforeFirstRowIgnored) {
  auto reader = make_reader("\n\nname\nx\n");
  EXPECT_EQ(reader.read_header(), (RawRow{"name"}));
  auto rows = read_all(reader);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0], (RawRow{"x"}));
}

TEST(DelimitedReaderTest, CarriageReturnsDiscarded) {
  auto reader = make_reader("a,b\r\n1,2\r\n");
  auto rows = read_all(reader);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0], (RawRow{"a", "b"}));
  EXPECT_EQ(rows[1], (RawRow{"1", "2"}));

  auto inner = make_reader("x\ry,z\n");
  auto row = inner.next();
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ((*row)[0], "xy");
}

TEST(DelimitedReaderTest, Utf8BomStripped) {
  auto reader = make_reader("\xEF\xBB\xBFid,name\n1,x\n");
  auto header = reader.read_header();
  EXPECT_EQ(header, (RawRow{"id", "name"}));
}

// =============================================================================
// Quoting
// =============================================================================

TEST(DelimitedReaderTest, QuotedSeparatorAndNewline) {
  auto reader = make_reader("a,b\n\"x,y\",\"line1\nline2\"\n");
  auto rows = read_all(reader);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[1][0], "x,y");
  EXPECT_EQ(rows[1][1], "line1\nline2");
}

TEST(DelimitedReaderTest, DoubledQuoteIsLiteral) {
  auto reader = make_reader("\"say \"\"hi\"\"\",2\n");
  auto row = reader.next();
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ((*row)[0], "say \"hi\"");
  EXPECT_EQ((*row)[1], "2");
}

TEST(DelimitedReaderTest, QuotedEmptyField) {
  auto reader = make_reader("\"\",x\n");
  auto row = reader.next();
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(*row, (RawRow{"", "x"}));
}

TEST(DelimitedReaderTest, AlternateQuoteCharacter) {
  auto reader = make_reader("'a,b',\"c\"\n", ',', '\'');
  auto row = reader.next();
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(*row, (RawRow{"a,b", "\"c\""}));
}

TEST(DelimitedReaderTest, QuotingDisabled) {
  auto reader = make_reader("\"a\tb\"\tc\n", '\t', '\0');
  auto row = reader.next();
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(*row, (RawRow{"\"a", "b\"", "c"}));
}

// =============================================================================
// Skip and width contract
// =============================================================================

TEST(DelimitedReaderTest, SkipDropsLeadingRows) {
  auto reader = make_reader("title line\nnotes,here,too\nid,v\n1,2\n", ',', '"', 2);
  auto header = reader.read_header();
  EXPECT_EQ(header, (RawRow{"id", "v"}));
  auto rows = read_all(reader);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(reader.rows_consumed(), 4u);
  EXPECT_EQ(reader.data_rows(), 1u);
}

TEST(DelimitedReaderTest, SkipPastEnd) {
  auto reader = make_reader("a\nb\n", ',', '"', 5);
  EXPECT_TRUE(reader.read_header().empty());
  EXPECT_FALSE(reader.next().has_value());
}

TEST(DelimitedReaderTest, WidthMismatchThrows) {
  auto reader = make_reader("a,b,c\n1,2,3\n4,5\n");
  ASSERT_TRUE(reader.next().has_value());
  ASSERT_TRUE(reader.next().has_value());
  try {
    reader.next();
    FAIL() << "expected MalformedRowError";
  } catch (const MalformedRowError& e) {
    EXPECT_EQ(e.row_number(), 3u);
    EXPECT_EQ(e.expected_width(), 3u);
    EXPECT_EQ(e.actual_width(), 2u);
  }
}

TEST(RowReaderTest, HeaderFixesWidth) {
  VectorReader reader({{"a", "b"}, {"1", "2", "3"}});
  EXPECT_EQ(reader.read_header(), (RawRow{"a", "b"}));
  EXPECT_EQ(reader.width(), 2u);
  EXPECT_THROW(reader.next(), MalformedRowError);
}

TEST(RowReaderTest, SkippedRowsDoNotFixWidth) {
  VectorReader reader({{"junk"}, {"a", "b"}, {"1", "2"}}, 1);
  auto first = reader.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, (RawRow{"a", "b"}));
  EXPECT_EQ(reader.width(), 2u);
  EXPECT_TRUE(reader.next().has_value());
  EXPECT_FALSE(reader.next().has_value());
}
