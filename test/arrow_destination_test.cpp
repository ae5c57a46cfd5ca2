/**
 * @file arrow_destination_test.cpp
 * @brief Tests for writing tables to Feather and Parquet files.
 */

#ifdef TABLOAD_ENABLE_ARROW
#include "tabload/arrow_destination.h"

#include "test_helpers.h"

#include <arrow/io/file.h>
#include <arrow/ipc/reader.h>
#include <cfloat>
#include <climits>
#include <gtest/gtest.h>

#ifdef TABLOAD_ENABLE_PARQUET
#include <parquet/arrow/reader.h>
#endif

namespace tabload {

class ArrowDestinationTest : public ::testing::Test {
protected:
  static TableSchema schema() {
    auto builder = SchemaBuilder::from_names({"id", "name", "score", "born"});
    builder.apply_type_tokens({"i", "s", "f", "d"});
    return builder.build();
  }

  static RowBatch batch(size_t index, size_t first_row, size_t count) {
    RowBatch out;
    out.index = index;
    out.first_row = first_row;
    for (size_t i = 0; i < count; ++i) {
      const size_t n = first_row + i;
      out.rows.push_back(CoercedRow{Value{static_cast<int64_t>(n)},
                                    Value{std::string("row") + std::to_string(n)},
                                    Value{static_cast<double>(n) / 2},
                                    Value{Date{static_cast<int32_t>(n)}}});
    }
    return out;
  }

  tabload_test::TempDir dir;
};

TEST_F(ArrowDestinationTest, SchemaMapping) {
  auto arrow_schema = to_arrow_schema(schema());
  ASSERT_EQ(arrow_schema->num_fields(), 4);
  EXPECT_EQ(arrow_schema->field(0)->type()->id(), arrow::Type::INT64);
  EXPECT_EQ(arrow_schema->field(1)->type()->id(), arrow::Type::STRING);
  EXPECT_EQ(arrow_schema->field(2)->type()->id(), arrow::Type::DOUBLE);
  EXPECT_EQ(arrow_schema->field(3)->type()->id(), arrow::Type::DATE32);
  EXPECT_FALSE(arrow_schema->field(0)->nullable());

  ASSERT_NE(arrow_schema->metadata(), nullptr);
  auto key = arrow_schema->metadata()->Get("tabload.key");
  ASSERT_TRUE(key.ok());
  EXPECT_EQ(*key, "id");
}

TEST_F(ArrowDestinationTest, Extensions) {
  EXPECT_STREQ(columnar_extension(ColumnarFormat::PARQUET), "parquet");
  EXPECT_STREQ(columnar_extension(ColumnarFormat::FEATHER), "arrow");
}

TEST_F(ArrowDestinationTest, FeatherRoundTrip) {
  ArrowTableDestination destination(dir.path().string(), ColumnarFormat::FEATHER);
  destination.create_table("scores", schema());
  EXPECT_EQ(destination.path(), dir.path().string() + "/scores.arrow");

  auto first = destination.append(batch(0, 1, 3), RejectionPolicy::STOP_AT_FIRST);
  auto second = destination.append(batch(1, 4, 2), RejectionPolicy::STOP_AT_FIRST);
  EXPECT_EQ(first.written, 3u);
  EXPECT_EQ(second.written, 2u);
  EXPECT_TRUE(second.rejections.empty());
  destination.finish();

  auto input = arrow::io::ReadableFile::Open(destination.path());
  ASSERT_TRUE(input.ok()) << input.status().ToString();
  auto reader_result = arrow::ipc::RecordBatchFileReader::Open(*input);
  ASSERT_TRUE(reader_result.ok()) << reader_result.status().ToString();
  auto reader = *reader_result;

  EXPECT_EQ(reader->schema()->field(1)->name(), "name");
  ASSERT_EQ(reader->num_record_batches(), 2);

  auto batch_result = reader->ReadRecordBatch(1);
  ASSERT_TRUE(batch_result.ok());
  auto record_batch = *batch_result;
  ASSERT_EQ(record_batch->num_rows(), 2);

  auto ids = std::static_pointer_cast<arrow::Int64Array>(record_batch->column(0));
  auto names = std::static_pointer_cast<arrow::StringArray>(record_batch->column(1));
  auto scores = std::static_pointer_cast<arrow::DoubleArray>(record_batch->column(2));
  auto born = std::static_pointer_cast<arrow::Date32Array>(record_batch->column(3));
  EXPECT_EQ(ids->Value(0), 4);
  EXPECT_EQ(names->GetString(1), "row5");
  EXPECT_DOUBLE_EQ(scores->Value(0), 2.0);
  EXPECT_EQ(born->Value(1), 5);
}

TEST_F(ArrowDestinationTest, SentinelsAreStoredAsValues) {
  ArrowTableDestination destination(dir.path().string(), ColumnarFormat::FEATHER);
  destination.create_table("sentinels", schema());
  RowBatch sentinel_batch;
  sentinel_batch.rows.push_back(CoercedRow{Value{INT64_MAX}, Value{std::string("!")},
                                           Value{DBL_MAX}, Value{Date{0}}});
  destination.append(sentinel_batch, RejectionPolicy::SKIP);
  destination.finish();

  auto input = arrow::io::ReadableFile::Open(destination.path());
  ASSERT_TRUE(input.ok());
  auto reader = arrow::ipc::RecordBatchFileReader::Open(*input);
  ASSERT_TRUE(reader.ok());
  auto record_batch = (*reader)->ReadRecordBatch(0);
  ASSERT_TRUE(record_batch.ok());
  EXPECT_EQ((*record_batch)->column(0)->null_count(), 0);
  EXPECT_EQ(std::static_pointer_cast<arrow::Int64Array>((*record_batch)->column(0))->Value(0),
            INT64_MAX);
  EXPECT_EQ(std::static_pointer_cast<arrow::DoubleArray>((*record_batch)->column(2))->Value(0),
            DBL_MAX);
}

TEST_F(ArrowDestinationTest, AppendBeforeCreate) {
  ArrowTableDestination destination(dir.path().string(), ColumnarFormat::FEATHER);
  EXPECT_THROW(destination.append(batch(0, 1, 1), RejectionPolicy::SKIP), DestinationError);
}

TEST_F(ArrowDestinationTest, UnwritableDirectory) {
  ArrowTableDestination destination((dir.path() / "missing" / "deeper").string(),
                                    ColumnarFormat::FEATHER);
  EXPECT_THROW(destination.create_table("t", schema()), TableCreationError);
}

#ifdef TABLOAD_ENABLE_PARQUET
TEST_F(ArrowDestinationTest, ParquetRoundTrip) {
  ArrowTableDestination destination(dir.path().string(), ColumnarFormat::PARQUET);
  destination.create_table("scores", schema());
  destination.append(batch(0, 1, 3), RejectionPolicy::STOP_AT_FIRST);
  destination.append(batch(1, 4, 3), RejectionPolicy::STOP_AT_FIRST);
  destination.finish();

  auto input = arrow::io::ReadableFile::Open(destination.path());
  ASSERT_TRUE(input.ok()) << input.status().ToString();
  auto reader_result = parquet::arrow::OpenFile(*input, arrow::default_memory_pool());
  ASSERT_TRUE(reader_result.ok()) << reader_result.status().ToString();
  auto parquet_reader = std::move(*reader_result);

  std::shared_ptr<arrow::Table> table;
  auto status = parquet_reader->ReadTable(&table);
  ASSERT_TRUE(status.ok()) << status.ToString();
  EXPECT_EQ(table->num_rows(), 6);
  EXPECT_EQ(table->num_columns(), 4);
  EXPECT_EQ(table->schema()->field(3)->type()->id(), arrow::Type::DATE32);
}
#else
TEST_F(ArrowDestinationTest, ParquetUnavailable) {
  EXPECT_THROW({ ArrowTableDestination destination(dir.path().string(), ColumnarFormat::PARQUET); },
               ConfigurationError);
}
#endif // TABLOAD_ENABLE_PARQUET

} // namespace tabload

#else
#include <gtest/gtest.h>
TEST(ArrowDestinationTest, ArrowNotEnabled) {
  GTEST_SKIP() << "Arrow not enabled";
}
#endif

