#pragma once

#include "tabload/destination.h"
#include "tabload/http_client.h"

#include <cstdint>
#include <string>

namespace tabload {

struct ClickHouseOptions {
  std::string host = "127.0.0.1";
  uint16_t port = 8123; // HTTP interface
  std::string user = "default";
  std::string password;
  std::string database = "default";
  bool secure = false; // https
};

/// ClickHouse column type for a semantic type.
const char* clickhouse_type(SemanticType type);

/// `name` with backticks and backslashes escaped.
std::string quote_identifier(const std::string& name);

/// CREATE TABLE statement for a MergeTree table ordered by the schema key.
std::string create_table_sql(const std::string& database, const std::string& table,
                             const TableSchema& schema);

/// Append one row in TabSeparated format (escaped, '\n' terminated).
void append_tab_separated(std::string& out, const CoercedRow& row);

/// Percent-encode for use in a URL query component.
std::string url_encode(const std::string& value);

/// Destination writing to ClickHouse over its HTTP interface.
///
/// A batch is sent as one INSERT ... FORMAT TabSeparated. If the server
/// refuses it, the batch is replayed row by row to find the rejected rows.
/// Transport and authentication failures throw DestinationError.
class ClickHouseDestination : public Destination {
public:
  explicit ClickHouseDestination(const ClickHouseOptions& options);

  void create_table(const std::string& name, const TableSchema& schema) override;
  AppendResult append(const RowBatch& batch, RejectionPolicy policy) override;
  std::string describe() const override;

private:
  // Run a statement; data (if any) follows the query in the request body.
  HttpResponse execute(const std::string& query, const std::string& data);
  std::string base_url() const;

  ClickHouseOptions options_;
  HttpClient client_;
  std::string table_;
  std::string insert_query_;
};

} // namespace tabload
