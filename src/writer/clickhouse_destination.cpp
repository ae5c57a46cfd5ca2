#include "tabload/clickhouse_destination.h"

#include "tabload/logging.h"

#include <cstdio>

namespace tabload {

const char* clickhouse_type(SemanticType type) {
  switch (type) {
  case SemanticType::INT64:
    return "Int64";
  case SemanticType::FLOAT64:
    return "Float64";
  case SemanticType::DATE:
    return "Date";
  default:
    return "String";
  }
}

std::string quote_identifier(const std::string& name) {
  std::string out = "`";
  for (char c : name) {
    if (c == '`' || c == '\\')
      out += '\\';
    out += c;
  }
  out += '`';
  return out;
}

std::string create_table_sql(const std::string& database, const std::string& table,
                             const TableSchema& schema) {
  std::string sql = "CREATE TABLE " + quote_identifier(database) + "." + quote_identifier(table) +
                    " (";
  for (size_t i = 0; i < schema.size(); ++i) {
    const auto& col = schema.column(i);
    if (i > 0)
      sql += ", ";
    sql += quote_identifier(col.name) + " " + clickhouse_type(col.type);
  }
  sql += ") ENGINE = MergeTree() ORDER BY " + quote_identifier(schema.key_name());
  return sql;
}

void append_tab_separated(std::string& out, const CoercedRow& row) {
  for (size_t i = 0; i < row.size(); ++i) {
    if (i > 0)
      out += '\t';
    const Value& v = row[i];
    if (!std::holds_alternative<std::string>(v)) {
      out += value_to_string(v);
      continue;
    }
    for (char c : std::get<std::string>(v)) {
      switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\0':
        out += "\\0";
        break;
      default:
        out += c;
      }
    }
  }
  out += '\n';
}

std::string url_encode(const std::string& value) {
  static const char hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
        c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += hex[c >> 4];
      out += hex[c & 0xF];
    }
  }
  return out;
}

namespace {

// First line of a ClickHouse error body ("Code: 27. DB::Exception: ...")
std::string server_message(const HttpResponse& res) {
  std::string msg = res.body.substr(0, res.body.find('\n'));
  if (msg.empty())
    msg = "HTTP " + std::to_string(res.status) + " " + res.reason;
  return msg;
}

// Failures that make every later request fail as well
bool is_connection_fatal(const HttpResponse& res) {
  if (res.status == 401 || res.status == 403 || res.status == 407 || res.status == 502 ||
      res.status == 503 || res.status == 504)
    return true;
  return res.body.find("AUTHENTICATION_FAILED") != std::string::npos ||
         res.body.compare(0, 10, "Code: 516.") == 0;
}

} // namespace

ClickHouseDestination::ClickHouseDestination(const ClickHouseOptions& options)
    : options_(options) {}

std::string ClickHouseDestination::base_url() const {
  return std::string(options_.secure ? "https" : "http") + "://" + options_.host + ":" +
         std::to_string(options_.port) + "/";
}

std::string ClickHouseDestination::describe() const {
  return "clickhouse://" + options_.host + ":" + std::to_string(options_.port) + "/" +
         options_.database + "." + table_;
}

HttpResponse ClickHouseDestination::execute(const std::string& query, const std::string& data) {
  std::map<std::string, std::string> headers = {
      {"X-ClickHouse-User", options_.user},
      {"X-ClickHouse-Key", options_.password},
      {"Content-Type", "text/plain; charset=utf-8"},
  };
  std::string url = base_url() + "?database=" + url_encode(options_.database);
  if (data.empty())
    return client_.post(url, query, headers);
  return client_.post(url + "&query=" + url_encode(query), data, headers);
}

void ClickHouseDestination::create_table(const std::string& name, const TableSchema& schema) {
  const std::string qualified = quote_identifier(options_.database) + "." + quote_identifier(name);
  const std::string sql = create_table_sql(options_.database, name, schema);
  logger()->debug("{}", sql);

  for (const std::string& statement : {"DROP TABLE IF EXISTS " + qualified, sql}) {
    HttpResponse res;
    try {
      res = execute(statement, {});
    } catch (const HttpTransportError& e) {
      throw TableCreationError("cannot reach ClickHouse at " + base_url() + ": " + e.what());
    }
    if (!res.ok())
      throw TableCreationError("could not create table " + qualified + ": " + server_message(res));
  }

  table_ = name;
  insert_query_ = "INSERT INTO " + qualified + " FORMAT TabSeparated";
  logger()->info("created table {}", describe());
}

AppendResult ClickHouseDestination::append(const RowBatch& batch, RejectionPolicy policy) {
  if (insert_query_.empty())
    throw DestinationError("append called before create_table");

  AppendResult result;
  if (batch.rows.empty())
    return result;

  auto send = [this](const std::string& data) {
    HttpResponse res;
    try {
      res = execute(insert_query_, data);
    } catch (const HttpTransportError& e) {
      throw DestinationError("lost connection to ClickHouse: " + std::string(e.what()));
    }
    if (!res.ok() && is_connection_fatal(res))
      throw DestinationError("ClickHouse refused the connection: " + server_message(res));
    return res;
  };

  std::string data;
  for (const auto& row : batch.rows)
    append_tab_separated(data, row);

  HttpResponse res = send(data);
  if (res.ok()) {
    result.written = batch.rows.size();
    return result;
  }

  // Inserts are atomic per request: replay one row at a time to isolate the bad ones
  logger()->debug("batch {} refused ({}); retrying row by row", batch.index, server_message(res));
  for (size_t i = 0; i < batch.rows.size(); ++i) {
    std::string line;
    append_tab_separated(line, batch.rows[i]);
    HttpResponse row_res = send(line);
    if (row_res.ok()) {
      ++result.written;
      continue;
    }
    result.rejections.emplace_back(batch.first_row + i, server_message(row_res));
    if (policy == RejectionPolicy::STOP_AT_FIRST)
      break;
  }
  return result;
}

} // namespace tabload
