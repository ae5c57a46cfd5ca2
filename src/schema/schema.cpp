#include "tabload/schema.h"

#include "tabload/error.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <unordered_set>

namespace tabload {

namespace {

// Column names the destination will not accept
const std::unordered_set<std::string_view> RESERVED_NAMES = {"index"};

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

TableSchema::TableSchema(std::vector<ColumnDefinition> columns, size_t key_index)
    : columns_(std::move(columns)), key_index_(key_index) {
  if (columns_.empty())
    throw SchemaMismatchError("a table needs at least one column");
  if (key_index_ >= columns_.size())
    throw SchemaMismatchError("key column " + std::to_string(key_index_) + " is out of range");
}

std::vector<std::string> TableSchema::names() const {
  std::vector<std::string> out;
  out.reserve(columns_.size());
  for (const auto& c : columns_)
    out.push_back(c.name);
  return out;
}

std::optional<size_t> TableSchema::find(std::string_view name) const {
  for (size_t i = 0; i < columns_.size(); ++i) {
    if (columns_[i].name == name)
      return i;
  }
  return std::nullopt;
}

std::string TableSchema::to_string() const {
  std::ostringstream ss;
  for (size_t i = 0; i < columns_.size(); ++i) {
    if (i > 0)
      ss << ", ";
    ss << columns_[i].name << ":" << semantic_type_to_string(columns_[i].type);
    if (i == key_index_)
      ss << " (key)";
  }
  return ss.str();
}

std::string to_camel_case(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  bool upper_next = false;
  for (char ch : name) {
    char c = ch == ' ' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (c == '_' || c == '.') {
      upper_next = true;
      continue;
    }
    out += upper_next ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
    upper_next = false;
  }
  return out;
}

bool is_reserved_name(std::string_view name) {
  return RESERVED_NAMES.count(lower(name)) > 0;
}

SchemaBuilder SchemaBuilder::from_header(const RawRow& header, const NamingOptions& naming) {
  SchemaBuilder builder;
  std::set<std::string> used;
  for (size_t i = 0; i < header.size(); ++i) {
    std::string name = naming.camel_case ? to_camel_case(header[i]) : header[i];
    if (is_reserved_name(name))
      name += "1";
    if (naming.lowercase_names)
      name = lower(name);
    if (name.empty())
      name = "column_" + std::to_string(i + 1);

    if (used.count(name)) {
      size_t suffix = 2;
      while (used.count(name + "_" + std::to_string(suffix)))
        ++suffix;
      name += "_" + std::to_string(suffix);
    }
    used.insert(name);

    ColumnDefinition col;
    col.name = std::move(name);
    builder.columns_.push_back(std::move(col));
  }
  return builder;
}

SchemaBuilder SchemaBuilder::from_names(const std::vector<std::string>& names) {
  SchemaBuilder builder;
  std::set<std::string> used;
  for (const auto& name : names) {
    if (name.empty())
      throw ConfigurationError("column names must not be empty");
    if (!used.insert(name).second)
      throw ConfigurationError("duplicate column name '" + name + "'");
    ColumnDefinition col;
    col.name = name;
    builder.columns_.push_back(std::move(col));
  }
  return builder;
}

void SchemaBuilder::apply_type_tokens(const std::vector<std::string>& tokens) {
  if (tokens.size() != columns_.size())
    throw SchemaMismatchError(std::to_string(tokens.size()) + " column types given for " +
                              std::to_string(columns_.size()) + " columns");
  for (size_t i = 0; i < tokens.size(); ++i) {
    auto type = type_from_token(tokens[i]);
    if (!type)
      throw ConfigurationError("unknown column type '" + tokens[i] + "' (expected s, i, f or d)");
    set_type(i, *type, ColumnOrigin::SUPPLIED);
  }
}

void SchemaBuilder::set_type(size_t index, SemanticType type, ColumnOrigin origin) {
  ColumnDefinition& col = columns_.at(index);
  col.type = type;
  col.sentinel = sentinel_for(type);
  col.origin = origin;
}

bool SchemaBuilder::has_unknown_types() const {
  return std::any_of(columns_.begin(), columns_.end(),
                     [](const ColumnDefinition& c) { return c.type == SemanticType::UNKNOWN; });
}

TableSchema SchemaBuilder::build() const {
  std::vector<ColumnDefinition> columns = columns_;
  for (auto& col : columns) {
    if (col.type == SemanticType::UNKNOWN) {
      col.type = SemanticType::STRING;
      col.sentinel = sentinel_for(SemanticType::STRING);
    }
  }
  return TableSchema(std::move(columns), 0);
}

} // namespace tabload
