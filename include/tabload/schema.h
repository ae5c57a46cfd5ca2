#pragma once

#include "tabload/types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tabload {

/// Whether a column's type came from inference or from the caller.
enum class ColumnOrigin : uint8_t { INFERRED, SUPPLIED };

struct ColumnDefinition {
  std::string name;
  SemanticType type = SemanticType::UNKNOWN;
  Value sentinel = std::string("!");
  ColumnOrigin origin = ColumnOrigin::INFERRED;
};

/// Ordered, immutable set of columns plus the key column used to order
/// rows in the destination.
class TableSchema {
public:
  TableSchema(std::vector<ColumnDefinition> columns, size_t key_index);

  size_t size() const { return columns_.size(); }
  const std::vector<ColumnDefinition>& columns() const { return columns_; }
  const ColumnDefinition& column(size_t i) const { return columns_.at(i); }

  size_t key_index() const { return key_index_; }
  const std::string& key_name() const { return columns_[key_index_].name; }

  std::vector<std::string> names() const;
  std::optional<size_t> find(std::string_view name) const;

  /// "name:Type, ..." for logs.
  std::string to_string() const;

private:
  std::vector<ColumnDefinition> columns_;
  size_t key_index_;
};

struct NamingOptions {
  bool camel_case = false;      // "First Name" -> "firstName"
  bool lowercase_names = false; // store the lower-cased name
};

/// Spaces become '_', everything is lower-cased, then each '_' or '.' is
/// dropped and the character after it upper-cased.
std::string to_camel_case(std::string_view name);

/// Names the destination refuses as column identifiers (case-insensitive).
bool is_reserved_name(std::string_view name);

/// Accumulates column names and types, then produces an immutable TableSchema.
class SchemaBuilder {
public:
  /// Names from a header row. Reserved names get a "1" suffix, empty names
  /// become column_<n> and duplicates get a _<n> suffix.
  static SchemaBuilder from_header(const RawRow& header, const NamingOptions& naming = {});

  /// Caller-supplied names, used verbatim. Throws ConfigurationError for
  /// empty or duplicate names.
  static SchemaBuilder from_names(const std::vector<std::string>& names);

  /// Assign supplied types from tokens (s, i, f, d). Throws
  /// SchemaMismatchError when the count differs from the column count and
  /// ConfigurationError for unknown tokens.
  void apply_type_tokens(const std::vector<std::string>& tokens);

  void set_type(size_t index, SemanticType type, ColumnOrigin origin);

  size_t size() const { return columns_.size(); }
  const ColumnDefinition& column(size_t i) const { return columns_.at(i); }
  bool has_unknown_types() const;

  /// Unresolved columns become String. The first column is the key.
  TableSchema build() const;

private:
  std::vector<ColumnDefinition> columns_;
};

} // namespace tabload
