#include "tabload/xlsx_workbook.h"

#include "tabload/error.h"
#include "tabload/types.h"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <sstream>

namespace pt = boost::property_tree;

namespace tabload {

void SheetGrid::set(size_t row, size_t col, std::string value) {
  if (rows.empty()) {
    max_row = row;
    max_col = col;
  } else {
    max_row = std::max(max_row, row);
    max_col = std::max(max_col, col);
  }
  rows[row][col] = std::move(value);
}

const std::string* SheetGrid::cell(size_t row, size_t col) const {
  auto r = rows.find(row);
  if (r == rows.end())
    return nullptr;
  auto c = r->second.find(col);
  return c == r->second.end() ? nullptr : &c->second;
}

namespace {

// Element and attribute names are matched without their namespace prefix
std::string local_name(const std::string& key) {
  auto colon = key.find(':');
  return colon == std::string::npos ? key : key.substr(colon + 1);
}

const pt::ptree* child(const pt::ptree& node, const char* name) {
  for (const auto& kv : node) {
    if (local_name(kv.first) == name)
      return &kv.second;
  }
  return nullptr;
}

std::string attribute(const pt::ptree& node, const char* name) {
  auto attrs = node.get_child_optional("<xmlattr>");
  if (!attrs)
    return {};
  for (const auto& kv : *attrs) {
    if (local_name(kv.first) == name)
      return kv.second.data();
  }
  return {};
}

pt::ptree parse_xml(const std::string& xml, const std::string& part) {
  pt::ptree tree;
  std::istringstream in(xml);
  try {
    pt::read_xml(in, tree);
  } catch (const pt::xml_parser_error& e) {
    throw WorkbookError("malformed XML in '" + part + "': " + e.message());
  }
  return tree;
}

// Root element of a parsed part, skipping declarations and comments
const pt::ptree& document_root(const pt::ptree& tree, const char* name, const std::string& part) {
  const pt::ptree* root = child(tree, name);
  if (!root)
    throw WorkbookError("'" + part + "' has no <" + name + "> element");
  return *root;
}

// Text of an <si> or <is> node: direct <t> plus the <t> of each rich-text run
std::string rich_text(const pt::ptree& node) {
  std::string out;
  for (const auto& kv : node) {
    std::string name = local_name(kv.first);
    if (name == "t") {
      out += kv.second.data();
    } else if (name == "r") {
      if (const pt::ptree* t = child(kv.second, "t"))
        out += t->data();
    }
  }
  return out;
}

// "BC12" -> row 11, col 54
bool parse_cell_ref(const std::string& ref, size_t& row, size_t& col) {
  size_t i = 0;
  size_t c = 0;
  while (i < ref.size() && std::isalpha(static_cast<unsigned char>(ref[i]))) {
    c = c * 26 + static_cast<size_t>(std::toupper(static_cast<unsigned char>(ref[i])) - 'A' + 1);
    ++i;
  }
  if (i == 0 || i == ref.size())
    return false;
  size_t r = 0;
  for (; i < ref.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(ref[i])))
      return false;
    r = r * 10 + static_cast<size_t>(ref[i] - '0');
  }
  if (r == 0)
    return false;
  row = r - 1;
  col = c - 1;
  return true;
}

std::string resolve_target(const std::string& target) {
  if (!target.empty() && target[0] == '/')
    return target.substr(1);
  if (target.compare(0, 3, "xl/") == 0)
    return target;
  return "xl/" + target;
}

} // namespace

std::string excel_serial_to_string(double serial) {
  double whole = std::floor(serial);
  long long seconds = std::llround((serial - whole) * 86400.0);
  long long days = static_cast<long long>(whole) - 25569; // 1899-12-30 -> 1970-01-01
  if (seconds >= 86400) {
    days += 1;
    seconds -= 86400;
  }
  std::string out = format_date(Date{static_cast<int32_t>(days)});
  if (seconds > 0) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), " %02lld:%02lld:%02lld", seconds / 3600, (seconds / 60) % 60,
                  seconds % 60);
    out += buf;
  }
  return out;
}

bool is_date_number_format(int format_id, const std::string& format_code) {
  if (format_code.empty()) {
    return (format_id >= 14 && format_id <= 22) || (format_id >= 27 && format_id <= 36) ||
           (format_id >= 50 && format_id <= 58);
  }

  // Ignore literal text, escapes and bracketed sections ([Red], [$-409])
  bool in_quote = false;
  int bracket = 0;
  for (size_t i = 0; i < format_code.size(); ++i) {
    char c = format_code[i];
    if (in_quote) {
      if (c == '"')
        in_quote = false;
      continue;
    }
    if (c == '"') {
      in_quote = true;
    } else if (c == '\\' || c == '_' || c == '*') {
      ++i;
    } else if (c == '[') {
      ++bracket;
    } else if (c == ']') {
      bracket = std::max(0, bracket - 1);
    } else if (bracket == 0) {
      char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      if (lower == 'd' || lower == 'y')
        return true;
    }
  }
  return false;
}

XlsxWorkbook::XlsxWorkbook(std::string bytes) : archive_(std::move(bytes)) {
  load_workbook();
  load_shared_strings();
  load_styles();
}

void XlsxWorkbook::load_workbook() {
  const std::string part = "xl/workbook.xml";
  if (!archive_.contains(part))
    throw WorkbookError("not an xlsx workbook: missing " + part);

  std::map<std::string, std::string> targets;
  const std::string rels_part = "xl/_rels/workbook.xml.rels";
  if (archive_.contains(rels_part)) {
    pt::ptree rels = parse_xml(archive_.read(rels_part), rels_part);
    for (const auto& kv : document_root(rels, "Relationships", rels_part)) {
      if (local_name(kv.first) == "Relationship")
        targets[attribute(kv.second, "Id")] = attribute(kv.second, "Target");
    }
  }

  pt::ptree tree = parse_xml(archive_.read(part), part);
  const pt::ptree* sheets = child(document_root(tree, "workbook", part), "sheets");
  if (!sheets)
    throw WorkbookError("workbook has no sheets");

  size_t position = 0;
  for (const auto& kv : *sheets) {
    if (local_name(kv.first) != "sheet")
      continue;
    ++position;
    SheetRef ref;
    ref.name = attribute(kv.second, "name");
    auto it = targets.find(attribute(kv.second, "id"));
    ref.part = it != targets.end() ? resolve_target(it->second)
                                   : "xl/worksheets/sheet" + std::to_string(position) + ".xml";
    sheets_.push_back(std::move(ref));
  }
  if (sheets_.empty())
    throw WorkbookError("workbook has no sheets");
}

void XlsxWorkbook::load_shared_strings() {
  const std::string part = "xl/sharedStrings.xml";
  if (!archive_.contains(part))
    return;
  pt::ptree tree = parse_xml(archive_.read(part), part);
  for (const auto& kv : document_root(tree, "sst", part)) {
    if (local_name(kv.first) == "si")
      shared_strings_.push_back(rich_text(kv.second));
  }
}

void XlsxWorkbook::load_styles() {
  const std::string part = "xl/styles.xml";
  if (!archive_.contains(part))
    return;
  pt::ptree tree = parse_xml(archive_.read(part), part);
  const pt::ptree& root = document_root(tree, "styleSheet", part);

  std::map<int, std::string> custom_formats;
  if (const pt::ptree* fmts = child(root, "numFmts")) {
    for (const auto& kv : *fmts) {
      if (local_name(kv.first) == "numFmt")
        custom_formats[std::atoi(attribute(kv.second, "numFmtId").c_str())] =
            attribute(kv.second, "formatCode");
    }
  }

  if (const pt::ptree* xfs = child(root, "cellXfs")) {
    for (const auto& kv : *xfs) {
      if (local_name(kv.first) != "xf")
        continue;
      int id = std::atoi(attribute(kv.second, "numFmtId").c_str());
      auto it = custom_formats.find(id);
      date_styles_.push_back(
          is_date_number_format(id, it == custom_formats.end() ? std::string() : it->second));
    }
  }
}

std::vector<std::string> XlsxWorkbook::sheet_names() const {
  std::vector<std::string> names;
  names.reserve(sheets_.size());
  for (const auto& s : sheets_)
    names.push_back(s.name);
  return names;
}

SheetGrid XlsxWorkbook::sheet(const std::string& name) const {
  if (name.empty())
    return parse_sheet(sheets_.front().part);
  for (const auto& s : sheets_) {
    if (s.name == name)
      return parse_sheet(s.part);
  }
  throw ConfigurationError("workbook has no sheet named '" + name + "'");
}

SheetGrid XlsxWorkbook::parse_sheet(const std::string& part) const {
  pt::ptree tree = parse_xml(archive_.read(part), part);
  SheetGrid grid;
  const pt::ptree* data = child(document_root(tree, "worksheet", part), "sheetData");
  if (!data)
    return grid;

  size_t next_row = 0;
  for (const auto& row_kv : *data) {
    if (local_name(row_kv.first) != "row")
      continue;
    const pt::ptree& row = row_kv.second;
    std::string r_attr = attribute(row, "r");
    size_t row_idx = next_row;
    if (!r_attr.empty()) {
      size_t number = std::strtoul(r_attr.c_str(), nullptr, 10);
      if (number == 0)
        throw WorkbookError("invalid row number '" + r_attr + "' in " + part);
      row_idx = number - 1;
    }
    next_row = row_idx + 1;

    size_t next_col = 0;
    for (const auto& cell_kv : row) {
      if (local_name(cell_kv.first) != "c")
        continue;
      const pt::ptree& c = cell_kv.second;
      size_t r = row_idx;
      size_t col = next_col;
      std::string ref = attribute(c, "r");
      if (!ref.empty() && !parse_cell_ref(ref, r, col))
        throw WorkbookError("invalid cell reference '" + ref + "' in " + part);
      next_col = col + 1;

      std::string type = attribute(c, "t");
      const pt::ptree* v = child(c, "v");
      std::string value;
      if (type == "inlineStr") {
        if (const pt::ptree* is = child(c, "is"))
          value = rich_text(*is);
      } else if (!v) {
        continue;
      } else if (type == "s") {
        size_t idx = std::strtoul(v->data().c_str(), nullptr, 10);
        if (idx >= shared_strings_.size())
          throw WorkbookError("shared string index " + v->data() + " out of range in " + part);
        value = shared_strings_[idx];
      } else if (type == "b") {
        value = v->data() == "1" ? "TRUE" : "FALSE";
      } else if (type == "str" || type == "e") {
        value = v->data();
      } else {
        value = v->data();
        std::string style = attribute(c, "s");
        size_t style_idx = style.empty() ? 0 : std::strtoul(style.c_str(), nullptr, 10);
        if (!style.empty() && style_idx < date_styles_.size() && date_styles_[style_idx]) {
          char* end = nullptr;
          double serial = std::strtod(value.c_str(), &end);
          if (end && *end == '\0' && !value.empty())
            value = excel_serial_to_string(serial);
        }
      }
      if (!value.empty())
        grid.set(r, col, std::move(value));
    }
  }
  return grid;
}

} // namespace tabload
