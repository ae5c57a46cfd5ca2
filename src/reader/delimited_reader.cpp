#include "tabload/delimited_reader.h"

#include "tabload/error.h"

#include <streambuf>
#include <string>

namespace tabload {

DelimitedReader::DelimitedReader(std::unique_ptr<std::istream> input,
                                 const DelimitedOptions& options)
    : RowReader(options.skip), input_(std::move(input)), options_(options) {
  if (!input_)
    throw Error(ErrorCode::INTERNAL_ERROR, "DelimitedReader requires an input stream");

  // Drop a UTF-8 byte order mark
  auto start = input_->tellg();
  char bom[3] = {0, 0, 0};
  if (start != std::istream::pos_type(-1) && input_->read(bom, 3) &&
      static_cast<unsigned char>(bom[0]) == 0xEF && static_cast<unsigned char>(bom[1]) == 0xBB &&
      static_cast<unsigned char>(bom[2]) == 0xBF) {
    return;
  }
  input_->clear();
  if (start != std::istream::pos_type(-1))
    input_->seekg(start);
}

std::optional<RawRow> DelimitedReader::read_row() {
  using traits = std::char_traits<char>;
  std::streambuf* buf = input_->rdbuf();
  if (!buf)
    return std::nullopt;

  const char sep = options_.separator;
  const char quote = options_.quote;
  const bool quoting = quote != '\0';

  RawRow row;
  std::string field;
  bool in_quotes = false;
  bool started = false; // any byte of this record seen

  for (int ic = buf->sbumpc(); !traits::eq_int_type(ic, traits::eof()); ic = buf->sbumpc()) {
    char c = traits::to_char_type(ic);
    if (c == '\r')
      continue;

    if (in_quotes) {
      if (c == quote) {
        // Doubled quote is a literal quote; CRs between them are ignored
        int peek = buf->sgetc();
        while (!traits::eq_int_type(peek, traits::eof()) && traits::to_char_type(peek) == '\r') {
          buf->sbumpc();
          peek = buf->sgetc();
        }
        if (!traits::eq_int_type(peek, traits::eof()) && traits::to_char_type(peek) == quote) {
          field += quote;
          buf->sbumpc();
        } else {
          in_quotes = false;
        }
      } else {
        field += c;
      }
      continue;
    }

    if (c == '\n') {
      if (!started) {
        // In a one-column source a blank line is a record with an empty cell
        if (width() == 1)
          return RawRow{std::string()};
        continue;
      }
      row.push_back(std::move(field));
      return row;
    }

    started = true;
    if (quoting && c == quote) {
      in_quotes = true;
    } else if (c == sep) {
      row.push_back(std::move(field));
      field.clear();
    } else {
      field += c;
    }
  }

  if (!started)
    return std::nullopt;
  // Final record without a trailing newline; an unclosed quote runs to EOF
  row.push_back(std::move(field));
  return row;
}

} // namespace tabload
