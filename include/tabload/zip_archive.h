#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tabload {

/// Read-only view of an in-memory ZIP container (the OOXML package format).
/// Supports stored and deflated entries; ZIP64 and encryption are rejected.
class ZipArchive {
public:
  struct Entry {
    std::string name;
    uint16_t method = 0; // 0 = stored, 8 = deflate
    uint32_t crc32 = 0;
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
    uint64_t local_header_offset = 0;
  };

  /// Parses the central directory. Throws WorkbookError if the data is not
  /// a readable ZIP archive.
  explicit ZipArchive(std::string data);

  const std::vector<Entry>& entries() const { return entries_; }

  bool contains(std::string_view name) const;

  /// Uncompressed contents of an entry. Throws WorkbookError if missing or
  /// corrupt.
  std::string read(std::string_view name) const;

private:
  const Entry* find(std::string_view name) const;

  std::string data_;
  std::vector<Entry> entries_;
};

} // namespace tabload
