#include "tabload/zip_archive.h"

#include "tabload/error.h"

#include <zlib.h>

#include <algorithm>

namespace tabload {

namespace {

constexpr uint32_t EOCD_SIGNATURE = 0x06054b50;
constexpr uint32_t CENTRAL_SIGNATURE = 0x02014b50;
constexpr uint32_t LOCAL_SIGNATURE = 0x04034b50;
constexpr size_t EOCD_SIZE = 22;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t MAX_COMMENT = 0xFFFF;
// Upfront reserve is bounded by this multiple of the compressed size
constexpr uint64_t MAX_RESERVE_RATIO = 32;

uint16_t read_u16(const std::string& d, size_t off) {
  return static_cast<uint16_t>(static_cast<uint8_t>(d[off]) |
                               (static_cast<uint8_t>(d[off + 1]) << 8));
}

uint32_t read_u32(const std::string& d, size_t off) {
  return static_cast<uint32_t>(read_u16(d, off)) |
         (static_cast<uint32_t>(read_u16(d, off + 2)) << 16);
}

std::string inflate_raw(const char* src, size_t len, uint64_t expected, const std::string& name) {
  z_stream zs{};
  if (inflateInit2(&zs, -MAX_WBITS) != Z_OK)
    throw WorkbookError("zlib initialization failed");

  std::string out;
  out.reserve(static_cast<size_t>(std::min<uint64_t>(expected, len * MAX_RESERVE_RATIO)));
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(src));
  zs.avail_in = static_cast<uInt>(len);

  char chunk[64 * 1024];
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    zs.next_out = reinterpret_cast<Bytef*>(chunk);
    zs.avail_out = sizeof(chunk);
    ret = inflate(&zs, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      inflateEnd(&zs);
      throw WorkbookError("corrupt deflate data in '" + name + "'");
    }
    size_t produced = sizeof(chunk) - zs.avail_out;
    if (out.size() + produced > expected) {
      inflateEnd(&zs);
      throw WorkbookError("entry '" + name + "' inflates past its declared size");
    }
    out.append(chunk, produced);
    if (ret == Z_OK && produced == 0 && zs.avail_in == 0) {
      inflateEnd(&zs);
      throw WorkbookError("truncated deflate data in '" + name + "'");
    }
  }
  inflateEnd(&zs);
  return out;
}

} // namespace

ZipArchive::ZipArchive(std::string data) : data_(std::move(data)) {
  if (data_.size() < EOCD_SIZE)
    throw WorkbookError("not a ZIP archive: too short");

  // End of central directory: last 22 bytes plus an optional comment
  size_t lowest = data_.size() > EOCD_SIZE + MAX_COMMENT ? data_.size() - EOCD_SIZE - MAX_COMMENT
                                                         : 0;
  size_t eocd = std::string::npos;
  for (size_t pos = data_.size() - EOCD_SIZE + 1; pos-- > lowest;) {
    if (read_u32(data_, pos) == EOCD_SIGNATURE) {
      eocd = pos;
      break;
    }
  }
  if (eocd == std::string::npos)
    throw WorkbookError("not a ZIP archive: end of central directory not found");

  uint16_t count = read_u16(data_, eocd + 10);
  uint32_t cd_size = read_u32(data_, eocd + 12);
  uint32_t cd_offset = read_u32(data_, eocd + 16);
  if (cd_offset == 0xFFFFFFFF || count == 0xFFFF)
    throw WorkbookError("ZIP64 archives are not supported");
  if (static_cast<uint64_t>(cd_offset) + cd_size > data_.size())
    throw WorkbookError("central directory lies outside the archive");

  size_t pos = cd_offset;
  entries_.reserve(count);
  for (uint16_t i = 0; i < count; ++i) {
    if (pos + CENTRAL_HEADER_SIZE > data_.size() || read_u32(data_, pos) != CENTRAL_SIGNATURE)
      throw WorkbookError("corrupt central directory entry");

    Entry e;
    uint16_t flags = read_u16(data_, pos + 8);
    e.method = read_u16(data_, pos + 10);
    e.crc32 = read_u32(data_, pos + 16);
    e.compressed_size = read_u32(data_, pos + 20);
    e.uncompressed_size = read_u32(data_, pos + 24);
    uint16_t name_len = read_u16(data_, pos + 28);
    uint16_t extra_len = read_u16(data_, pos + 30);
    uint16_t comment_len = read_u16(data_, pos + 32);
    e.local_header_offset = read_u32(data_, pos + 42);

    if (pos + CENTRAL_HEADER_SIZE + name_len > data_.size())
      throw WorkbookError("corrupt central directory entry name");
    e.name = data_.substr(pos + CENTRAL_HEADER_SIZE, name_len);
    if (flags & 0x1)
      throw WorkbookError("encrypted entry '" + e.name + "' is not supported");

    entries_.push_back(std::move(e));
    pos += CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;
  }
}

const ZipArchive::Entry* ZipArchive::find(std::string_view name) const {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const Entry& e) { return e.name == name; });
  return it == entries_.end() ? nullptr : &*it;
}

bool ZipArchive::contains(std::string_view name) const { return find(name) != nullptr; }

std::string ZipArchive::read(std::string_view name) const {
  const Entry* e = find(name);
  if (!e)
    throw WorkbookError("archive has no entry '" + std::string(name) + "'");

  size_t off = static_cast<size_t>(e->local_header_offset);
  if (off + LOCAL_HEADER_SIZE > data_.size() || read_u32(data_, off) != LOCAL_SIGNATURE)
    throw WorkbookError("corrupt local header for '" + e->name + "'");

  size_t data_off = off + LOCAL_HEADER_SIZE + read_u16(data_, off + 26) + read_u16(data_, off + 28);
  if (data_off + e->compressed_size > data_.size())
    throw WorkbookError("entry '" + e->name + "' extends past end of archive");

  const char* src = data_.data() + data_off;
  std::string out;
  switch (e->method) {
  case 0:
    out.assign(src, static_cast<size_t>(e->compressed_size));
    break;
  case 8:
    out = inflate_raw(src, static_cast<size_t>(e->compressed_size), e->uncompressed_size, e->name);
    break;
  default:
    throw WorkbookError("entry '" + e->name + "' uses unsupported compression method " +
                        std::to_string(e->method));
  }

  uLong crc = ::crc32(0L, Z_NULL, 0);
  crc = ::crc32(crc, reinterpret_cast<const Bytef*>(out.data()), static_cast<uInt>(out.size()));
  if (static_cast<uint32_t>(crc) != e->crc32)
    throw WorkbookError("checksum mismatch for '" + e->name + "'");
  return out;
}

} // namespace tabload
