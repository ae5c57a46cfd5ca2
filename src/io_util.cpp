#include "tabload/io_util.h"

#include "tabload/error.h"

#include <cstdio>
#include <memory>
#include <random>
#include <system_error>

#include <unistd.h>

namespace tabload {

std::string read_file(const std::filesystem::path& path) {
  std::unique_ptr<std::FILE, decltype(&std::fclose)> fp(std::fopen(path.c_str(), "rb"),
                                                        &std::fclose);
  if (!fp)
    throw NotFoundError("could not open '" + path.string() + "'");

  std::string data;
  char buf[64 * 1024];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), fp.get())) > 0)
    data.append(buf, n);
  if (std::ferror(fp.get()))
    throw NotFoundError("could not read '" + path.string() + "'");
  return data;
}

void write_file(const std::filesystem::path& path, const std::string& data) {
  std::unique_ptr<std::FILE, decltype(&std::fclose)> fp(std::fopen(path.c_str(), "wb"),
                                                        &std::fclose);
  if (!fp)
    throw Error(ErrorCode::IO_ERROR, "could not create '" + path.string() + "'");
  if (std::fwrite(data.data(), 1, data.size(), fp.get()) != data.size() ||
      std::fflush(fp.get()) != 0)
    throw Error(ErrorCode::IO_ERROR, "could not write '" + path.string() + "'");
}

std::filesystem::path make_temp_directory(const std::string& prefix) {
  namespace fs = std::filesystem;
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<unsigned> dist;

  std::error_code ec;
  fs::path base = fs::temp_directory_path(ec);
  if (ec)
    base = "/tmp";
  for (int attempt = 0; attempt < 16; ++attempt) {
    fs::path dir = base / (prefix + "-" + std::to_string(::getpid()) + "-" +
                           std::to_string(dist(gen)));
    if (fs::create_directory(dir, ec) && !ec)
      return dir;
  }
  throw Error(ErrorCode::IO_ERROR, "could not create a temporary directory under '" +
                                       base.string() + "'");
}

} // namespace tabload
