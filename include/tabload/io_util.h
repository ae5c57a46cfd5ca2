#pragma once

#include <filesystem>
#include <string>

namespace tabload {

/// Load a whole file. Throws NotFoundError if it cannot be opened or read.
std::string read_file(const std::filesystem::path& path);

/// Write bytes to a file, replacing it. Throws Error(IO_ERROR) on failure.
void write_file(const std::filesystem::path& path, const std::string& data);

/// Create a fresh private directory under the system temp directory.
std::filesystem::path make_temp_directory(const std::string& prefix);

} // namespace tabload
