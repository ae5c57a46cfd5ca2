#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace tabload {

/// Name of the process-wide logger.
inline constexpr const char* LOGGER_NAME = "tabload";

struct LogOptions {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string file; // Additional log file; empty for stderr only
};

/// Create (or replace) the tabload logger: colored stderr sink plus an
/// optional file sink. Safe to call more than once.
std::shared_ptr<spdlog::logger> init_logging(const LogOptions& options);

/// The tabload logger. Lazily created with default options if init_logging
/// was never called (library use, tests).
std::shared_ptr<spdlog::logger> logger();

/// Parse "trace", "debug", "info", "warn", "error", "off".
/// Throws ConfigurationError on anything else.
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace tabload
