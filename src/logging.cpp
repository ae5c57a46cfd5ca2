#include "tabload/logging.h"

#include "tabload/error.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace tabload {

namespace {

std::mutex logger_mutex;

std::shared_ptr<spdlog::logger> make_logger(const LogOptions& options) {
  std::vector<spdlog::sink_ptr> sinks;
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(options.level);
  sinks.push_back(console_sink);

  if (!options.file.empty()) {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file, true);
    file_sink->set_level(spdlog::level::trace);
    sinks.push_back(file_sink);
  }

  auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
  log->set_level(options.file.empty() ? options.level : spdlog::level::trace);
  log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  log->flush_on(spdlog::level::warn);
  return log;
}

} // namespace

std::shared_ptr<spdlog::logger> init_logging(const LogOptions& options) {
  std::lock_guard<std::mutex> lock(logger_mutex);
  std::shared_ptr<spdlog::logger> log;
  try {
    log = make_logger(options);
  } catch (const spdlog::spdlog_ex& e) {
    throw ConfigurationError("cannot open log file '" + options.file + "': " + e.what());
  }
  spdlog::drop(LOGGER_NAME);
  spdlog::register_logger(log);
  return log;
}

std::shared_ptr<spdlog::logger> logger() {
  {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (auto existing = spdlog::get(LOGGER_NAME)) {
      return existing;
    }
  }
  return init_logging(LogOptions{});
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
  if (name == "trace")
    return spdlog::level::trace;
  if (name == "debug")
    return spdlog::level::debug;
  if (name == "info")
    return spdlog::level::info;
  if (name == "warn" || name == "warning")
    return spdlog::level::warn;
  if (name == "error")
    return spdlog::level::err;
  if (name == "off")
    return spdlog::level::off;
  throw ConfigurationError("unknown log level '" + name + "'");
}

} // namespace tabload
