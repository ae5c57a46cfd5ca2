#include "tabload/error.h"
#include "tabload/logging.h"
#include "tabload/source_resolver.h"

#include <cstdlib>
#include <sstream>
#include <system_error>
#include <vector>

#include <unistd.h>

#ifdef __linux__
#include <fcntl.h>
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace tabload {

std::string find_executable_in_path(const std::string& command) {
  if (command.empty())
    return "";
  const char* path_env = std::getenv("PATH");
  if (!path_env)
    return "";

  std::stringstream ss{std::string(path_env)};
  std::string token;
  while (std::getline(ss, token, ':')) {
    if (token.empty())
      token = ".";
    fs::path candidate = fs::path(token) / command;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec) && !ec && ::access(candidate.c_str(), X_OK) == 0)
      return candidate.string();
  }
  return "";
}

#ifdef __linux__

// Run executable with args, output discarded. Returns the exit status or -1.
static int spawn_and_wait(const std::string& executable, const std::vector<std::string>& args) {
  pid_t pid = ::fork();
  if (pid < 0)
    return -1;

  if (pid == 0) {
    const int dev_null = ::open("/dev/null", O_WRONLY);
    if (dev_null >= 0) {
      ::dup2(dev_null, STDOUT_FILENO);
      ::dup2(dev_null, STDERR_FILENO);
      ::close(dev_null);
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
      argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    ::execv(executable.c_str(), argv.data());
    _exit(127);
  }

  int status = 0;
  if (::waitpid(pid, &status, 0) < 0)
    return -1;
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  return -1;
}

fs::path LibreOfficeConverter::convert(const fs::path& xls, const fs::path& out_dir) {
  std::string exe = find_executable_in_path("libreoffice");
  if (exe.empty())
    exe = find_executable_in_path("soffice");
  if (exe.empty())
    throw ConversionError("cannot convert '" + xls.string() +
                          "': libreoffice was not found on PATH");

  logger()->debug("running {} --headless --convert-to xlsx --outdir {} {}", exe,
                  out_dir.string(), xls.string());
  int rc = spawn_and_wait(exe, {"--headless", "--convert-to", "xlsx", "--outdir",
                                out_dir.string(), xls.string()});
  if (rc != 0)
    throw ConversionError("libreoffice failed converting '" + xls.string() + "' (exit status " +
                          std::to_string(rc) + ")");

  fs::path converted = out_dir / (xls.stem().string() + ".xlsx");
  std::error_code ec;
  if (!fs::is_regular_file(converted, ec))
    throw ConversionError("libreoffice produced no output for '" + xls.string() + "'");
  return converted;
}

#else

fs::path LibreOfficeConverter::convert(const fs::path& xls, const fs::path&) {
  throw ConversionError("cannot convert '" + xls.string() +
                        "': legacy .xls conversion is only supported on Linux");
}

#endif

} // namespace tabload
