#include "core/process_utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <system_error>

#if !defined(_WIN32)
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace forgeops::core {

namespace {

bool IsExecutableFile(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec) {
    return false;
  }
#if defined(_WIN32)
  return true;
#else
  return ::access(path.c_str(), X_OK) == 0;
#endif
}

std::vector<std::string> SplitSearchPath(std::string_view raw) {
#if defined(_WIN32)
  constexpr char kSeparator = ';';
#else
  constexpr char kSeparator = ':';
#endif
  std::vector<std::string> dirs;
  std::size_t start = 0;
  while (start <= raw.size()) {
    const std::size_t end = raw.find(kSeparator, start);
    const std::size_t stop = end == std::string_view::npos ? raw.size() : end;
    // Empty PATH elements mean the current directory.
    dirs.emplace_back(stop == start ? std::string(".") : std::string(raw.substr(start, stop - start)));
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
  return dirs;
}

// Callers may run the program from another working directory.
fs::path AbsoluteOrSelf(const fs::path& path) {
  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  return ec ? path : absolute.lexically_normal();
}

} // namespace

std::string ShellQuote(std::string_view arg) {
  std::string quoted = "'";
  for (const char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted += "'";
  return quoted;
}

std::string BuildShellCommand(const std::vector<std::string>& argv) {
  std::string command;
  for (const auto& arg : argv) {
    if (!command.empty()) {
      command.push_back(' ');
    }
    command += ShellQuote(arg);
  }
  return command;
}

std::optional<fs::path> FindExecutable(std::string_view program) {
  if (program.empty()) {
    return std::nullopt;
  }

  if (program.find('/') != std::string_view::npos) {
    const fs::path direct(program);
    if (IsExecutableFile(direct)) {
      return AbsoluteOrSelf(direct);
    }
    return std::nullopt;
  }

  const char* raw_path = std::getenv("PATH");
  if (raw_path == nullptr || *raw_path == '\0') {
    return std::nullopt;
  }

  for (const auto& dir : SplitSearchPath(raw_path)) {
    const fs::path candidate = fs::path(dir) / std::string(program);
    if (IsExecutableFile(candidate)) {
      return AbsoluteOrSelf(candidate);
    }
  }
  return std::nullopt;
}

bool RunCommand(const std::vector<std::string>& argv, const fs::path& working_dir,
                std::string& output, int& exit_code, std::string& error) {
  output.clear();
  exit_code = -1;
  error.clear();

  if (argv.empty()) {
    error = "command cannot be empty";
    return false;
  }

  std::string command = BuildShellCommand(argv) + " 2>&1";
  if (!working_dir.empty()) {
    command = "cd " + ShellQuote(working_dir.string()) + " && " + command;
  }

#if defined(_WIN32)
  FILE* pipe = _popen(command.c_str(), "r");
#else
  FILE* pipe = popen(command.c_str(), "r");
#endif
  if (pipe == nullptr) {
    error = "failed to execute command: " + argv.front();
    return false;
  }

  char buffer[4096];
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), pipe) != nullptr) {
    output.append(buffer);
  }

#if defined(_WIN32)
  exit_code = _pclose(pipe);
#else
  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    error = "failed to collect exit status for command: " + argv.front();
    return false;
  }
  if (WIFEXITED(raw_status)) {
    exit_code = WEXITSTATUS(raw_status);
  } else {
    exit_code = raw_status;
  }
#endif

  return true;
}

} // namespace forgeops::core
