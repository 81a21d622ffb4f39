#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace forgeops::core {

// Quotes one argument for a POSIX shell command line.
std::string ShellQuote(std::string_view arg);

// Joins argv into one shell command line, quoting every element.
std::string BuildShellCommand(const std::vector<std::string>& argv);

// Resolves `program` the way `command -v` would:
// - names containing a path separator are checked directly
// - bare names are searched on `PATH`
// Returns the absolute executable path when found, so a relative `PATH` entry
// or program name still resolves after a `cd`.
std::optional<std::filesystem::path> FindExecutable(std::string_view program);

// Runs `argv` through the shell (optionally inside `working_dir`) and captures
// combined stdout/stderr. Returns false only when the command could not be
// started; a non-zero `exit_code` is not a launch failure.
bool RunCommand(const std::vector<std::string>& argv, const std::filesystem::path& working_dir,
                std::string& output, int& exit_code, std::string& error);

} // namespace forgeops::core
