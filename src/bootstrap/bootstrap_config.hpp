#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace forgeops::bootstrap {

inline constexpr std::string_view kDefaultBaseDir = "ForgeOpsModules";
inline constexpr std::string_view kDefaultSignerProgram = "gpg";
inline constexpr std::string_view kDefaultBuildProgram = "mvn";

// Effective settings of one `forgeops bootstrap` invocation. Environment values
// are loaded first, CLI flags are applied on top.
struct BootstrapConfig {
  std::filesystem::path base_dir = std::string(kDefaultBaseDir);
  bool overwrite = false;
  bool sign = false;
  std::string gpg_key;
  std::string signer_program = std::string(kDefaultSignerProgram);
  bool build_services = false;
  std::string build_program = std::string(kDefaultBuildProgram);
  std::optional<std::filesystem::path> log_file;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  std::optional<std::filesystem::path> modules_file;
  std::vector<std::string> only_modules;
};

// Returns the value of one environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

EnvLookup ProcessEnvLookup();

// Strict `0`/`1` parsing for boolean environment variables. An empty value
// keeps `value` unchanged.
bool ParseEnvFlag(std::string_view name, std::string_view raw, bool& value, std::string& error);

// Reads BASE_DIR, FORCE, GPG_SIGN, GPG_KEY, FORGEOPS_GPG, BUILD_SERVICES,
// FORGEOPS_MVN, FORGEOPS_LOG_FILE and FORGEOPS_LOG_LEVEL into `config`.
// Malformed values fail with `error`; callers map that to a usage error.
bool LoadBootstrapConfigFromEnv(const EnvLookup& lookup, BootstrapConfig& config,
                                std::string& error);

// Applies `bootstrap` CLI flags on top of `config`. Unknown flags, missing
// values and positional arguments are usage errors.
bool ApplyBootstrapArgs(const std::vector<std::string_view>& args, BootstrapConfig& config,
                        std::string& error);

} // namespace forgeops::bootstrap
