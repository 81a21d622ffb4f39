#include "bootstrap/bootstrap_config.hpp"

#include <cstdlib>
#include <utility>

namespace forgeops::bootstrap {

namespace {

bool ReadNextValue(const std::vector<std::string_view>& args, std::size_t& index,
                   std::string_view flag, std::string& value, std::string& error) {
  if (index + 1 >= args.size() || args[index + 1].empty()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = std::string(args[index + 1]);
  ++index;
  return true;
}

} // namespace

EnvLookup ProcessEnvLookup() {
  return [](std::string_view name) -> std::optional<std::string> {
    const char* raw = std::getenv(std::string(name).c_str());
    if (raw == nullptr) {
      return std::nullopt;
    }
    return std::string(raw);
  };
}

bool ParseEnvFlag(std::string_view name, std::string_view raw, bool& value, std::string& error) {
  if (raw.empty()) {
    return true;
  }
  if (raw == "1") {
    value = true;
    return true;
  }
  if (raw == "0") {
    value = false;
    return true;
  }
  error = "invalid value for " + std::string(name) + ": '" + std::string(raw) +
          "' (expected 0 or 1)";
  return false;
}

bool LoadBootstrapConfigFromEnv(const EnvLookup& lookup, BootstrapConfig& config,
                                std::string& error) {
  if (const auto base_dir = lookup("BASE_DIR"); base_dir.has_value() && !base_dir->empty()) {
    config.base_dir = *base_dir;
  }

  const std::pair<std::string_view, bool*> flags[] = {
      {"FORCE", &config.overwrite},
      {"GPG_SIGN", &config.sign},
      {"BUILD_SERVICES", &config.build_services},
  };
  for (const auto& [name, target] : flags) {
    if (const auto raw = lookup(name); raw.has_value()) {
      if (!ParseEnvFlag(name, *raw, *target, error)) {
        return false;
      }
    }
  }

  if (const auto key = lookup("GPG_KEY"); key.has_value()) {
    config.gpg_key = *key;
  }
  if (const auto program = lookup("FORGEOPS_GPG"); program.has_value() && !program->empty()) {
    config.signer_program = *program;
  }
  if (const auto program = lookup("FORGEOPS_MVN"); program.has_value() && !program->empty()) {
    config.build_program = *program;
  }
  if (const auto log_file = lookup("FORGEOPS_LOG_FILE"); log_file.has_value() && !log_file->empty()) {
    config.log_file = std::filesystem::path(*log_file);
  }
  if (const auto level = lookup("FORGEOPS_LOG_LEVEL"); level.has_value() && !level->empty()) {
    std::string level_error;
    if (!core::logging::ParseLogLevel(*level, config.log_level, level_error)) {
      error = "FORGEOPS_LOG_LEVEL: " + level_error;
      return false;
    }
  }
  return true;
}

bool ApplyBootstrapArgs(const std::vector<std::string_view>& args, BootstrapConfig& config,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;

    if (token == "--force") {
      config.overwrite = true;
      continue;
    }
    if (token == "--sign") {
      config.sign = true;
      continue;
    }
    if (token == "--build-services") {
      config.build_services = true;
      continue;
    }
    if (token == "--base-dir") {
      if (!ReadNextValue(args, i, token, value, error)) {
        return false;
      }
      config.base_dir = value;
      continue;
    }
    if (token == "--gpg-key") {
      if (!ReadNextValue(args, i, token, value, error)) {
        return false;
      }
      config.gpg_key = value;
      continue;
    }
    if (token == "--gpg") {
      if (!ReadNextValue(args, i, token, value, error)) {
        return false;
      }
      config.signer_program = value;
      continue;
    }
    if (token == "--modules") {
      if (!ReadNextValue(args, i, token, value, error)) {
        return false;
      }
      config.modules_file = std::filesystem::path(value);
      continue;
    }
    if (token == "--only") {
      if (!ReadNextValue(args, i, token, value, error)) {
        return false;
      }
      config.only_modules.push_back(value);
      continue;
    }
    if (token == "--log-file") {
      if (!ReadNextValue(args, i, token, value, error)) {
        return false;
      }
      config.log_file = std::filesystem::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!ReadNextValue(args, i, token, value, error)) {
        return false;
      }
      if (!core::logging::ParseLogLevel(value, config.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
    } else {
      error = "unexpected argument: " + std::string(token);
    }
    return false;
  }
  return true;
}

} // namespace forgeops::bootstrap
