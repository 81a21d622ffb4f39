#include "forgeops/cli/router.hpp"

#include "artifacts/checksum_manifest_writer.hpp"
#include "bootstrap/bootstrap_config.hpp"
#include "bootstrap/capabilities.hpp"
#include "bootstrap/orchestrator.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "modules/module_registry.hpp"
#include "scaffold/scaffold_builder.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace forgeops::cli {

namespace {

using core::errors::ExitCode;

constexpr int kExitSuccess = core::errors::ToInt(ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(ExitCode::kUsage);
constexpr int kExitMissingTool = core::errors::ToInt(ExitCode::kMissingTool);
constexpr int kExitManifestFailed = core::errors::ToInt(ExitCode::kManifestFailed);
constexpr int kExitRegistryInvalid = core::errors::ToInt(ExitCode::kRegistryInvalid);
constexpr int kExitVerifyMismatch = core::errors::ToInt(ExitCode::kVerifyMismatch);

constexpr std::string_view kVersion = "forgeops 0.1.0";

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  forgeops bootstrap [--base-dir <dir>] [--force] [--sign] [--gpg-key <id>] "
         "[--gpg <program>] [--modules <file>] [--only <name>]... [--build-services] "
         "[--log-file <path>] [--log-level <debug|info|warn|error>]\n"
      << "  forgeops manifest <dir> [--out <file>]\n"
      << "  forgeops verify <dir> [--manifest <file>] [--strict]\n"
      << "  forgeops modules [--modules <file>]\n"
      << "  forgeops version\n";
}

void PrintBootstrapEnvironment(std::ostream& out) {
  out << "environment:\n"
      << "  BASE_DIR (default ./" << bootstrap::kDefaultBaseDir << "), FORCE=0|1, GPG_SIGN=0|1, "
      << "GPG_KEY, FORGEOPS_GPG, BUILD_SERVICES=0|1, FORGEOPS_MVN, FORGEOPS_LOG_FILE, "
      << "FORGEOPS_LOG_LEVEL\n";
}

struct ManifestCommandOptions {
  fs::path root_dir;
  std::optional<fs::path> output_path;
};

struct VerifyCommandOptions {
  fs::path root_dir;
  std::optional<fs::path> manifest_path;
  bool strict = false;
};

// Shared by `bootstrap` and `modules`: built-in catalogue unless a registry
// file is given. Returns an exit code; kExitSuccess means `registry` is ready.
int LoadRegistry(const std::optional<fs::path>& modules_file, modules::ModuleRegistry& registry) {
  std::vector<modules::RegistryIssue> issues;
  std::string error;
  bool loaded = false;
  if (modules_file.has_value()) {
    loaded = modules::LoadModuleRegistryFile(*modules_file, registry, issues, error);
  } else {
    loaded = modules::DefaultModuleRegistry(registry, issues);
    if (!loaded) {
      error = "built-in module catalogue is invalid";
    }
  }

  if (!loaded) {
    std::cerr << "error: " << error << '\n';
    for (const auto& issue : issues) {
      std::cerr << "  - " << (issue.module_name.empty() ? "<unnamed>" : issue.module_name) << ": "
                << issue.message << '\n';
    }
    return kExitRegistryInvalid;
  }
  return kExitSuccess;
}

bool ParseManifestOptions(const std::vector<std::string_view>& args,
                          ManifestCommandOptions& options, std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--out") {
      if (i + 1 >= args.size()) {
        error = "missing value for --out";
        return false;
      }
      options.output_path = fs::path(args[i + 1]);
      ++i;
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.root_dir.empty()) {
      error = "manifest accepts exactly one <dir>";
      return false;
    }
    options.root_dir = fs::path(token);
  }

  if (options.root_dir.empty()) {
    error = "manifest requires <dir>";
    return false;
  }
  return true;
}

bool ParseVerifyOptions(const std::vector<std::string_view>& args, VerifyCommandOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--manifest") {
      if (i + 1 >= args.size()) {
        error = "missing value for --manifest";
        return false;
      }
      options.manifest_path = fs::path(args[i + 1]);
      ++i;
      continue;
    }
    if (token == "--strict") {
      options.strict = true;
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.root_dir.empty()) {
      error = "verify accepts exactly one <dir>";
      return false;
    }
    options.root_dir = fs::path(token);
  }

  if (options.root_dir.empty()) {
    error = "verify requires <dir>";
    return false;
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << kVersion << '\n';
  return kExitSuccess;
}

int CommandModules(const std::vector<std::string_view>& args) {
  std::optional<fs::path> modules_file;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--modules" && i + 1 < args.size()) {
      modules_file = fs::path(args[i + 1]);
      ++i;
      continue;
    }
    std::cerr << "error: "
              << (args[i] == "--modules" ? std::string("missing value for --modules")
                                         : "unknown argument: " + std::string(args[i]))
              << '\n';
    return kExitUsage;
  }

  modules::ModuleRegistry registry;
  const int load_code = LoadRegistry(modules_file, registry);
  if (load_code != kExitSuccess) {
    return load_code;
  }

  for (const auto& module : registry.Modules()) {
    std::cout << module.name << ": " << module.description << '\n';
  }
  return kExitSuccess;
}

int CommandManifest(const std::vector<std::string_view>& args) {
  ManifestCommandOptions options;
  std::string error;
  if (!ParseManifestOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  std::vector<artifacts::ManifestEntry> entries;
  if (options.output_path.has_value()) {
    if (!artifacts::WriteManifestFile(options.root_dir, *options.output_path,
                                      artifacts::ManifestOptions{}, entries, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitManifestFailed;
    }
    std::cout << "manifest: " << options.output_path->string() << " (" << entries.size()
              << " files)\n";
    return kExitSuccess;
  }

  if (!artifacts::GenerateManifest(options.root_dir, artifacts::ManifestOptions{}, entries, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitManifestFailed;
  }
  std::cout << artifacts::FormatManifest(entries);
  return kExitSuccess;
}

int CommandVerify(const std::vector<std::string_view>& args) {
  VerifyCommandOptions options;
  std::string error;
  if (!ParseVerifyOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const fs::path manifest_path = options.manifest_path.value_or(
      options.root_dir / std::string(bootstrap::kPackagingDirName) /
      std::string(artifacts::kManifestFileName));

  // Bootstrap output dirs (archives, build and log output) are never listed in
  // a tree manifest, so they are not reported as unlisted either.
  artifacts::ManifestOptions verify_options;
  verify_options.excluded_paths = bootstrap::TreeExclusions({});

  artifacts::VerifyReport report;
  if (!artifacts::VerifyManifestFile(options.root_dir, manifest_path, verify_options, report,
                                     error)) {
    std::cerr << "error: " << error << '\n';
    return kExitManifestFailed;
  }

  for (const auto& path : report.missing) {
    std::cout << "missing: " << path << '\n';
  }
  for (const auto& path : report.mismatched) {
    std::cout << "mismatch: " << path << '\n';
  }
  for (const auto& path : report.unlisted) {
    std::cout << "unlisted: " << path << '\n';
  }

  const bool failed = !report.missing.empty() || !report.mismatched.empty() ||
                      (options.strict && !report.unlisted.empty());
  std::cout << (failed ? "verify failed: " : "verified: ") << report.checked << " of "
            << (report.checked + report.missing.size()) << " listed files match\n";
  return failed ? kExitVerifyMismatch : kExitSuccess;
}

int CommandBootstrap(const std::vector<std::string_view>& args) {
  bootstrap::BootstrapConfig config;
  std::string error;
  if (!bootstrap::LoadBootstrapConfigFromEnv(bootstrap::ProcessEnvLookup(), config, error) ||
      !bootstrap::ApplyBootstrapArgs(args, config, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    PrintBootstrapEnvironment(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger(config.log_level);
  logger.SetRunId("bootstrap-" +
                  core::FormatCompactUtcTimestamp(std::chrono::system_clock::now()));

  std::ofstream log_stream;
  if (config.log_file.has_value()) {
    if (!core::EnsureParentDirectory(*config.log_file, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    log_stream.open(*config.log_file, std::ios::app);
    if (!log_stream) {
      std::cerr << "error: unable to open log file: " << config.log_file->string() << '\n';
      return kExitFailure;
    }
    logger.SetMirror(&log_stream);
  }

  modules::ModuleRegistry registry;
  const int load_code = LoadRegistry(config.modules_file, registry);
  if (load_code != kExitSuccess) {
    return load_code;
  }
  if (!config.only_modules.empty() && !registry.RetainOnly(config.only_modules, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  bootstrap::Capabilities capabilities;
  if (!bootstrap::ResolveCapabilities(config, capabilities, error)) {
    logger.Error("pre-flight failed", {{"error_kind", "MissingToolError"}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitMissingTool;
  }
  for (const auto& warning : capabilities.warnings) {
    logger.Warn(warning);
  }

  bootstrap::BootstrapOptions options;
  options.base_dir = config.base_dir;
  options.overwrite = config.overwrite;
  options.signer = capabilities.signer;
  options.build_tool = capabilities.build_tool;
  options.extensions = scaffold::DefaultScaffoldExtensions();

  const bootstrap::BootstrapSummary summary = bootstrap::RunBootstrap(registry, options, logger);
  bootstrap::PrintBootstrapSummary(summary, std::cout);
  return core::errors::ToInt(summary.exit_code);
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "bootstrap") {
    return CommandBootstrap(args);
  }

  if (command == "manifest") {
    return CommandManifest(args);
  }

  if (command == "verify") {
    return CommandVerify(args);
  }

  if (command == "modules") {
    return CommandModules(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace forgeops::cli
