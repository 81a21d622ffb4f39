#pragma once

#include "artifacts/detached_signer.hpp"
#include "artifacts/service_build_step.hpp"
#include "artifacts/tar_gz_writer.hpp"
#include "core/errors/error_kind.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "modules/module_registry.hpp"
#include "scaffold/scaffold_builder.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace forgeops::bootstrap {

inline constexpr std::string_view kPackagingDirName = "packaging";
inline constexpr std::string_view kBuildDirName = "build";
inline constexpr std::string_view kLogsDirName = "logs";
inline constexpr std::string_view kTreeArchiveFileName = "forgeops_modules.tar.gz";

// Per-module lifecycle:
//   Pending -> Scaffolding -> Manifesting -> Packaging -> (Signed | Unsigned) -> Done
// with Failed reachable from every non-terminal state.
enum class ModuleState {
  kPending,
  kScaffolding,
  kManifesting,
  kPackaging,
  kSigned,
  kUnsigned,
  kDone,
  kFailed,
};

const char* ToString(ModuleState state);

struct ModuleReport {
  std::string module_name;
  ModuleState state = ModuleState::kPending;
  // Every state the module entered, in order, starting with kPending.
  std::vector<ModuleState> history;

  std::size_t written = 0;
  std::size_t skipped = 0;
  std::size_t failed = 0;
  std::size_t stale_temp_files_removed = 0;

  std::filesystem::path manifest_path;
  std::optional<artifacts::PackageArtifact> package;

  // First fatal error of the module (state kFailed).
  core::errors::ErrorKind error_kind = core::errors::ErrorKind::kNone;
  std::string error;
  // Non-fatal SigningError / BuildStepError notes.
  std::vector<std::string> warnings;

  bool Failed() const {
    return state == ModuleState::kFailed;
  }

  bool Signed() const {
    return package.has_value() && package->signature_path.has_value();
  }
};

struct BootstrapOptions {
  std::filesystem::path base_dir;
  bool overwrite = false;
  std::optional<artifacts::SignerCapability> signer;
  std::optional<artifacts::BuildToolCapability> build_tool;
  std::vector<scaffold::ScaffoldExtension> extensions;
};

struct BootstrapSummary {
  std::string run_id;
  std::filesystem::path base_dir;
  std::vector<ModuleReport> modules;
  std::vector<scaffold::WriteOutcome> top_level_outcomes;

  std::filesystem::path tree_manifest_path;
  std::optional<std::filesystem::path> tree_manifest_signature;
  std::optional<artifacts::PackageArtifact> tree_package;

  // Run-level warnings (tree signing); module warnings stay on ModuleReport.
  std::vector<std::string> warnings;
  std::vector<std::string> errors;
  core::errors::ExitCode exit_code = core::errors::ExitCode::kSuccess;

  std::size_t FailedModuleCount() const;
};

// Whole-tree manifest/archive exclusions: the packaging, logs and build output
// directories plus every module in `failed_modules`.
std::vector<std::string> TreeExclusions(const std::vector<std::string>& failed_modules);

// Runs the full pipeline for every registry module, sequentially in registry
// order, then writes the top-level artifacts and the whole-tree manifest and
// archive.
//
// Exit code precedence (first match wins):
//   20 base/packaging directory not creatable (nothing else runs)
//   40 whole-tree manifest failed
//   50 whole-tree archive failed
//   30 one or more modules failed
//    1 a top-level artifact could not be written
//    0 otherwise
// Signing and service build failures are warnings and never change the exit
// code.
BootstrapSummary RunBootstrap(const modules::ModuleRegistry& registry,
                              const BootstrapOptions& options, core::logging::Logger& logger);

// Human-readable run summary (stdout in the CLI).
void PrintBootstrapSummary(const BootstrapSummary& summary, std::ostream& out);

} // namespace forgeops::bootstrap
