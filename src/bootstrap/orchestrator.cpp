#include "bootstrap/orchestrator.hpp"

#include "artifacts/checksum_manifest_writer.hpp"
#include "core/fs_utils.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace forgeops::bootstrap {

namespace {

using core::errors::ErrorKind;

void Transition(ModuleReport& report, ModuleState next, core::logging::Logger& logger) {
  const ModuleState previous = report.state;
  report.state = next;
  report.history.push_back(next);

  const core::logging::LogLevel level =
      next == ModuleState::kFailed ? core::logging::LogLevel::kError : core::logging::LogLevel::kInfo;
  logger.Log(level, "module state",
             {{"module", report.module_name}, {"from", ToString(previous)}, {"to", ToString(next)}});
}

void FailModule(ModuleReport& report, ErrorKind kind, std::string error,
                core::logging::Logger& logger) {
  report.error_kind = kind;
  report.error = std::move(error);
  logger.Error("module failed", {{"module", report.module_name},
                                 {"error_kind", core::errors::ToString(kind)},
                                 {"error", report.error}});
  Transition(report, ModuleState::kFailed, logger);
}

// Signs `path` when a signer is configured. Without a signer, a signature left
// over from an earlier signed run no longer matches and is removed.
std::optional<fs::path> SignArtifact(const std::optional<artifacts::SignerCapability>& signer,
                                     const fs::path& path, std::string_view scope,
                                     std::vector<std::string>& warnings,
                                     core::logging::Logger& logger) {
  if (!signer.has_value()) {
    const fs::path stale = artifacts::SignaturePathFor(path);
    std::error_code ec;
    if (fs::remove(stale, ec)) {
      logger.Warn("removed stale signature", {{"scope", scope}, {"path", stale.string()}});
    }
    return std::nullopt;
  }

  std::string error;
  auto signature = artifacts::SignFile(*signer, path, error);
  if (!signature.has_value()) {
    const std::string warning = std::string(core::errors::ToString(ErrorKind::kSigning)) + ": " +
                                path.string() + ": " + error;
    logger.Warn("signing failed, artifact left unsigned",
                {{"scope", scope}, {"path", path.string()}, {"error", error}});
    warnings.push_back(warning);
    return std::nullopt;
  }

  logger.Info("signed artifact", {{"scope", scope}, {"signature", signature->string()}});
  return signature;
}

void RunBuildStep(const artifacts::BuildToolCapability& tool, const fs::path& module_root,
                  const fs::path& build_dir, ModuleReport& report, core::logging::Logger& logger) {
  artifacts::ServiceBuildResult result;
  std::string error;
  if (!artifacts::RunServiceBuild(tool, module_root, build_dir, result, error)) {
    logger.Warn("service build failed", {{"module", report.module_name}, {"error", error}});
    report.warnings.push_back(std::string(core::errors::ToString(ErrorKind::kBuildStep)) + ": " +
                              error);
    return;
  }
  if (result.attempted) {
    logger.Info("service build finished",
                {{"module", report.module_name}, {"build_dir", result.build_dir.string()}});
  }
}

ModuleReport RunModule(const modules::ModuleDescriptor& module, const BootstrapOptions& options,
                       const scaffold::RunContext& ctx, const fs::path& packaging_dir,
                       core::logging::Logger& logger) {
  ModuleReport report;
  report.module_name = module.name;
  report.history.push_back(ModuleState::kPending);
  const fs::path module_root = options.base_dir / module.name;

  Transition(report, ModuleState::kScaffolding, logger);
  const scaffold::ScaffoldResult scaffold =
      scaffold::BuildModuleScaffold(module, ctx, options.extensions);
  report.written = scaffold.Count(scaffold::WriteStatus::kWritten);
  report.skipped = scaffold.Count(scaffold::WriteStatus::kSkippedExisting);
  report.failed = scaffold.Count(scaffold::WriteStatus::kFailed);
  report.stale_temp_files_removed = scaffold.stale_temp_files_removed;
  if (!scaffold.Succeeded()) {
    if (scaffold.error_kind != ErrorKind::kNone) {
      FailModule(report, scaffold.error_kind, scaffold.error, logger);
      return report;
    }
    const auto first_failure =
        std::find_if(scaffold.outcomes.begin(), scaffold.outcomes.end(),
                     [](const scaffold::WriteOutcome& outcome) {
                       return outcome.status == scaffold::WriteStatus::kFailed;
                     });
    FailModule(report, first_failure->error_kind,
               std::to_string(report.failed) + " artifact(s) failed, first: " +
                   first_failure->path.string() + ": " + first_failure->error,
               logger);
    return report;
  }

  if (options.build_tool.has_value()) {
    RunBuildStep(*options.build_tool, module_root,
                 options.base_dir / std::string(kBuildDirName) / module.name, report, logger);
  }

  Transition(report, ModuleState::kManifesting, logger);
  report.manifest_path =
      module_root / std::string(kPackagingDirName) / std::string(artifacts::kManifestFileName);
  std::vector<artifacts::ManifestEntry> entries;
  std::string error;
  if (!artifacts::WriteManifestFile(module_root, report.manifest_path, artifacts::ManifestOptions{},
                                    entries, error)) {
    FailModule(report, ErrorKind::kManifestRead, error, logger);
    return report;
  }
  logger.Debug("module manifest written", {{"module", module.name},
                                           {"path", report.manifest_path.string()},
                                           {"entries", std::to_string(entries.size())}});

  Transition(report, ModuleState::kPackaging, logger);
  artifacts::PackageArtifact artifact;
  const fs::path archive_path = packaging_dir / (module.name + ".tar.gz");
  if (!artifacts::WriteTarGzArchive(module_root, archive_path, artifacts::TarGzOptions{}, artifact,
                                    error)) {
    FailModule(report, ErrorKind::kArchive, error, logger);
    return report;
  }
  artifact.signature_path =
      SignArtifact(options.signer, archive_path, module.name, report.warnings, logger);
  report.package = artifact;

  Transition(report, report.Signed() ? ModuleState::kSigned : ModuleState::kUnsigned, logger);
  Transition(report, ModuleState::kDone, logger);
  return report;
}

std::string JoinNames(const std::vector<std::string>& failed_modules) {
  std::string joined;
  for (const auto& name : failed_modules) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += name;
  }
  return joined;
}

} // namespace

const char* ToString(ModuleState state) {
  switch (state) {
  case ModuleState::kPending:
    return "Pending";
  case ModuleState::kScaffolding:
    return "Scaffolding";
  case ModuleState::kManifesting:
    return "Manifesting";
  case ModuleState::kPackaging:
    return "Packaging";
  case ModuleState::kSigned:
    return "Signed";
  case ModuleState::kUnsigned:
    return "Unsigned";
  case ModuleState::kDone:
    return "Done";
  case ModuleState::kFailed:
    return "Failed";
  }

  return "Pending";
}

std::size_t BootstrapSummary::FailedModuleCount() const {
  return static_cast<std::size_t>(std::count_if(
      modules.begin(), modules.end(), [](const ModuleReport& report) { return report.Failed(); }));
}

std::vector<std::string> TreeExclusions(const std::vector<std::string>& failed_modules) {
  std::vector<std::string> excluded = {
      std::string(kPackagingDirName) + "/",
      std::string(kLogsDirName) + "/",
      std::string(kBuildDirName) + "/",
  };
  for (const auto& name : failed_modules) {
    excluded.push_back(name + "/");
  }
  return excluded;
}

BootstrapSummary RunBootstrap(const modules::ModuleRegistry& registry,
                              const BootstrapOptions& options, core::logging::Logger& logger) {
  BootstrapSummary summary;
  summary.run_id = logger.RunId();
  summary.base_dir = options.base_dir;

  const fs::path packaging_dir = options.base_dir / std::string(kPackagingDirName);
  std::string error;
  if (!core::EnsureDirectoryTree(options.base_dir, error) ||
      !core::EnsureDirectoryTree(packaging_dir, error)) {
    logger.Error("failed to prepare base directory",
                 {{"base_dir", options.base_dir.string()}, {"error", error}});
    summary.errors.push_back(std::string(core::errors::ToString(ErrorKind::kDirectoryCreate)) +
                             ": " + error);
    summary.exit_code = core::errors::ExitCode::kDirectoryCreateFailed;
    return summary;
  }

  logger.Info("bootstrap started", {{"base_dir", options.base_dir.string()},
                                    {"modules", std::to_string(registry.Size())},
                                    {"overwrite", options.overwrite ? "1" : "0"},
                                    {"signing", options.signer.has_value() ? "1" : "0"},
                                    {"service_build", options.build_tool.has_value() ? "1" : "0"}});

  const scaffold::RunContext ctx{options.base_dir, options.overwrite, &logger};
  std::vector<std::string> failed_modules;
  for (const auto& module : registry.Modules()) {
    summary.modules.push_back(RunModule(module, options, ctx, packaging_dir, logger));
    if (summary.modules.back().Failed()) {
      failed_modules.push_back(module.name);
    }
  }

  bool top_level_failed = false;
  std::size_t top_level_stale = 0;
  if (!scaffold::SweepTopLevelTempFiles(options.base_dir, top_level_stale, error)) {
    logger.Warn("stale temp sweep failed", {{"dir", options.base_dir.string()}, {"error", error}});
  } else if (top_level_stale > 0) {
    logger.Info("removed stale temp files", {{"dir", options.base_dir.string()},
                                             {"count", std::to_string(top_level_stale)}});
  }
  summary.top_level_outcomes = scaffold::WriteTopLevelArtifacts(registry.Modules(), ctx);
  for (const auto& outcome : summary.top_level_outcomes) {
    if (outcome.status == scaffold::WriteStatus::kFailed) {
      top_level_failed = true;
      summary.errors.push_back(std::string(core::errors::ToString(outcome.error_kind)) + ": " +
                               outcome.path.string() + ": " + outcome.error);
    }
  }

  const std::vector<std::string> exclusions = TreeExclusions(failed_modules);
  if (!failed_modules.empty()) {
    logger.Warn("failed modules left out of whole-tree outputs",
                {{"modules", JoinNames(failed_modules)}});
  }

  bool manifest_failed = false;
  summary.tree_manifest_path = packaging_dir / std::string(artifacts::kManifestFileName);
  artifacts::ManifestOptions manifest_options;
  manifest_options.excluded_paths = exclusions;
  std::vector<artifacts::ManifestEntry> entries;
  if (artifacts::WriteManifestFile(options.base_dir, summary.tree_manifest_path, manifest_options,
                                   entries, error)) {
    logger.Info("tree manifest written", {{"path", summary.tree_manifest_path.string()},
                                          {"entries", std::to_string(entries.size())}});
    summary.tree_manifest_signature =
        SignArtifact(options.signer, summary.tree_manifest_path, "tree", summary.warnings, logger);
  } else {
    manifest_failed = true;
    logger.Error("tree manifest failed", {{"error", error}});
    summary.errors.push_back(std::string(core::errors::ToString(ErrorKind::kManifestRead)) + ": " +
                             error);
  }

  bool archive_failed = false;
  artifacts::TarGzOptions archive_options;
  archive_options.excluded_paths = exclusions;
  artifacts::PackageArtifact tree_artifact;
  const fs::path tree_archive_path = packaging_dir / std::string(kTreeArchiveFileName);
  if (artifacts::WriteTarGzArchive(options.base_dir, tree_archive_path, archive_options,
                                   tree_artifact, error)) {
    logger.Info("tree archive written", {{"path", tree_archive_path.string()},
                                         {"files", std::to_string(tree_artifact.file_count)}});
    tree_artifact.signature_path =
        SignArtifact(options.signer, tree_archive_path, "tree", summary.warnings, logger);
    summary.tree_package = tree_artifact;
  } else {
    archive_failed = true;
    logger.Error("tree archive failed", {{"error", error}});
    summary.errors.push_back(std::string(core::errors::ToString(ErrorKind::kArchive)) + ": " +
                             error);
  }

  if (manifest_failed) {
    summary.exit_code = core::errors::ExitCode::kManifestFailed;
  } else if (archive_failed) {
    summary.exit_code = core::errors::ExitCode::kArchiveFailed;
  } else if (!failed_modules.empty()) {
    summary.exit_code = core::errors::ExitCode::kModulesFailed;
  } else if (top_level_failed) {
    summary.exit_code = core::errors::ExitCode::kFailure;
  }

  logger.Info("bootstrap finished",
              {{"exit_code", std::to_string(core::errors::ToInt(summary.exit_code))},
               {"modules_failed", std::to_string(failed_modules.size())},
               {"tree_warnings", std::to_string(summary.warnings.size())}});
  return summary;
}

void PrintBootstrapSummary(const BootstrapSummary& summary, std::ostream& out) {
  const std::size_t failed = summary.FailedModuleCount();
  out << "run_id: " << summary.run_id << '\n'
      << "base_dir: " << summary.base_dir.string() << '\n'
      << "modules: " << summary.modules.size() << " total, " << (summary.modules.size() - failed)
      << " done, " << failed << " failed\n";

  for (const auto& report : summary.modules) {
    out << "  [" << ToString(report.state) << "] " << report.module_name;
    if (report.Failed()) {
      out << " error=" << core::errors::ToString(report.error_kind) << ": " << report.error << '\n';
      continue;
    }
    out << (report.Signed() ? " signed" : " unsigned") << " written=" << report.written
        << " skipped=" << report.skipped << " failed=" << report.failed << '\n';
    if (report.package.has_value()) {
      out << "      archive: " << report.package->archive_path.string() << '\n';
      if (report.package->signature_path.has_value()) {
        out << "      signature: " << report.package->signature_path->string() << '\n';
      }
    }
    for (const auto& warning : report.warnings) {
      out << "      warning: " << warning << '\n';
    }
  }

  if (!summary.tree_manifest_path.empty()) {
    out << "tree_manifest: " << summary.tree_manifest_path.string() << '\n';
    if (summary.tree_manifest_signature.has_value()) {
      out << "tree_manifest_signature: " << summary.tree_manifest_signature->string() << '\n';
    }
  }
  if (summary.tree_package.has_value()) {
    out << "tree_archive: " << summary.tree_package->archive_path.string() << " ("
        << summary.tree_package->file_count << " files)\n";
    if (summary.tree_package->signature_path.has_value()) {
      out << "tree_archive_signature: " << summary.tree_package->signature_path->string() << '\n';
    }
  }
  for (const auto& warning : summary.warnings) {
    out << "warning: " << warning << '\n';
  }
  for (const auto& error : summary.errors) {
    out << "error: " << error << '\n';
  }
  out << "exit_code: " << core::errors::ToInt(summary.exit_code) << '\n';
}

} // namespace forgeops::bootstrap
