#include "scaffold/scaffold_builder.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace forgeops::scaffold {

namespace {

WriteOutcome WriteSpec(const fs::path& root, const templates::ArtifactSpec& spec,
                       const RunContext& ctx) {
  return WriteArtifactFile(root / fs::path(spec.relative_path), spec.content, spec.executable,
                           ctx.overwrite, ctx.logger);
}

} // namespace

bool ScaffoldResult::Succeeded() const {
  if (error_kind != core::errors::ErrorKind::kNone) {
    return false;
  }
  return std::none_of(outcomes.begin(), outcomes.end(), [](const WriteOutcome& outcome) {
    return outcome.status == WriteStatus::kFailed;
  });
}

std::size_t ScaffoldResult::Count(WriteStatus status) const {
  return static_cast<std::size_t>(
      std::count_if(outcomes.begin(), outcomes.end(),
                    [status](const WriteOutcome& outcome) { return outcome.status == status; }));
}

const std::vector<std::string>& ModuleSkeletonDirs() {
  static const std::vector<std::string> dirs = {
      "bin", "etc", "lib", "docs", "tests", "ci", "packaging", "hooks", "docker", "k8s",
  };
  return dirs;
}

std::vector<ScaffoldExtension> DefaultScaffoldExtensions() {
  return {
      {"secrets-lifecycle", "secret-store bindings", templates::RenderSecretStoreExtras},
  };
}

bool SweepStaleTempFiles(const fs::path& root, std::size_t& removed_count, std::string& error) {
  removed_count = 0;
  std::error_code ec;
  if (!fs::exists(root, ec) || ec) {
    return true;
  }

  std::vector<fs::path> stale;
  for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator();
       it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_regular_file(entry_ec) && core::IsAtomicTempPath(it->path())) {
      stale.push_back(it->path());
    }
  }
  if (ec) {
    error = "failed while scanning for stale temp files under '" + root.string() + "': " +
            ec.message();
    return false;
  }

  for (const auto& path : stale) {
    fs::remove(path, ec);
    if (ec) {
      error = "failed to remove stale temp file '" + path.string() + "': " + ec.message();
      return false;
    }
    ++removed_count;
  }
  return true;
}

ScaffoldResult BuildModuleScaffold(const modules::ModuleDescriptor& module, const RunContext& ctx,
                                   const std::vector<ScaffoldExtension>& extensions) {
  ScaffoldResult result;
  result.module_root = ctx.base_dir / module.name;

  std::vector<fs::path> skeleton;
  skeleton.push_back(result.module_root);
  for (const auto& dir : ModuleSkeletonDirs()) {
    skeleton.push_back(result.module_root / dir);
  }
  skeleton.push_back(result.module_root / fs::path(templates::ServiceSourceDir(module.name)));

  for (const auto& dir : skeleton) {
    std::string error;
    if (!core::EnsureDirectoryTree(dir, error)) {
      result.error_kind = core::errors::ErrorKind::kDirectoryCreate;
      result.error = error;
      if (ctx.logger != nullptr) {
        ctx.logger->Error("module skeleton creation failed",
                          {{"module", module.name}, {"error", error}});
      }
      return result;
    }
  }

  std::string sweep_error;
  if (!SweepStaleTempFiles(result.module_root, result.stale_temp_files_removed, sweep_error)) {
    if (ctx.logger != nullptr) {
      ctx.logger->Warn("stale temp sweep failed", {{"module", module.name}, {"error", sweep_error}});
    }
  } else if (result.stale_temp_files_removed > 0U && ctx.logger != nullptr) {
    ctx.logger->Warn("removed stale temp files from interrupted run",
                     {{"module", module.name},
                      {"count", std::to_string(result.stale_temp_files_removed)}});
  }

  for (const auto kind : templates::AllTemplateKinds()) {
    result.outcomes.push_back(WriteSpec(result.module_root, templates::RenderTemplate(module, kind), ctx));
  }

  for (const auto& extension : extensions) {
    if (extension.module_name != module.name || !extension.render) {
      continue;
    }
    if (ctx.logger != nullptr) {
      ctx.logger->Info("applying scaffold extension",
                       {{"module", module.name}, {"extension", extension.label}});
    }
    for (const auto& spec : extension.render(module)) {
      result.outcomes.push_back(WriteSpec(result.module_root, spec, ctx));
    }
  }

  return result;
}

bool SweepTopLevelTempFiles(const fs::path& dir, std::size_t& removed_count, std::string& error) {
  removed_count = 0;
  std::error_code ec;
  if (!fs::is_directory(dir, ec) || ec) {
    return true;
  }

  std::vector<fs::path> stale;
  for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator();
       it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_regular_file(entry_ec) && core::IsAtomicTempPath(it->path())) {
      stale.push_back(it->path());
    }
  }
  if (ec) {
    error = "failed while scanning for stale temp files in '" + dir.string() + "': " +
            ec.message();
    return false;
  }

  for (const auto& path : stale) {
    fs::remove(path, ec);
    if (ec) {
      error = "failed to remove stale temp file '" + path.string() + "': " + ec.message();
      return false;
    }
    ++removed_count;
  }
  return true;
}

std::vector<WriteOutcome> WriteTopLevelArtifacts(const std::vector<modules::ModuleDescriptor>& modules,
                                                 const RunContext& ctx) {
  std::vector<WriteOutcome> outcomes;
  for (const auto& spec : templates::RenderTopLevelArtifacts(modules)) {
    outcomes.push_back(WriteSpec(ctx.base_dir, spec, ctx));
  }
  return outcomes;
}

} // namespace forgeops::scaffold
