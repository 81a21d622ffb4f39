#pragma once

#include "core/errors/error_kind.hpp"
#include "modules/module_registry.hpp"
#include "scaffold/atomic_file_writer.hpp"
#include "scaffold/run_context.hpp"
#include "templates/template_renderer.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace forgeops::scaffold {

// Module-specific extra artifacts, keyed by module name.
struct ScaffoldExtension {
  std::string module_name;
  std::string label;
  std::function<std::vector<templates::ArtifactSpec>(const modules::ModuleDescriptor&)> render;
};

struct ScaffoldResult {
  std::filesystem::path module_root;
  std::vector<WriteOutcome> outcomes;
  // Set when the skeleton itself could not be created; no files were written.
  core::errors::ErrorKind error_kind = core::errors::ErrorKind::kNone;
  std::string error;
  std::size_t stale_temp_files_removed = 0;

  bool Succeeded() const;
  std::size_t Count(WriteStatus status) const;
};

// Fixed per-module directory skeleton, relative to the module root.
const std::vector<std::string>& ModuleSkeletonDirs();

// Extension table used by the bootstrap command (secrets-lifecycle secret
// store stubs).
std::vector<ScaffoldExtension> DefaultScaffoldExtensions();

// Removes `*.tmp.<tick>.<n>` leftovers of an interrupted writer under `root`.
bool SweepStaleTempFiles(const std::filesystem::path& root, std::size_t& removed_count,
                         std::string& error);

// Same as SweepStaleTempFiles but only for files directly inside `dir`; used
// at the base dir, where module trees are swept by their own runs.
bool SweepTopLevelTempFiles(const std::filesystem::path& dir, std::size_t& removed_count,
                            std::string& error);

// Materializes one module under `ctx.base_dir / module.name`.
//
// - Skeleton directories (plus the service source package) are created before
//   any file; a skeleton failure fails the module with DirectoryCreateError.
// - Every TemplateKind, then every matching extension artifact, is rendered and
//   written. A failed artifact does not stop its siblings.
// - The module succeeded iff no outcome is kFailed.
ScaffoldResult BuildModuleScaffold(const modules::ModuleDescriptor& module, const RunContext& ctx,
                                   const std::vector<ScaffoldExtension>& extensions);

// Writes the shared files at the base dir (README, module listing, test runner).
std::vector<WriteOutcome> WriteTopLevelArtifacts(const std::vector<modules::ModuleDescriptor>& modules,
                                                 const RunContext& ctx);

} // namespace forgeops::scaffold
