#include "bootstrap/orchestrator.hpp"

#include "core/fs_utils.hpp"

#include "common/assertions.hpp"
#include "common/env_override.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using forgeops::bootstrap::BootstrapOptions;
using forgeops::bootstrap::BootstrapSummary;
using forgeops::bootstrap::ModuleState;
using forgeops::core::errors::ExitCode;
using forgeops::tests::common::AssertContains;
using forgeops::tests::common::AssertNotContains;
using forgeops::tests::common::AssertTrue;
using forgeops::tests::common::Fail;
using forgeops::tests::common::ReadFileToString;
using forgeops::tests::common::SnapshotTree;
using forgeops::tests::common::WriteExecutableScript;
using forgeops::tests::common::WriteFileOrFail;

namespace {

constexpr const char* kFakeGpg = R"(#!/bin/sh
out=""
file=""
while [ $# -gt 0 ]; do
  case "$1" in
    --output) out="$2"; shift 2 ;;
    --detach-sign) file="$2"; shift 2 ;;
    *) shift ;;
  esac
done
printf 'signature-of:%s\n' "$file" > "$out"
)";

constexpr const char* kBrokenGpg = R"(#!/bin/sh
echo "gpg: no default secret key" >&2
exit 2
)";

forgeops::modules::ModuleRegistry TestRegistry() {
  forgeops::modules::ModuleRegistry registry;
  std::vector<forgeops::modules::RegistryIssue> issues;
  if (!forgeops::modules::BuildModuleRegistry(
          {{"alpha", "Alpha module"}, {"secrets-lifecycle", "Secrets Lifecycle"}}, registry,
          issues)) {
    Fail("test registry invalid");
  }
  return registry;
}

BootstrapSummary Run(const fs::path& base_dir, const BootstrapOptions& base_options,
                     std::ostringstream& log_text) {
  forgeops::core::logging::Logger logger(forgeops::core::logging::LogLevel::kDebug, log_text);
  logger.SetRunId("bootstrap-test");
  BootstrapOptions options = base_options;
  options.base_dir = base_dir;
  options.extensions = forgeops::scaffold::DefaultScaffoldExtensions();
  return forgeops::bootstrap::RunBootstrap(TestRegistry(), options, logger);
}

const forgeops::bootstrap::ModuleReport& ReportFor(const BootstrapSummary& summary,
                                                    const std::string& name) {
  for (const auto& report : summary.modules) {
    if (report.module_name == name) {
      return report;
    }
  }
  Fail("no report for module " + name);
}

void AssertCleanRun(const fs::path& base) {
  std::ostringstream log_text;
  const BootstrapSummary summary = Run(base, BootstrapOptions{}, log_text);
  AssertTrue(summary.exit_code == ExitCode::kSuccess, "clean run must succeed");
  AssertTrue(summary.FailedModuleCount() == 0U, "no module may fail");

  const auto& alpha = ReportFor(summary, "alpha");
  const std::vector<ModuleState> expected = {
      ModuleState::kPending,   ModuleState::kScaffolding, ModuleState::kManifesting,
      ModuleState::kPackaging, ModuleState::kUnsigned,    ModuleState::kDone,
  };
  AssertTrue(alpha.history == expected, "unexpected state sequence");
  AssertTrue(alpha.state == ModuleState::kDone, "module must end Done");
  AssertTrue(alpha.package.has_value() && !alpha.Signed(), "unsigned package expected");
  AssertTrue(fs::is_regular_file(base / "packaging" / "alpha.tar.gz"), "module archive missing");
  AssertTrue(!fs::exists(base / "packaging" / "alpha.tar.gz.sig"), "unexpected signature");
  AssertTrue(fs::is_regular_file(base / "alpha" / "packaging" / "SHASUMS256.txt"),
             "module manifest missing");
  AssertTrue(fs::is_regular_file(base / "packaging" / "SHASUMS256.txt"), "tree manifest missing");
  AssertTrue(fs::is_regular_file(base / "packaging" / "forgeops_modules.tar.gz"),
             "tree archive missing");
  AssertTrue(fs::is_regular_file(base / "PACKAGING_MANIFEST.txt"), "top-level listing missing");

  const std::string tree_manifest = ReadFileToString(base / "packaging" / "SHASUMS256.txt");
  AssertContains(tree_manifest, "  alpha/README.md\n");
  AssertContains(tree_manifest, "  alpha/packaging/SHASUMS256.txt\n");
  AssertContains(tree_manifest, "  secrets-lifecycle/bin/secrets_hvac.py\n");
  AssertNotContains(tree_manifest, "  packaging/");

  AssertContains(log_text.str(), "msg=\"module state\" module=\"alpha\" from=\"Pending\" "
                                 "to=\"Scaffolding\"");
  AssertContains(log_text.str(), "from=\"Unsigned\" to=\"Done\"");

  std::ostringstream printed;
  forgeops::bootstrap::PrintBootstrapSummary(summary, printed);
  AssertContains(printed.str(), "modules: 2 total, 2 done, 0 failed");
  AssertContains(printed.str(), "[Done] alpha unsigned");
  AssertContains(printed.str(), "exit_code: 0");
}

} // namespace

int main() {
  const fs::path root = forgeops::tests::common::CreateUniqueTempDir("forgeops-orchestrator");

  // Clean run, then an idempotent re-run that changes nothing on disk.
  const fs::path base = root / "clean";
  AssertCleanRun(base);
  const auto first_snapshot = SnapshotTree(base);
  {
    std::ostringstream log_text;
    const BootstrapSummary rerun = Run(base, BootstrapOptions{}, log_text);
    AssertTrue(rerun.exit_code == ExitCode::kSuccess, "re-run must succeed");
    const auto& alpha = ReportFor(rerun, "alpha");
    AssertTrue(alpha.written == 0U && alpha.skipped > 0U, "re-run must skip every artifact");
    AssertTrue(SnapshotTree(base) == first_snapshot, "re-run changed the tree");
  }

  // Fault isolation: alpha cannot build its skeleton, secrets-lifecycle still
  // completes, and the failed module is never manifested or packaged.
  const fs::path faulty = root / "faulty";
  WriteFileOrFail(faulty / "alpha" / "bin", "blocks the bin directory\n");
  {
    std::ostringstream log_text;
    const BootstrapSummary summary = Run(faulty, BootstrapOptions{}, log_text);
    AssertTrue(summary.exit_code == ExitCode::kModulesFailed, "failed module must give exit 30");
    const auto& alpha = ReportFor(summary, "alpha");
    AssertTrue(alpha.state == ModuleState::kFailed, "alpha must fail");
    AssertTrue(alpha.error_kind == forgeops::core::errors::ErrorKind::kDirectoryCreate,
               "alpha failure must be a DirectoryCreateError");
    AssertTrue(ReportFor(summary, "secrets-lifecycle").state == ModuleState::kDone,
               "sibling module must complete");
    AssertTrue(!fs::exists(faulty / "packaging" / "alpha.tar.gz"), "failed module was packaged");
    AssertTrue(!fs::exists(faulty / "alpha" / "packaging" / "SHASUMS256.txt"),
               "failed module was manifested");
    AssertTrue(fs::exists(faulty / "packaging" / "secrets-lifecycle.tar.gz"),
               "sibling archive missing");
    AssertNotContains(ReadFileToString(faulty / "packaging" / "SHASUMS256.txt"), "  alpha/");
    AssertContains(log_text.str(), "error_kind=\"DirectoryCreateError\"");
  }

  // One artifact of alpha cannot be published: the rest of alpha is still
  // written, alpha fails with a WriteError and the sibling module completes.
  const fs::path partial = root / "partial";
  AssertCleanRun(partial);
  WriteFileOrFail(partial / "alpha" / "README.md", "local edit\n");
  fs::remove(partial / "alpha" / "etc" / "default.conf");
  WriteFileOrFail(partial / "alpha" / "etc" / "default.conf" / "keep.txt", "blocks the file\n");
  {
    BootstrapOptions options;
    options.overwrite = true;
    std::ostringstream log_text;
    const BootstrapSummary summary = Run(partial, options, log_text);
    AssertTrue(summary.exit_code == ExitCode::kModulesFailed, "failed artifact must give exit 30");
    const auto& alpha = ReportFor(summary, "alpha");
    AssertTrue(alpha.state == ModuleState::kFailed, "alpha must fail");
    AssertTrue(alpha.error_kind == forgeops::core::errors::ErrorKind::kWrite,
               "alpha failure must be a WriteError");
    AssertTrue(alpha.failed == 1U, "exactly one alpha artifact must fail");
    AssertTrue(alpha.written > 0U && alpha.skipped == 0U, "other alpha artifacts must be written");
    AssertContains(alpha.error, "default.conf");
    AssertNotContains(ReadFileToString(partial / "alpha" / "README.md"), "local edit");
    AssertTrue(ReportFor(summary, "secrets-lifecycle").state == ModuleState::kDone,
               "sibling module must complete");
    AssertContains(log_text.str(), "error_kind=\"WriteError\"");
  }

  // Temp files from an interrupted run never reach the tree outputs.
  const fs::path interrupted = root / "interrupted";
  AssertCleanRun(interrupted);
  {
    forgeops::tests::common::ScopedEnvOverride interrupt("FORGEOPS_TEST_INTERRUPT_BEFORE_RENAME",
                                                         "1");
    BootstrapOptions options;
    options.overwrite = true;
    std::ostringstream log_text;
    const BootstrapSummary summary = Run(interrupted, options, log_text);
    AssertTrue(summary.exit_code == ExitCode::kModulesFailed, "interrupted run must give exit 30");
  }
  bool top_level_temp_left = false;
  for (const auto& entry : fs::directory_iterator(interrupted)) {
    top_level_temp_left = top_level_temp_left || forgeops::core::IsAtomicTempPath(entry.path());
  }
  AssertTrue(top_level_temp_left, "interrupted run should leave top-level temp files");
  {
    std::ostringstream log_text;
    const BootstrapSummary summary = Run(interrupted, BootstrapOptions{}, log_text);
    AssertTrue(summary.exit_code == ExitCode::kSuccess, "resumed run must succeed");
  }
  for (const auto& entry : fs::directory_iterator(interrupted)) {
    AssertTrue(!forgeops::core::IsAtomicTempPath(entry.path()),
               "top-level temp file not swept: " + entry.path().string());
  }
  AssertNotContains(ReadFileToString(interrupted / "packaging" / "SHASUMS256.txt"), ".tmp.");
  {
    std::vector<forgeops::artifacts::TarEntryInfo> entries;
    std::string error;
    if (!forgeops::artifacts::ReadTarGzEntries(interrupted / "packaging" / "forgeops_modules.tar.gz",
                                               entries, error)) {
      Fail("tree archive unreadable: " + error);
    }
    for (const auto& entry : entries) {
      AssertTrue(!forgeops::core::IsAtomicTempPath(entry.path),
                 "tree archive contains a temp file: " + entry.path);
    }
  }

  // Signing with a working tool signs every archive and the tree manifest.
  WriteExecutableScript(root / "tools" / "gpg", kFakeGpg);
  WriteExecutableScript(root / "tools" / "gpg-broken", kBrokenGpg);
  const fs::path signed_base = root / "signed";
  {
    BootstrapOptions options;
    options.signer = forgeops::artifacts::SignerCapability{root / "tools" / "gpg", ""};
    std::ostringstream log_text;
    const BootstrapSummary summary = Run(signed_base, options, log_text);
    AssertTrue(summary.exit_code == ExitCode::kSuccess, "signed run must succeed");
    const auto& alpha = ReportFor(summary, "alpha");
    AssertTrue(alpha.Signed(), "alpha archive must be signed");
    AssertTrue(alpha.history[alpha.history.size() - 2] == ModuleState::kSigned,
               "signed module must pass through Signed");
    AssertTrue(fs::is_regular_file(signed_base / "packaging" / "alpha.tar.gz.sig"),
               "module signature missing");
    AssertTrue(summary.tree_manifest_signature.has_value(), "tree manifest signature missing");
    AssertTrue(summary.tree_package.has_value() && summary.tree_package->signature_path.has_value(),
               "tree archive signature missing");
  }

  // Dropping signing removes signatures that no longer match.
  {
    std::ostringstream log_text;
    const BootstrapSummary summary = Run(signed_base, BootstrapOptions{}, log_text);
    AssertTrue(summary.exit_code == ExitCode::kSuccess, "unsigned re-run must succeed");
    AssertTrue(!fs::exists(signed_base / "packaging" / "alpha.tar.gz.sig"),
               "stale signature must be removed");
    AssertContains(log_text.str(), "removed stale signature");
  }

  // A failing signer is a warning: modules still reach Done, unsigned.
  {
    BootstrapOptions options;
    options.signer = forgeops::artifacts::SignerCapability{root / "tools" / "gpg-broken", ""};
    std::ostringstream log_text;
    const BootstrapSummary summary = Run(root / "broken-signer", options, log_text);
    AssertTrue(summary.exit_code == ExitCode::kSuccess, "signing failure must not fail the run");
    const auto& alpha = ReportFor(summary, "alpha");
    AssertTrue(alpha.state == ModuleState::kDone && !alpha.Signed(), "alpha must be Done, unsigned");
    AssertTrue(alpha.warnings.size() == 1U, "signing failure must be recorded");
    AssertContains(alpha.warnings.front(), "SigningError");
    AssertTrue(summary.warnings.size() == 2U, "tree manifest and archive signing warnings expected");
  }

  // Base directory blocked by a regular file.
  WriteFileOrFail(root / "blocked-base", "not a directory\n");
  {
    std::ostringstream log_text;
    const BootstrapSummary summary = Run(root / "blocked-base", BootstrapOptions{}, log_text);
    AssertTrue(summary.exit_code == ExitCode::kDirectoryCreateFailed,
               "unusable base dir must give exit 20");
    AssertTrue(summary.modules.empty(), "no module may run without a base dir");
  }

  forgeops::tests::common::RemovePathBestEffort(root);
  return 0;
}
