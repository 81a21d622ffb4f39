#include "core/fs_utils.hpp"
#include "scaffold/atomic_file_writer.hpp"

#include "common/assertions.hpp"
#include "common/env_override.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

using forgeops::scaffold::WriteArtifactFile;
using forgeops::scaffold::WriteOutcome;
using forgeops::scaffold::WriteStatus;
using forgeops::tests::common::AssertContains;
using forgeops::tests::common::AssertTrue;
using forgeops::tests::common::Fail;
using forgeops::tests::common::ReadFileToString;

namespace {

std::size_t CountTempSiblings(const fs::path& dir) {
  std::size_t count = 0;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (forgeops::core::IsAtomicTempPath(entry.path())) {
      ++count;
    }
  }
  return count;
}

fs::perms PermBits(const fs::path& path) {
  return fs::status(path).permissions() & fs::perms::mask;
}

} // namespace

int main() {
  const fs::path root = forgeops::tests::common::CreateUniqueTempDir("forgeops-atomic-writer");
  std::ostringstream log_text;
  forgeops::core::logging::Logger logger(forgeops::core::logging::LogLevel::kDebug, log_text);

  // Fresh write creates missing ancestors and publishes with final permissions.
  const fs::path script = root / "module" / "bin" / "entrypoint.sh";
  WriteOutcome outcome = WriteArtifactFile(script, "#!/bin/sh\necho v1\n", true, false, &logger);
  AssertTrue(outcome.status == WriteStatus::kWritten, "first write should be Written");
  AssertTrue(ReadFileToString(script) == "#!/bin/sh\necho v1\n", "content mismatch after write");
  AssertTrue(PermBits(script) == forgeops::core::kExecutableFilePerms,
             "executable artifact should be 0755");
  AssertTrue(CountTempSiblings(script.parent_path()) == 0U, "no temp file may remain");
  AssertContains(log_text.str(), "msg=\"wrote artifact\"");
  AssertContains(log_text.str(), "outcome=\"Written\"");

  const fs::path config = root / "module" / "etc" / "default.conf";
  outcome = WriteArtifactFile(config, "KEY=1\n", false, false, &logger);
  AssertTrue(outcome.status == WriteStatus::kWritten, "config write should be Written");
  AssertTrue(PermBits(config) == forgeops::core::kRegularFilePerms, "regular artifact should be 0644");

  // Existing file without overwrite is left untouched.
  outcome = WriteArtifactFile(script, "#!/bin/sh\necho v2\n", true, false, &logger);
  AssertTrue(outcome.status == WriteStatus::kSkippedExisting, "second write should be skipped");
  AssertTrue(ReadFileToString(script) == "#!/bin/sh\necho v1\n", "skip must not modify content");
  AssertContains(log_text.str(), "outcome=\"SkippedExisting\"");

  // Overwrite replaces content.
  outcome = WriteArtifactFile(script, "#!/bin/sh\necho v2\n", true, true, &logger);
  AssertTrue(outcome.status == WriteStatus::kWritten, "overwrite should be Written");
  AssertTrue(ReadFileToString(script) == "#!/bin/sh\necho v2\n", "overwrite content mismatch");

  // Interrupted write: destination keeps its previous content, temp file stays
  // behind for the next sweep.
  {
    forgeops::tests::common::ScopedEnvOverride interrupt("FORGEOPS_TEST_INTERRUPT_BEFORE_RENAME",
                                                         "1");
    outcome = WriteArtifactFile(script, "#!/bin/sh\necho v3\n", true, true, &logger);
  }
  AssertTrue(outcome.status == WriteStatus::kFailed, "interrupted write must fail");
  AssertTrue(outcome.error_kind == forgeops::core::errors::ErrorKind::kWrite,
             "interrupted write is a WriteError");
  AssertTrue(ReadFileToString(script) == "#!/bin/sh\necho v2\n",
             "interrupted write must leave old content");
  AssertTrue(CountTempSiblings(script.parent_path()) == 1U,
             "interrupted write leaves one temp sibling");

  // Interrupted first write: destination stays absent.
  const fs::path fresh = root / "module" / "docs" / "NOTES.md";
  {
    forgeops::tests::common::ScopedEnvOverride interrupt("FORGEOPS_TEST_INTERRUPT_BEFORE_RENAME",
                                                         "1");
    outcome = WriteArtifactFile(fresh, "notes\n", false, false, &logger);
  }
  AssertTrue(outcome.status == WriteStatus::kFailed, "interrupted fresh write must fail");
  AssertTrue(!fs::exists(fresh), "interrupted fresh write must not create destination");

  // A regular file where a directory is needed is a DirectoryCreateError.
  forgeops::tests::common::WriteFileOrFail(root / "blocked", "not a dir\n");
  outcome = WriteArtifactFile(root / "blocked" / "child.txt", "x\n", false, false, &logger);
  AssertTrue(outcome.status == WriteStatus::kFailed, "non-directory ancestor must fail");
  AssertTrue(outcome.error_kind == forgeops::core::errors::ErrorKind::kDirectoryCreate,
             "non-directory ancestor is a DirectoryCreateError");
  AssertContains(outcome.error, "path exists and is not a directory");
  AssertContains(log_text.str(), "error_kind=\"DirectoryCreateError\"");

  if (!forgeops::core::IsAtomicTempPath("a.txt.tmp.123.4") ||
      forgeops::core::IsAtomicTempPath("a.txt.tmp.x.4") ||
      forgeops::core::IsAtomicTempPath(".tmp.1.2")) {
    Fail("temp path recognition mismatch");
  }

  forgeops::tests::common::RemovePathBestEffort(root);
  return 0;
}
