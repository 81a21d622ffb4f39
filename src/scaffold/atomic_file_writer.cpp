#include "scaffold/atomic_file_writer.hpp"

#include "core/fs_utils.hpp"

#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace forgeops::scaffold {

namespace {

using core::errors::ErrorKind;

// Test-only failure injection: stop between temp write and rename, the same
// window a killed process would leave behind.
bool IsInterruptBeforeRenameEnabled() {
  const char* raw = std::getenv("FORGEOPS_TEST_INTERRUPT_BEFORE_RENAME");
  return raw != nullptr && std::string_view(raw) == "1";
}

WriteOutcome Fail(WriteOutcome outcome, ErrorKind kind, std::string error) {
  outcome.status = WriteStatus::kFailed;
  outcome.error_kind = kind;
  outcome.error = std::move(error);
  return outcome;
}

void LogOutcome(core::logging::Logger* logger, const WriteOutcome& outcome) {
  if (logger == nullptr) {
    return;
  }

  const std::string path = outcome.path.string();
  switch (outcome.status) {
  case WriteStatus::kWritten:
    logger->Info("wrote artifact", {{"path", path}, {"outcome", ToString(outcome.status)}});
    break;
  case WriteStatus::kSkippedExisting:
    logger->Warn("artifact exists, skipping (set FORCE=1 to overwrite)",
                 {{"path", path}, {"outcome", ToString(outcome.status)}});
    break;
  case WriteStatus::kFailed:
    logger->Error("artifact write failed",
                  {{"path", path},
                   {"outcome", ToString(outcome.status)},
                   {"error_kind", core::errors::ToString(outcome.error_kind)},
                   {"error", outcome.error}});
    break;
  }
}

WriteOutcome WriteArtifactFileUnlogged(const fs::path& dest_path, std::string_view content,
                                       bool executable, bool overwrite) {
  WriteOutcome outcome;
  outcome.path = dest_path;

  if (dest_path.empty()) {
    return Fail(std::move(outcome), ErrorKind::kWrite, "destination path cannot be empty");
  }

  std::string error;
  if (!core::EnsureParentDirectory(dest_path, error)) {
    return Fail(std::move(outcome), ErrorKind::kDirectoryCreate, error);
  }

  std::error_code ec;
  const bool exists = fs::exists(dest_path, ec);
  if (ec) {
    return Fail(std::move(outcome), ErrorKind::kWrite,
                "failed to stat destination '" + dest_path.string() + "': " + ec.message());
  }
  if (exists && !overwrite) {
    outcome.status = WriteStatus::kSkippedExisting;
    return outcome;
  }

  fs::path temp_path;
  const fs::perms perms = executable ? core::kExecutableFilePerms : core::kRegularFilePerms;
  if (!core::WriteTempSibling(dest_path, content, perms, temp_path, error)) {
    return Fail(std::move(outcome), ErrorKind::kWrite, error);
  }

  if (IsInterruptBeforeRenameEnabled()) {
    return Fail(std::move(outcome), ErrorKind::kWrite,
                "interrupted before publish (temp left at '" + temp_path.string() + "')");
  }

  if (!core::PublishTempFile(temp_path, dest_path, error)) {
    return Fail(std::move(outcome), ErrorKind::kWrite, error);
  }

  outcome.status = WriteStatus::kWritten;
  return outcome;
}

} // namespace

const char* ToString(WriteStatus status) {
  switch (status) {
  case WriteStatus::kWritten:
    return "Written";
  case WriteStatus::kSkippedExisting:
    return "SkippedExisting";
  case WriteStatus::kFailed:
    return "Failed";
  }

  return "Failed";
}

WriteOutcome WriteArtifactFile(const fs::path& dest_path, std::string_view content,
                               bool executable, bool overwrite, core::logging::Logger* logger) {
  WriteOutcome outcome = WriteArtifactFileUnlogged(dest_path, content, executable, overwrite);
  LogOutcome(logger, outcome);
  return outcome;
}

} // namespace forgeops::scaffold
