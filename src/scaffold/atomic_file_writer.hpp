#pragma once

#include "core/errors/error_kind.hpp"
#include "core/logging/logger.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace forgeops::scaffold {

enum class WriteStatus {
  kWritten,
  kSkippedExisting,
  kFailed,
};

const char* ToString(WriteStatus status);

// Result of one artifact write. `error_kind`/`error` are only set for kFailed.
struct WriteOutcome {
  std::filesystem::path path;
  WriteStatus status = WriteStatus::kFailed;
  core::errors::ErrorKind error_kind = core::errors::ErrorKind::kNone;
  std::string error;
};

// Crash-safe, idempotent file publish.
//
// Contract:
// - Missing ancestors of `dest_path` are created; an ancestor that exists as a
//   non-directory yields kFailed/DirectoryCreateError.
// - `dest_path` exists and `overwrite` is false: kSkippedExisting, untouched.
// - Otherwise content goes to a sibling temp file, receives its final
//   permissions (0755 when `executable`, else 0644), and is renamed onto
//   `dest_path`. Any failure leaves `dest_path` as it was (WriteError).
// - One log line per outcome when `logger` is non-null.
WriteOutcome WriteArtifactFile(const std::filesystem::path& dest_path, std::string_view content,
                               bool executable, bool overwrite,
                               core::logging::Logger* logger);

} // namespace forgeops::scaffold
