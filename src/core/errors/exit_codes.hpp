#pragma once

namespace forgeops::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Additional values classify bootstrap failure modes so CI and wrappers can
// branch without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kMissingTool = 10,
  kDirectoryCreateFailed = 20,
  kModulesFailed = 30,
  kManifestFailed = 40,
  kArchiveFailed = 50,
  kRegistryInvalid = 60,
  kVerifyMismatch = 70,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace forgeops::core::errors
