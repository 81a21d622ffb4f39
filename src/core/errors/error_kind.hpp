#ifndef FORGEOPS_CORE_ERRORS_ERROR_KIND_HPP_
#define FORGEOPS_CORE_ERRORS_ERROR_KIND_HPP_

#include <string_view>

namespace forgeops::core::errors {

// Failure classes shared by the writer, manifest, packaging and orchestration
// layers. `kNone` marks a successful result.
enum class ErrorKind {
  kNone,
  kDirectoryCreate,
  kWrite,
  kMissingTool,
  kArchive,
  kSigning,
  kManifestRead,
  kBuildStep,
};

inline std::string_view ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "None";
  case ErrorKind::kDirectoryCreate:
    return "DirectoryCreateError";
  case ErrorKind::kWrite:
    return "WriteError";
  case ErrorKind::kMissingTool:
    return "MissingToolError";
  case ErrorKind::kArchive:
    return "ArchiveError";
  case ErrorKind::kSigning:
    return "SigningError";
  case ErrorKind::kManifestRead:
    return "ManifestReadError";
  case ErrorKind::kBuildStep:
    return "BuildStepError";
  }

  return "None";
}

} // namespace forgeops::core::errors

#endif // FORGEOPS_CORE_ERRORS_ERROR_KIND_HPP_
