#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace forgeops::artifacts {

// Durable packaging output for one scope (a module or the whole tree).
struct PackageArtifact {
  std::filesystem::path source_dir;
  std::filesystem::path archive_path;
  std::optional<std::filesystem::path> signature_path;
  std::size_t file_count = 0;
  std::size_t directory_count = 0;
};

struct TarGzOptions {
  // Relative generic paths under `source_dir` left out of the archive; a
  // trailing `/` excludes a subtree.
  std::vector<std::string> excluded_paths;
};

// Writes a deterministic `.tar.gz` of everything under `source_dir`.
//
// Contract:
// - Entries are the relative paths of all directories and regular files,
//   sorted byte-wise; no `./` prefix and no enclosing directory.
// - Headers are POSIX ustar with mtime 0, uid/gid 0, empty owner names and
//   mode 0755 (directories, executables) or 0644.
// - gzip header carries mtime 0 and OS 255, so identical trees give
//   byte-identical archives.
// - Symlinks are rejected. `archive_path` may only lie inside `source_dir`
//   when excluded.
// - Output goes to a temp sibling of `archive_path` and is renamed into place;
//   a failed call leaves no partial archive behind.
bool WriteTarGzArchive(const std::filesystem::path& source_dir,
                       const std::filesystem::path& archive_path, const TarGzOptions& options,
                       PackageArtifact& artifact, std::string& error);

struct TarEntryInfo {
  std::string path;
  bool is_directory = false;
  std::uint64_t size_bytes = 0;
  std::uint32_t mode = 0;
};

// Lists the entries of a `.tar.gz` produced by WriteTarGzArchive (ustar only).
bool ReadTarGzEntries(const std::filesystem::path& archive_path, std::vector<TarEntryInfo>& entries,
                      std::string& error);

} // namespace forgeops::artifacts
