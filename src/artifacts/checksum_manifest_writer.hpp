#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace forgeops::artifacts {

inline constexpr std::string_view kManifestFileName = "SHASUMS256.txt";

struct ManifestEntry {
  std::string relative_path;
  std::string digest_hex;
  std::uintmax_t size_bytes = 0;
};

struct ManifestOptions {
  // Relative generic paths left out of the manifest. An entry ending in `/`
  // excludes a whole directory subtree.
  std::vector<std::string> excluded_paths;
};

// Streams `file_path` through SHA-256 and returns the lowercase hex digest and
// the number of bytes read.
bool ComputeFileSha256(const std::filesystem::path& file_path, std::string& digest_hex,
                       std::uintmax_t& size_bytes, std::string& error);

bool IsExcludedPath(std::string_view relative_path, const ManifestOptions& options);

// Walks `root_dir` recursively and hashes every regular file.
//
// Contract:
// - Symlinks (to files or directories) and directories are not entries.
// - Unpublished temp siblings (core::IsAtomicTempPath) are not entries.
// - Entries are sorted by relative path, byte-wise lexicographic, so the same
//   file set always yields the same manifest.
// - Any unreadable file fails the whole call; `entries` is left empty.
bool GenerateManifest(const std::filesystem::path& root_dir, const ManifestOptions& options,
                      std::vector<ManifestEntry>& entries, std::string& error);

// `<digest>  <relative_path>\n` per entry (sha256sum -c compatible).
std::string FormatManifest(const std::vector<ManifestEntry>& entries);

// Parses FormatManifest output. Sizes are not part of the text and stay 0.
bool ParseManifest(std::string_view text, std::vector<ManifestEntry>& entries, std::string& error);

// Generates the manifest of `root_dir` and publishes it atomically at
// `output_path`, replacing any previous manifest. When `output_path` lies
// inside `root_dir` it is excluded from its own listing. Nothing is written
// when generation fails.
bool WriteManifestFile(const std::filesystem::path& root_dir,
                       const std::filesystem::path& output_path, const ManifestOptions& options,
                       std::vector<ManifestEntry>& entries, std::string& error);

struct VerifyReport {
  std::size_t checked = 0;
  std::vector<std::string> missing;
  std::vector<std::string> mismatched;
  std::vector<std::string> unlisted;

  bool Ok() const {
    return missing.empty() && mismatched.empty() && unlisted.empty();
  }
};

// Re-hashes `root_dir` and compares it with the manifest at `manifest_path`.
// Every listed entry is checked; `options.excluded_paths` only keeps matching
// files out of `unlisted`. Returns false only when the comparison could not be
// carried out.
bool VerifyManifestFile(const std::filesystem::path& root_dir,
                        const std::filesystem::path& manifest_path, const ManifestOptions& options,
                        VerifyReport& report, std::string& error);

} // namespace forgeops::artifacts
