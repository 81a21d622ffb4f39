#include "artifacts/checksum_manifest_writer.hpp"

#include "core/fs_utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace forgeops::artifacts {

namespace {

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

std::string ToHex(const unsigned char* bytes, unsigned int size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(static_cast<std::size_t>(size) * 2U);
  for (unsigned int i = 0; i < size; ++i) {
    hex.push_back(kDigits[bytes[i] >> 4]);
    hex.push_back(kDigits[bytes[i] & 0x0FU]);
  }
  return hex;
}

// Normalized absolute form used to compare paths that may be spelled
// differently (relative vs absolute, `./` segments).
fs::path NormalizedAbsolute(const fs::path& path) {
  std::error_code ec;
  const fs::path absolute = fs::absolute(path, ec);
  return (ec ? path : absolute).lexically_normal();
}

// Adds `file_path` to the exclusions when it lives under `root_dir`, so a
// manifest never lists itself.
ManifestOptions ExcludingFile(const fs::path& root_dir, const fs::path& file_path,
                              const ManifestOptions& options) {
  ManifestOptions effective = options;
  const std::string relative =
      NormalizedAbsolute(file_path).lexically_relative(NormalizedAbsolute(root_dir)).generic_string();
  if (!relative.empty() && relative.rfind("..", 0) != 0U) {
    effective.excluded_paths.push_back(relative);
  }
  return effective;
}

bool IsHexDigest(std::string_view text) {
  if (text.size() != 64U) {
    return false;
  }
  return std::all_of(text.begin(), text.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  });
}

} // namespace

bool ComputeFileSha256(const fs::path& file_path, std::string& digest_hex,
                       std::uintmax_t& size_bytes, std::string& error) {
  std::ifstream in_file(file_path, std::ios::binary);
  if (!in_file) {
    error = "failed to open file for hashing: " + file_path.string();
    return false;
  }

  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    error = "EVP_MD_CTX_new failed";
    return false;
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    error = "EVP_DigestInit_ex failed for sha256";
    return false;
  }

  std::uintmax_t total = 0;
  std::array<char, 8192> buffer{};
  while (in_file.good()) {
    in_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize read_count = in_file.gcount();
    if (read_count <= 0) {
      continue;
    }
    if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(read_count)) != 1) {
      error = "EVP_DigestUpdate failed while hashing: " + file_path.string();
      return false;
    }
    total += static_cast<std::uintmax_t>(read_count);
  }

  if (!in_file.eof()) {
    error = "failed while reading file for hashing: " + file_path.string();
    return false;
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_size = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_size) != 1) {
    error = "EVP_DigestFinal_ex failed while hashing: " + file_path.string();
    return false;
  }

  digest_hex = ToHex(digest, digest_size);
  size_bytes = total;
  return true;
}

bool IsExcludedPath(std::string_view relative_path, const ManifestOptions& options) {
  for (const auto& excluded : options.excluded_paths) {
    if (excluded.empty()) {
      continue;
    }
    if (excluded.back() == '/') {
      const std::string_view dir(excluded.data(), excluded.size() - 1);
      if (relative_path == dir || relative_path.rfind(excluded, 0) == 0U) {
        return true;
      }
    } else if (relative_path == excluded) {
      return true;
    }
  }
  return false;
}

bool GenerateManifest(const fs::path& root_dir, const ManifestOptions& options,
                      std::vector<ManifestEntry>& entries, std::string& error) {
  entries.clear();
  if (root_dir.empty()) {
    error = "manifest root cannot be empty";
    return false;
  }

  std::error_code ec;
  if (!fs::is_directory(root_dir, ec) || ec) {
    error = "manifest root must be a directory: " + root_dir.string();
    return false;
  }

  std::vector<ManifestEntry> collected;
  for (auto it = fs::recursive_directory_iterator(root_dir, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const std::string relative = it->path().lexically_relative(root_dir).generic_string();

    std::error_code status_ec;
    const fs::file_status status = it->symlink_status(status_ec);
    if (status_ec) {
      error = "failed to stat '" + it->path().string() + "': " + status_ec.message();
      return false;
    }

    if (fs::is_directory(status)) {
      if (IsExcludedPath(relative + "/", options)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!fs::is_regular_file(status) || IsExcludedPath(relative, options) ||
        core::IsAtomicTempPath(it->path())) {
      continue;
    }

    ManifestEntry entry;
    entry.relative_path = relative;
    if (!ComputeFileSha256(it->path(), entry.digest_hex, entry.size_bytes, error)) {
      return false;
    }
    collected.push_back(std::move(entry));
  }
  if (ec) {
    error = "failed while enumerating '" + root_dir.string() + "': " + ec.message();
    return false;
  }

  std::sort(collected.begin(), collected.end(),
            [](const ManifestEntry& lhs, const ManifestEntry& rhs) {
              return lhs.relative_path < rhs.relative_path;
            });
  entries = std::move(collected);
  return true;
}

std::string FormatManifest(const std::vector<ManifestEntry>& entries) {
  std::string text;
  for (const auto& entry : entries) {
    text += entry.digest_hex;
    text += "  ";
    text += entry.relative_path;
    text += '\n';
  }
  return text;
}

bool ParseManifest(std::string_view text, std::vector<ManifestEntry>& entries, std::string& error) {
  entries.clear();

  std::size_t line_number = 0;
  std::size_t start = 0;
  while (start < text.size()) {
    const std::size_t end = text.find('\n', start);
    const std::size_t stop = end == std::string_view::npos ? text.size() : end;
    std::string_view line = text.substr(start, stop - start);
    start = stop + 1;
    ++line_number;

    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (line.empty()) {
      continue;
    }

    // sha256sum marks binary-mode records with `*` instead of the second space.
    if (line.size() < 67U || !IsHexDigest(line.substr(0, 64)) || line[64] != ' ' ||
        (line[65] != ' ' && line[65] != '*')) {
      error = "manifest line " + std::to_string(line_number) + " is malformed";
      return false;
    }

    ManifestEntry entry;
    entry.digest_hex = std::string(line.substr(0, 64));
    std::string_view path = line.substr(66);
    if (path.rfind("./", 0) == 0U) {
      path.remove_prefix(2);
    }
    entry.relative_path = std::string(path);
    entries.push_back(std::move(entry));
  }
  return true;
}

bool WriteManifestFile(const fs::path& root_dir, const fs::path& output_path,
                       const ManifestOptions& options, std::vector<ManifestEntry>& entries,
                       std::string& error) {
  if (!GenerateManifest(root_dir, ExcludingFile(root_dir, output_path, options), entries, error)) {
    return false;
  }
  return core::WriteTextFileAtomic(output_path, FormatManifest(entries), error);
}

bool VerifyManifestFile(const fs::path& root_dir, const fs::path& manifest_path,
                        const ManifestOptions& options, VerifyReport& report, std::string& error) {
  report = VerifyReport{};

  std::ifstream in_file(manifest_path, std::ios::binary);
  if (!in_file) {
    error = "unable to read manifest: " + manifest_path.string();
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(in_file)),
                         std::istreambuf_iterator<char>());

  std::vector<ManifestEntry> expected;
  if (!ParseManifest(text, expected, error)) {
    error = manifest_path.string() + ": " + error;
    return false;
  }

  // Listed entries are always checked; `options` only narrows the unlisted scan.
  std::vector<ManifestEntry> actual;
  if (!GenerateManifest(root_dir, ExcludingFile(root_dir, manifest_path, ManifestOptions{}), actual,
                        error)) {
    return false;
  }

  std::map<std::string, std::string> actual_digests;
  for (const auto& entry : actual) {
    actual_digests.emplace(entry.relative_path, entry.digest_hex);
  }

  std::set<std::string> listed;
  for (const auto& entry : expected) {
    listed.insert(entry.relative_path);
    const auto found = actual_digests.find(entry.relative_path);
    if (found == actual_digests.end()) {
      report.missing.push_back(entry.relative_path);
      continue;
    }
    ++report.checked;
    if (found->second != entry.digest_hex) {
      report.mismatched.push_back(entry.relative_path);
    }
  }

  for (const auto& entry : actual) {
    if (listed.count(entry.relative_path) == 0U && !IsExcludedPath(entry.relative_path, options)) {
      report.unlisted.push_back(entry.relative_path);
    }
  }
  return true;
}

} // namespace forgeops::artifacts
