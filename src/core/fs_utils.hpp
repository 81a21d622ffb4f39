#ifndef FORGEOPS_CORE_FS_UTILS_HPP_
#define FORGEOPS_CORE_FS_UTILS_HPP_

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace forgeops::core {

inline constexpr std::filesystem::perms kRegularFilePerms =
    std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
    std::filesystem::perms::group_read | std::filesystem::perms::others_read;

inline constexpr std::filesystem::perms kExecutableFilePerms =
    kRegularFilePerms | std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec |
    std::filesystem::perms::others_exec;

namespace detail {

inline constexpr std::string_view kAtomicTempMarker = ".tmp.";

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + std::string(kAtomicTempMarker) + std::to_string(tick) + "." +
         std::to_string(suffix);
}

inline bool IsAllDigits(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  for (const char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

} // namespace detail

// True when `path` names a temp sibling produced by BuildAtomicTempPath, i.e.
// `<name>.tmp.<tick>.<counter>`. Used to sweep leftovers of interrupted runs.
inline bool IsAtomicTempPath(const std::filesystem::path& path) {
  const std::string name = path.filename().string();
  const std::size_t marker = name.rfind(detail::kAtomicTempMarker);
  if (marker == std::string::npos || marker == 0U) {
    return false;
  }

  const std::string_view tail =
      std::string_view(name).substr(marker + detail::kAtomicTempMarker.size());
  const std::size_t dot = tail.find('.');
  if (dot == std::string_view::npos) {
    return false;
  }
  return detail::IsAllDigits(tail.substr(0, dot)) && detail::IsAllDigits(tail.substr(dot + 1));
}

// Creates `dir` and all missing ancestors. An existing component that is not a
// directory is reported explicitly instead of surfacing as a generic errno.
inline bool EnsureDirectoryTree(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "directory path cannot be empty";
    return false;
  }

  std::filesystem::path probe;
  for (const auto& component : dir) {
    probe /= component;
    std::error_code ec;
    const auto status = std::filesystem::status(probe, ec);
    if (ec) {
      break;
    }
    if (std::filesystem::exists(status) && !std::filesystem::is_directory(status)) {
      error = "path exists and is not a directory: " + probe.string();
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }
  return EnsureDirectoryTree(parent_dir, error);
}

// First half of an atomic publish: writes `content` into a fresh temp sibling
// of `output_path` and applies `perms` to it. The destination is not touched.
inline bool WriteTempSibling(const std::filesystem::path& output_path, std::string_view content,
                             std::filesystem::perms perms, std::filesystem::path& temp_path,
                             std::string& error) {
  temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file.write(content.data(), static_cast<std::streamsize>(content.size()));
    out_file.flush();
    if (!out_file) {
      std::error_code cleanup_ec;
      (void)std::filesystem::remove(temp_path, cleanup_ec);
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code perms_ec;
  std::filesystem::permissions(temp_path, perms, std::filesystem::perm_options::replace, perms_ec);
  if (perms_ec) {
    std::error_code cleanup_ec;
    (void)std::filesystem::remove(temp_path, cleanup_ec);
    error = "failed to set permissions on '" + temp_path.string() + "': " + perms_ec.message();
    return false;
  }

  return true;
}

// Second half: renames the temp file onto the destination. Rename is the last
// step, so a failure here leaves the previous destination content in place.
inline bool PublishTempFile(const std::filesystem::path& temp_path,
                            const std::filesystem::path& output_path, std::string& error) {
  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

#if defined(_WIN32)
  // Rename-over-existing is restricted on some Windows filesystems.
  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }
#endif

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

// Atomic file write:
// 1) write full content to a temporary sibling file with final permissions
// 2) rename temp file into final destination
inline bool WriteFileAtomic(const std::filesystem::path& output_path, std::string_view content,
                            std::filesystem::perms perms, std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  std::filesystem::path temp_path;
  if (!WriteTempSibling(output_path, content, perms, temp_path, error)) {
    return false;
  }
  return PublishTempFile(temp_path, output_path, error);
}

inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  return WriteFileAtomic(output_path, text, kRegularFilePerms, error);
}

} // namespace forgeops::core

#endif // FORGEOPS_CORE_FS_UTILS_HPP_
