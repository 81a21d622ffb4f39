#include "artifacts/tar_gz_writer.hpp"

#include "artifacts/checksum_manifest_writer.hpp"
#include "core/fs_utils.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace forgeops::artifacts {

namespace {

constexpr std::size_t kTarBlockSize = 512;
constexpr std::size_t kTarNameSize = 100;
constexpr std::size_t kTarPrefixSize = 155;

// ustar header field offsets/widths.
constexpr std::size_t kNameOffset = 0;
constexpr std::size_t kModeOffset = 100;
constexpr std::size_t kUidOffset = 108;
constexpr std::size_t kGidOffset = 116;
constexpr std::size_t kSizeOffset = 124;
constexpr std::size_t kMtimeOffset = 136;
constexpr std::size_t kChecksumOffset = 148;
constexpr std::size_t kTypeFlagOffset = 156;
constexpr std::size_t kMagicOffset = 257;
constexpr std::size_t kVersionOffset = 263;
constexpr std::size_t kPrefixOffset = 345;

constexpr char kTypeRegular = '0';
constexpr char kTypeDirectory = '5';

constexpr std::uint32_t kModeDirectory = 0755;
constexpr std::uint32_t kModeExecutable = 0755;
constexpr std::uint32_t kModeRegular = 0644;

constexpr int kGzipWindowBits = 15 + 16;
constexpr int kGzipOsUnknown = 255;

using TarHeader = std::array<char, kTarBlockSize>;

struct SourceEntry {
  fs::path path;
  std::string relative_path;
  bool is_directory = false;
  bool executable = false;
  std::uint64_t size_bytes = 0;
};

void WriteOctal(TarHeader& header, std::size_t offset, std::size_t width, std::uint64_t value) {
  // width-1 zero-padded digits followed by NUL.
  header[offset + width - 1] = '\0';
  for (std::size_t i = width - 1; i > 0; --i) {
    header[offset + i - 1] = static_cast<char>('0' + (value & 7U));
    value >>= 3;
  }
}

void WriteField(TarHeader& header, std::size_t offset, std::string_view text) {
  std::memcpy(header.data() + offset, text.data(), text.size());
}

std::uint64_t ParseOctal(const char* data, std::size_t width) {
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < width && data[i] != '\0' && data[i] != ' '; ++i) {
    if (data[i] >= '0' && data[i] <= '7') {
      value = (value << 3) | static_cast<std::uint64_t>(data[i] - '0');
    }
  }
  return value;
}

bool SplitUstarPath(const std::string& path, std::string& name, std::string& prefix,
                    std::string& error) {
  if (path.size() <= kTarNameSize) {
    name = path;
    prefix.clear();
    return true;
  }

  for (std::size_t slash = path.find('/'); slash != std::string::npos;
       slash = path.find('/', slash + 1)) {
    if (path.size() - slash - 1 <= kTarNameSize) {
      if (slash > kTarPrefixSize) {
        break;
      }
      prefix = path.substr(0, slash);
      name = path.substr(slash + 1);
      return true;
    }
  }

  error = "path too long for ustar archive: " + path;
  return false;
}

bool BuildHeader(const SourceEntry& entry, TarHeader& header, std::string& error) {
  header.fill('\0');

  std::string path = entry.relative_path;
  if (entry.is_directory) {
    path.push_back('/');
  }
  std::string name;
  std::string prefix;
  if (!SplitUstarPath(path, name, prefix, error)) {
    return false;
  }
  WriteField(header, kNameOffset, name);
  WriteField(header, kPrefixOffset, prefix);

  std::uint32_t mode = kModeRegular;
  if (entry.is_directory) {
    mode = kModeDirectory;
  } else if (entry.executable) {
    mode = kModeExecutable;
  }
  WriteOctal(header, kModeOffset, 8, mode);
  WriteOctal(header, kUidOffset, 8, 0);
  WriteOctal(header, kGidOffset, 8, 0);
  WriteOctal(header, kSizeOffset, 12, entry.is_directory ? 0U : entry.size_bytes);
  WriteOctal(header, kMtimeOffset, 12, 0);
  header[kTypeFlagOffset] = entry.is_directory ? kTypeDirectory : kTypeRegular;
  WriteField(header, kMagicOffset, std::string_view("ustar\0", 6));
  WriteField(header, kVersionOffset, "00");

  // Checksum is computed with its own field read as spaces.
  std::memset(header.data() + kChecksumOffset, ' ', 8);
  std::uint32_t checksum = 0;
  for (const char c : header) {
    checksum += static_cast<unsigned char>(c);
  }
  char checksum_text[8];
  std::snprintf(checksum_text, sizeof(checksum_text), "%06o", checksum & 0777777U);
  std::memcpy(header.data() + kChecksumOffset, checksum_text, 6);
  header[kChecksumOffset + 6] = '\0';
  header[kChecksumOffset + 7] = ' ';
  return true;
}

bool IsOwnerExecutable(const fs::file_status& status) {
  return (status.permissions() & fs::perms::owner_exec) != fs::perms::none;
}

bool CollectSourceEntries(const fs::path& source_dir, const TarGzOptions& options,
                          std::vector<SourceEntry>& entries, std::string& error) {
  std::error_code ec;
  if (!fs::is_directory(source_dir, ec) || ec) {
    error = "archive source must be a directory: " + source_dir.string();
    return false;
  }

  ManifestOptions exclusions;
  exclusions.excluded_paths = options.excluded_paths;

  entries.clear();
  for (auto it = fs::recursive_directory_iterator(source_dir, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code status_ec;
    const fs::file_status status = it->symlink_status(status_ec);
    if (status_ec) {
      error = "failed to stat '" + it->path().string() + "': " + status_ec.message();
      return false;
    }

    SourceEntry entry;
    entry.path = it->path();
    entry.relative_path = it->path().lexically_relative(source_dir).generic_string();

    if (fs::is_directory(status)) {
      if (IsExcludedPath(entry.relative_path + "/", exclusions)) {
        it.disable_recursion_pending();
        continue;
      }
      entry.is_directory = true;
      entries.push_back(std::move(entry));
      continue;
    }
    // Unpublished writer temp files never belong to a package.
    if (IsExcludedPath(entry.relative_path, exclusions) || core::IsAtomicTempPath(entry.path)) {
      continue;
    }
    if (fs::is_symlink(status)) {
      error = "symlinks are not permitted in archives: " + it->path().string();
      return false;
    }
    if (!fs::is_regular_file(status)) {
      error = "unsupported file type in archive source: " + it->path().string();
      return false;
    }

    entry.executable = IsOwnerExecutable(status);
    entry.size_bytes = fs::file_size(it->path(), status_ec);
    if (status_ec) {
      error = "failed to read file size: " + it->path().string();
      return false;
    }
    entries.push_back(std::move(entry));
  }
  if (ec) {
    error = "failed while enumerating archive source '" + source_dir.string() + "': " +
            ec.message();
    return false;
  }

  std::sort(entries.begin(), entries.end(), [](const SourceEntry& lhs, const SourceEntry& rhs) {
    return lhs.relative_path < rhs.relative_path;
  });
  return true;
}

// Streams deflate output into a gzip file. Owns the zlib state for its lifetime.
class GzipFileWriter {
public:
  GzipFileWriter() = default;
  GzipFileWriter(const GzipFileWriter&) = delete;
  GzipFileWriter& operator=(const GzipFileWriter&) = delete;

  ~GzipFileWriter() {
    if (initialized_) {
      deflateEnd(&stream_);
    }
  }

  bool Open(const fs::path& path, std::string& error) {
    out_file_.open(path, std::ios::binary | std::ios::trunc);
    if (!out_file_) {
      error = "failed to open archive output: " + path.string();
      return false;
    }

    std::memset(&stream_, 0, sizeof(stream_));
    if (deflateInit2(&stream_, Z_BEST_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
      error = "deflateInit2 failed";
      return false;
    }
    initialized_ = true;

    std::memset(&gzip_header_, 0, sizeof(gzip_header_));
    gzip_header_.os = kGzipOsUnknown;
    if (deflateSetHeader(&stream_, &gzip_header_) != Z_OK) {
      error = "deflateSetHeader failed";
      return false;
    }
    return true;
  }

  bool Write(const char* data, std::size_t size, std::string& error) {
    stream_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    stream_.avail_in = static_cast<uInt>(size);
    return Pump(Z_NO_FLUSH, error);
  }

  bool Finish(std::string& error) {
    stream_.next_in = nullptr;
    stream_.avail_in = 0;
    if (!Pump(Z_FINISH, error)) {
      return false;
    }
    out_file_.close();
    if (!out_file_) {
      error = "failed while closing archive output";
      return false;
    }
    return true;
  }

private:
  bool Pump(int flush, std::string& error) {
    int ret = Z_OK;
    do {
      stream_.next_out = out_buffer_.data();
      stream_.avail_out = static_cast<uInt>(out_buffer_.size());
      ret = deflate(&stream_, flush);
      if (ret == Z_STREAM_ERROR) {
        error = "deflate failed";
        return false;
      }
      const std::size_t produced = out_buffer_.size() - stream_.avail_out;
      out_file_.write(reinterpret_cast<const char*>(out_buffer_.data()),
                      static_cast<std::streamsize>(produced));
      if (!out_file_) {
        error = "failed while writing archive output";
        return false;
      }
    } while (stream_.avail_out == 0U);

    if (flush == Z_FINISH && ret != Z_STREAM_END) {
      error = "deflate did not reach end of stream";
      return false;
    }
    return true;
  }

  std::ofstream out_file_;
  z_stream stream_{};
  gz_header gzip_header_{};
  bool initialized_ = false;
  std::array<unsigned char, 16384> out_buffer_{};
};

bool StreamFileContent(const SourceEntry& entry, GzipFileWriter& writer, std::string& error) {
  std::ifstream in_file(entry.path, std::ios::binary);
  if (!in_file) {
    error = "failed to open file for archiving: " + entry.path.string();
    return false;
  }

  std::uint64_t total = 0;
  std::array<char, 8192> buffer{};
  while (in_file.good()) {
    in_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize read_count = in_file.gcount();
    if (read_count <= 0) {
      continue;
    }
    if (!writer.Write(buffer.data(), static_cast<std::size_t>(read_count), error)) {
      return false;
    }
    total += static_cast<std::uint64_t>(read_count);
  }
  if (!in_file.eof()) {
    error = "failed while reading file for archiving: " + entry.path.string();
    return false;
  }
  if (total != entry.size_bytes) {
    error = "file changed size while archiving: " + entry.path.string();
    return false;
  }

  const std::size_t padding = (kTarBlockSize - (total % kTarBlockSize)) % kTarBlockSize;
  const std::array<char, kTarBlockSize> zeros{};
  return padding == 0U || writer.Write(zeros.data(), padding, error);
}

fs::path NormalizedAbsolute(const fs::path& path) {
  std::error_code ec;
  const fs::path absolute = fs::absolute(path, ec);
  return (ec ? path : absolute).lexically_normal();
}

bool InflateFile(const fs::path& archive_path, std::string& data, std::string& error) {
  std::ifstream in_file(archive_path, std::ios::binary);
  if (!in_file) {
    error = "failed to open archive: " + archive_path.string();
    return false;
  }

  z_stream stream;
  std::memset(&stream, 0, sizeof(stream));
  // 15 + 32: zlib or gzip wrapper, auto-detected.
  if (inflateInit2(&stream, 15 + 32) != Z_OK) {
    error = "inflateInit2 failed";
    return false;
  }

  std::array<char, 16384> in_buffer{};
  std::array<unsigned char, 16384> out_buffer{};
  int ret = Z_OK;
  while (ret != Z_STREAM_END && in_file.good()) {
    in_file.read(in_buffer.data(), static_cast<std::streamsize>(in_buffer.size()));
    const std::streamsize read_count = in_file.gcount();
    if (read_count <= 0) {
      break;
    }
    stream.next_in = reinterpret_cast<Bytef*>(in_buffer.data());
    stream.avail_in = static_cast<uInt>(read_count);
    do {
      stream.next_out = out_buffer.data();
      stream.avail_out = static_cast<uInt>(out_buffer.size());
      ret = inflate(&stream, Z_NO_FLUSH);
      if (ret != Z_OK && ret != Z_STREAM_END) {
        inflateEnd(&stream);
        error = "archive is not valid gzip data: " + archive_path.string();
        return false;
      }
      data.append(reinterpret_cast<const char*>(out_buffer.data()),
                  out_buffer.size() - stream.avail_out);
    } while (stream.avail_out == 0U && ret != Z_STREAM_END);
  }
  inflateEnd(&stream);

  if (ret != Z_STREAM_END) {
    error = "archive is truncated: " + archive_path.string();
    return false;
  }
  return true;
}

} // namespace

bool WriteTarGzArchive(const fs::path& source_dir, const fs::path& archive_path,
                       const TarGzOptions& options, PackageArtifact& artifact,
                       std::string& error) {
  if (source_dir.empty() || archive_path.empty()) {
    error = "archive source and output paths cannot be empty";
    return false;
  }

  const std::string archive_relative =
      NormalizedAbsolute(archive_path).lexically_relative(NormalizedAbsolute(source_dir)).generic_string();
  ManifestOptions exclusions;
  exclusions.excluded_paths = options.excluded_paths;
  if (!archive_relative.empty() && archive_relative.rfind("..", 0) != 0U &&
      !IsExcludedPath(archive_relative, exclusions)) {
    error = "archive output must not be inside the archived tree: " + archive_path.string();
    return false;
  }

  std::vector<SourceEntry> entries;
  if (!CollectSourceEntries(source_dir, options, entries, error)) {
    return false;
  }

  if (!core::EnsureParentDirectory(archive_path, error)) {
    return false;
  }

  const fs::path temp_path = core::detail::BuildAtomicTempPath(archive_path);
  const auto discard_temp = [&temp_path]() {
    std::error_code cleanup_ec;
    (void)fs::remove(temp_path, cleanup_ec);
  };

  std::size_t file_count = 0;
  std::size_t directory_count = 0;
  {
    GzipFileWriter writer;
    if (!writer.Open(temp_path, error)) {
      discard_temp();
      return false;
    }

    for (const auto& entry : entries) {
      TarHeader header;
      if (!BuildHeader(entry, header, error) || !writer.Write(header.data(), header.size(), error)) {
        discard_temp();
        return false;
      }
      if (entry.is_directory) {
        ++directory_count;
        continue;
      }
      if (!StreamFileContent(entry, writer, error)) {
        discard_temp();
        return false;
      }
      ++file_count;
    }

    // End-of-archive marker: two zero blocks.
    const std::array<char, kTarBlockSize * 2> trailer{};
    if (!writer.Write(trailer.data(), trailer.size(), error) || !writer.Finish(error)) {
      discard_temp();
      return false;
    }
  }

  if (!core::PublishTempFile(temp_path, archive_path, error)) {
    return false;
  }

  artifact = PackageArtifact{};
  artifact.source_dir = source_dir;
  artifact.archive_path = archive_path;
  artifact.file_count = file_count;
  artifact.directory_count = directory_count;
  return true;
}

bool ReadTarGzEntries(const fs::path& archive_path, std::vector<TarEntryInfo>& entries,
                      std::string& error) {
  entries.clear();

  std::string data;
  if (!InflateFile(archive_path, data, error)) {
    return false;
  }

  std::size_t offset = 0;
  while (offset + kTarBlockSize <= data.size()) {
    const char* header = data.data() + offset;
    if (std::all_of(header, header + kTarBlockSize, [](char c) { return c == '\0'; })) {
      return true;
    }
    if (std::memcmp(header + kMagicOffset, "ustar", 5) != 0) {
      error = "archive entry is not ustar at offset " + std::to_string(offset);
      return false;
    }

    const std::string name(header + kNameOffset, strnlen(header + kNameOffset, kTarNameSize));
    const std::string prefix(header + kPrefixOffset,
                             strnlen(header + kPrefixOffset, kTarPrefixSize));

    TarEntryInfo info;
    info.path = prefix.empty() ? name : prefix + "/" + name;
    info.is_directory = header[kTypeFlagOffset] == kTypeDirectory;
    if (info.is_directory && !info.path.empty() && info.path.back() == '/') {
      info.path.pop_back();
    }
    info.size_bytes = ParseOctal(header + kSizeOffset, 12);
    info.mode = static_cast<std::uint32_t>(ParseOctal(header + kModeOffset, 8));
    entries.push_back(info);

    const std::uint64_t padded =
        (info.size_bytes + kTarBlockSize - 1) / kTarBlockSize * kTarBlockSize;
    offset += kTarBlockSize + static_cast<std::size_t>(padded);
  }

  error = "archive ended without end-of-archive marker";
  return false;
}

} // namespace forgeops::artifacts
