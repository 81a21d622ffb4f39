#include "artifacts/detached_signer.hpp"

#include "core/process_utils.hpp"

#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace forgeops::artifacts {

namespace {

std::string TrimTrailingNewlines(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  return text;
}

void RemoveIfPresent(const fs::path& path) {
  std::error_code ec;
  (void)fs::remove(path, ec);
}

} // namespace

std::optional<fs::path> SignFile(const SignerCapability& signer, const fs::path& file_path,
                                 std::string& error) {
  std::error_code ec;
  if (!fs::is_regular_file(file_path, ec) || ec) {
    error = "cannot sign missing file: " + file_path.string();
    return std::nullopt;
  }

  const fs::path signature_path = SignaturePathFor(file_path);
  std::vector<std::string> argv = {signer.program.string(), "--batch", "--yes"};
  if (!signer.key_id.empty()) {
    argv.push_back("--local-user");
    argv.push_back(signer.key_id);
  }
  argv.push_back("--output");
  argv.push_back(signature_path.string());
  argv.push_back("--detach-sign");
  argv.push_back(file_path.string());

  std::string output;
  int exit_code = -1;
  if (!core::RunCommand(argv, fs::path(), output, exit_code, error)) {
    RemoveIfPresent(signature_path);
    return std::nullopt;
  }
  if (exit_code != 0) {
    RemoveIfPresent(signature_path);
    error = "signing tool exited with status " + std::to_string(exit_code);
    const std::string detail = TrimTrailingNewlines(output);
    if (!detail.empty()) {
      error += ": " + detail;
    }
    return std::nullopt;
  }

  if (!fs::is_regular_file(signature_path, ec) || ec) {
    error = "signing tool reported success but wrote no signature: " + signature_path.string();
    return std::nullopt;
  }
  return signature_path;
}

} // namespace forgeops::artifacts
