#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace forgeops::artifacts {

// Resolved signing tool. Present only when signing was requested and the tool
// was found during pre-flight.
struct SignerCapability {
  std::filesystem::path program;
  // Passed as `--local-user`; empty means the tool's default key.
  std::string key_id;
};

inline std::filesystem::path SignaturePathFor(const std::filesystem::path& file_path) {
  return file_path.string() + ".sig";
}

// Produces a detached signature at `<file_path>.sig`:
//   <program> --batch --yes [--local-user KEY] --output <file>.sig --detach-sign <file>
//
// Returns the signature path on success. On failure `error` carries the tool
// output and no signature is reported; a stale `.sig` from the failed attempt
// is removed so an unsigned artifact never sits next to a mismatched signature.
std::optional<std::filesystem::path> SignFile(const SignerCapability& signer,
                                              const std::filesystem::path& file_path,
                                              std::string& error);

} // namespace forgeops::artifacts
