#include "artifacts/detached_signer.hpp"

#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using forgeops::artifacts::SignerCapability;
using forgeops::tests::common::AssertContains;
using forgeops::tests::common::AssertNotContains;
using forgeops::tests::common::AssertTrue;
using forgeops::tests::common::Fail;
using forgeops::tests::common::ReadFileToString;
using forgeops::tests::common::WriteExecutableScript;
using forgeops::tests::common::WriteFileOrFail;

namespace {

constexpr const char* kFakeGpg = R"(#!/bin/sh
echo "$*" >> "$(dirname "$0")/gpg-args.log"
out=""
file=""
while [ $# -gt 0 ]; do
  case "$1" in
    --output) out="$2"; shift 2 ;;
    --detach-sign) file="$2"; shift 2 ;;
    *) shift ;;
  esac
done
printf 'signature-of:%s\n' "$file" > "$out"
)";

constexpr const char* kFailingGpg = R"(#!/bin/sh
for arg in "$@"; do
  case "$prev" in --output) : > "$arg" ;; esac
  prev="$arg"
done
echo "gpg: signing failed: No secret key" >&2
exit 2
)";

} // namespace

int main() {
  const fs::path root = forgeops::tests::common::CreateUniqueTempDir("forgeops-signer");
  const fs::path archive = root / "packaging" / "alpha.tar.gz";
  WriteFileOrFail(archive, "archive bytes");
  WriteExecutableScript(root / "tools" / "gpg", kFakeGpg);
  WriteExecutableScript(root / "tools" / "gpg-broken", kFailingGpg);

  std::string error;
  const auto signature =
      forgeops::artifacts::SignFile(SignerCapability{root / "tools" / "gpg", "ops@example.com"},
                                    archive, error);
  if (!signature.has_value()) {
    Fail("signing failed: " + error);
  }
  AssertTrue(*signature == root / "packaging" / "alpha.tar.gz.sig", "signature path mismatch");
  AssertContains(ReadFileToString(*signature), "signature-of:" + archive.string());

  const std::string args = ReadFileToString(root / "tools" / "gpg-args.log");
  AssertContains(args, "--batch --yes --local-user ops@example.com --output");
  AssertContains(args, "--detach-sign " + archive.string());

  // Without a key id no --local-user is passed.
  fs::remove(root / "tools" / "gpg-args.log");
  if (!forgeops::artifacts::SignFile(SignerCapability{root / "tools" / "gpg", ""}, archive, error)) {
    Fail("signing without key failed: " + error);
  }
  AssertNotContains(ReadFileToString(root / "tools" / "gpg-args.log"), "--local-user");

  // A failing tool reports its output and leaves no signature behind.
  fs::remove(*signature);
  const auto failed = forgeops::artifacts::SignFile(
      SignerCapability{root / "tools" / "gpg-broken", ""}, archive, error);
  AssertTrue(!failed.has_value(), "broken signer must fail");
  AssertContains(error, "exited with status 2");
  AssertContains(error, "No secret key");
  AssertTrue(!fs::exists(*signature), "failed signing must not leave a signature");

  // Missing input file.
  if (forgeops::artifacts::SignFile(SignerCapability{root / "tools" / "gpg", ""},
                                    root / "missing.tar.gz", error)) {
    Fail("signing a missing file must fail");
  }

  forgeops::tests::common::RemovePathBestEffort(root);
  return 0;
}
