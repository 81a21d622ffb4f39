#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/env_override.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using forgeops::tests::common::AssertContains;
using forgeops::tests::common::AssertNotContains;
using forgeops::tests::common::AssertTrue;
using forgeops::tests::common::DispatchCaptured;
using forgeops::tests::common::ReadFileToString;
using forgeops::tests::common::ScopedEnvOverride;
using forgeops::tests::common::WriteFileOrFail;

namespace {

int Run(const std::vector<std::string>& argv, std::string& out, std::string& err) {
  std::vector<std::string> full = {"forgeops"};
  full.insert(full.end(), argv.begin(), argv.end());
  return DispatchCaptured(full, out, err);
}

} // namespace

int main() {
  // Isolate from the caller's environment.
  ScopedEnvOverride clear_base("BASE_DIR", nullptr);
  ScopedEnvOverride clear_force("FORCE", nullptr);
  ScopedEnvOverride clear_sign("GPG_SIGN", nullptr);
  ScopedEnvOverride clear_key("GPG_KEY", nullptr);
  ScopedEnvOverride clear_gpg("FORGEOPS_GPG", nullptr);
  ScopedEnvOverride clear_build("BUILD_SERVICES", nullptr);
  ScopedEnvOverride clear_mvn("FORGEOPS_MVN", nullptr);
  ScopedEnvOverride clear_log_file("FORGEOPS_LOG_FILE", nullptr);
  ScopedEnvOverride clear_log_level("FORGEOPS_LOG_LEVEL", nullptr);

  const fs::path root = forgeops::tests::common::CreateUniqueTempDir("forgeops-cli");
  std::string out;
  std::string err;

  AssertTrue(Run({"version"}, out, err) == 0, "version must succeed");
  AssertContains(out, "forgeops 0.1.0");
  AssertTrue(Run({"version", "extra"}, out, err) == 2, "version with args is a usage error");
  AssertTrue(Run({"frobnicate"}, out, err) == 2, "unknown command is a usage error");
  AssertContains(err, "unknown subcommand: frobnicate");

  // Registry listing.
  AssertTrue(Run({"modules"}, out, err) == 0, "modules must succeed");
  AssertContains(out, "secrets-lifecycle: Secrets Lifecycle Manager (Edge-friendly)\n");
  AssertContains(out, "dev-ephemeral-envs: ");

  const fs::path bad_list = root / "bad-modules.txt";
  WriteFileOrFail(bad_list, "alpha: First\nalpha: Again\nPackaging: Reserved\n");
  AssertTrue(Run({"modules", "--modules", bad_list.string()}, out, err) == 60,
             "invalid registry must give exit 60");
  AssertContains(err, "duplicate module name");

  const fs::path list = root / "modules.txt";
  WriteFileOrFail(list, "# test registry\nalpha: Alpha module\nbeta: Beta module\n");

  // Malformed boolean environment value.
  {
    ScopedEnvOverride force("FORCE", "yes");
    AssertTrue(Run({"bootstrap", "--base-dir", (root / "env").string()}, out, err) == 2,
               "malformed FORCE must be a usage error");
    AssertContains(err, "invalid value for FORCE");
    AssertTrue(!fs::exists(root / "env"), "usage error must not write");
  }

  // Signing requested but the tool is missing: fatal before any write.
  {
    ScopedEnvOverride sign("GPG_SIGN", "1");
    ScopedEnvOverride gpg("FORGEOPS_GPG", (root / "no-such-gpg").c_str());
    AssertTrue(Run({"bootstrap", "--base-dir", (root / "nosign").string(), "--modules",
                    list.string()},
                   out, err) == 10,
               "missing signing tool must give exit 10");
    AssertTrue(!fs::exists(root / "nosign"), "pre-flight failure must not write");
  }

  AssertTrue(Run({"bootstrap", "--only", "gamma", "--modules", list.string(), "--base-dir",
                  (root / "only").string()},
                 out, err) == 2,
             "unknown --only module is a usage error");

  // Full run with a missing optional build tool and a log file.
  const fs::path base = root / "out";
  const fs::path log_file = base / "logs" / "bootstrap.log";
  {
    ScopedEnvOverride build("BUILD_SERVICES", "1");
    ScopedEnvOverride mvn("FORGEOPS_MVN", (root / "no-such-mvn").c_str());
    const int code = Run({"bootstrap", "--base-dir", base.string(), "--modules", list.string(),
                          "--only", "alpha", "--log-file", log_file.string()},
                         out, err);
    AssertTrue(code == 0, "bootstrap must succeed: " + err);
  }
  AssertContains(out, "modules: 1 total, 1 done, 0 failed");
  AssertContains(out, "[Done] alpha unsigned");
  AssertContains(err, "service build requested but");
  AssertTrue(!fs::exists(base / "beta"), "--only must restrict the module set");
  const std::string log_text = ReadFileToString(log_file);
  AssertContains(log_text, "msg=\"bootstrap started\"");
  AssertContains(log_text, "run_id=\"bootstrap-");
  AssertNotContains(ReadFileToString(base / "packaging" / "SHASUMS256.txt"), "logs/");

  // manifest / verify round trip on the module.
  AssertTrue(Run({"manifest", (base / "alpha").string()}, out, err) == 0, "manifest must succeed");
  AssertContains(out, "  README.md\n");
  AssertContains(out, "  packaging/SHASUMS256.txt\n");

  AssertTrue(Run({"verify", (base / "alpha").string(), "--strict"}, out, err) == 0,
             "fresh module must verify: " + out);
  AssertContains(out, "verified: ");

  WriteFileOrFail(base / "alpha" / "etc" / "default.conf", "tampered\n");
  AssertTrue(Run({"verify", (base / "alpha").string()}, out, err) == 70,
             "tampered module must give exit 70");
  AssertContains(out, "mismatch: etc/default.conf");

  AssertTrue(Run({"verify", (root / "missing").string()}, out, err) == 40,
             "unreadable manifest must give exit 40");
  AssertTrue(Run({"verify"}, out, err) == 2, "verify without dir is a usage error");

  const fs::path exported = root / "export" / "SHASUMS256.txt";
  AssertTrue(Run({"manifest", (base / "alpha").string(), "--out", exported.string()}, out, err) == 0,
             "manifest --out must succeed");
  AssertContains(ReadFileToString(exported), "  etc/default.conf\n");

  // FORCE restores the tampered file.
  {
    ScopedEnvOverride force("FORCE", "1");
    AssertTrue(Run({"bootstrap", "--base-dir", base.string(), "--modules", list.string(), "--only",
                    "alpha"},
                   out, err) == 0,
               "forced bootstrap must succeed");
  }
  AssertTrue(Run({"verify", base.string(), "--manifest",
                  (base / "packaging" / "SHASUMS256.txt").string()},
                 out, err) == 0,
             "tree must verify against the tree manifest");

  // Archives under packaging/ and the log under logs/ are bootstrap outputs,
  // not tree content: a fresh tree passes --strict with the default manifest.
  AssertTrue(fs::exists(base / "packaging" / "alpha.tar.gz"), "module archive must exist");
  AssertTrue(Run({"verify", base.string(), "--strict"}, out, err) == 0,
             "fresh tree must pass strict verify: " + out);
  AssertNotContains(out, "unlisted: ");
  AssertContains(out, "verified: ");

  WriteFileOrFail(base / "stray.txt", "not generated\n");
  AssertTrue(Run({"verify", base.string(), "--strict"}, out, err) == 70,
             "stray tree file must fail strict verify");
  AssertContains(out, "unlisted: stray.txt");
  AssertTrue(Run({"verify", base.string()}, out, err) == 0,
             "stray tree file is only reported without --strict");
  AssertNotContains(ReadFileToString(base / "alpha" / "etc" / "default.conf"), "tampered");

  forgeops::tests::common::RemovePathBestEffort(root);
  return 0;
}
