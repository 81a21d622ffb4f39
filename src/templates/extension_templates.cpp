#include "templates/template_renderer.hpp"

namespace forgeops::templates {

namespace {

constexpr std::string_view kFileHeaderHash =
    "# Copyright (c) 2025 Devin B. Royal.\n# All Rights Reserved.\n\n";
constexpr std::string_view kFileHeaderBlock =
    "/*\n * Copyright (c) 2025 Devin B. Royal.\n * All Rights Reserved.\n */\n\n";
constexpr std::string_view kFileHeaderMarkdown =
    "<!--\n  Copyright (c) 2025 Devin B. Royal.\n  All Rights Reserved.\n-->\n\n";

constexpr std::string_view kSecretsHvacBody = R"TMPL("""
Secret-store integration example for {{name}} using 'hvac'.
Expects VAULT_ADDR and VAULT_TOKEN from the environment or a mounted service
account. Never embed tokens in this file.
"""
import os
import sys

try:
    import hvac
except ImportError:
    print('The hvac library is required. Install with: pip install hvac', file=sys.stderr)
    sys.exit(2)

VAULT_ADDR = os.environ.get('VAULT_ADDR')
VAULT_TOKEN = os.environ.get('VAULT_TOKEN')

if not VAULT_ADDR or not VAULT_TOKEN:
    print('VAULT_ADDR and VAULT_TOKEN must be set', file=sys.stderr)
    sys.exit(2)

client = hvac.Client(url=VAULT_ADDR, token=VAULT_TOKEN)
if not client.is_authenticated():
    print('Failed to authenticate to Vault', file=sys.stderr)
    sys.exit(2)

print('Vault client authenticated (safe example).')
)TMPL";

constexpr std::string_view kVaultClientStubBody = R"TMPL(package com.forgeops.secrets;

/**
 * Minimal secret-store client interface. Production implementations should use
 * a vetted Vault driver with TLS/mTLS authentication from externalized config.
 */
public interface VaultClientStub {
    String getSecret(String path) throws Exception;
}
)TMPL";

constexpr std::string_view kVaultClientStubTestBody = R"TMPL(package com.forgeops.secrets;

import org.junit.Test;
import static org.junit.Assert.*;

public class VaultClientStubTest {
    @Test
    public void stubReturnsConfiguredSecret() throws Exception {
        VaultClientStub stub = path -> "secret-for-" + path;
        assertEquals("secret-for-db", stub.getSecret("db"));
    }
}
)TMPL";

constexpr std::string_view kVaultIntegrationBody = R"TMPL(# Vault Integration Guidance - {{name}}

- Prefer AppRole, Kubernetes auth, or mTLS for production authentication.
- Avoid long-lived tokens; use short-lived credentials and rotate often.
- Use HSM-backed keys for signing and encryption operations.
- Validate Vault ACLs and policies to enforce least privilege.
)TMPL";

constexpr std::string_view kTopReadmeBody = R"TMPL(# ForgeOps Modules

This directory was generated by the forgeops bootstrapper.
Customize each module's etc/* files and follow docs/ before deploying to prod.

- packaging/SHASUMS256.txt: SHA-256 digests of every generated file
- packaging/<module>.tar.gz: per-module archives (optional .sig signatures)
- packaging/forgeops_modules.tar.gz: whole-tree archive
- run_all_tests.sh: runs every module's smoke test
)TMPL";

constexpr std::string_view kRunAllTestsBody = R"TMPL(#!/usr/bin/env bash
set -euo pipefail
IFS=$'\n\t'
ROOT="$(cd "$(dirname "${BASH_SOURCE[0]}")" && pwd)"
for d in "$ROOT"/*; do
  if [[ -d "$d" && -f "$d/tests/run_tests.sh" ]]; then
    echo "== Testing $(basename "$d") =="
    (cd "$d" && ./tests/run_tests.sh) || { echo "Fail: $(basename "$d")"; exit 1; }
  fi
done
echo "All module smoke tests completed."
)TMPL";

std::string Render(std::string_view header, std::string_view body,
                   const modules::ModuleDescriptor& module) {
  return std::string(header) +
         SubstitutePlaceholders(body, {{"name", module.name}, {"description", module.description}});
}

} // namespace

std::vector<ArtifactSpec> RenderSecretStoreExtras(const modules::ModuleDescriptor& module) {
  std::vector<ArtifactSpec> specs;

  ArtifactSpec hvac;
  hvac.relative_path = "bin/secrets_hvac.py";
  hvac.content = "#!/usr/bin/env python3\n" + Render(kFileHeaderHash, kSecretsHvacBody, module);
  hvac.executable = true;
  specs.push_back(std::move(hvac));

  specs.push_back({"java/src/main/java/com/forgeops/secrets/VaultClientStub.java",
                   Render(kFileHeaderBlock, kVaultClientStubBody, module), false});
  specs.push_back({"java/src/test/java/com/forgeops/secrets/VaultClientStubTest.java",
                   Render(kFileHeaderBlock, kVaultClientStubTestBody, module), false});
  specs.push_back({"docs/VAULT_INTEGRATION.md",
                   Render(kFileHeaderMarkdown, kVaultIntegrationBody, module), false});
  return specs;
}

std::vector<ArtifactSpec> RenderTopLevelArtifacts(
    const std::vector<modules::ModuleDescriptor>& modules) {
  std::vector<ArtifactSpec> specs;
  specs.push_back({"README.md", std::string(kFileHeaderMarkdown) + std::string(kTopReadmeBody),
                   false});

  // No generation timestamp: the listing must stay byte-identical across
  // re-runs over the same registry.
  std::string listing = std::string(kFileHeaderHash) + "Modules:\n";
  for (const auto& module : modules) {
    listing += module.name + ":" + module.description + "\n";
  }
  specs.push_back({"PACKAGING_MANIFEST.txt", std::move(listing), false});

  std::string run_all = std::string(kRunAllTestsBody);
  run_all.insert(run_all.find('\n') + 1, kFileHeaderHash);
  specs.push_back({"run_all_tests.sh", std::move(run_all), true});
  return specs;
}

} // namespace forgeops::templates
