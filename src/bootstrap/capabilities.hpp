#pragma once

#include "artifacts/detached_signer.hpp"
#include "artifacts/service_build_step.hpp"
#include "bootstrap/bootstrap_config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace forgeops::bootstrap {

// Optional external tools, resolved once before any write.
struct Capabilities {
  std::optional<artifacts::SignerCapability> signer;
  std::optional<artifacts::BuildToolCapability> build_tool;
  std::vector<std::string> warnings;
};

// Pre-flight tool resolution:
// - signing requested and the signing program is not found: returns false
//   (MissingToolError, fatal before any write)
// - service build requested and the build program is not found: the build step
//   is dropped with a warning
bool ResolveCapabilities(const BootstrapConfig& config, Capabilities& capabilities,
                         std::string& error);

} // namespace forgeops::bootstrap
