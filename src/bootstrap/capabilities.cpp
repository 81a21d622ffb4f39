#include "bootstrap/capabilities.hpp"

#include "core/process_utils.hpp"

namespace forgeops::bootstrap {

bool ResolveCapabilities(const BootstrapConfig& config, Capabilities& capabilities,
                         std::string& error) {
  capabilities = Capabilities{};

  if (config.sign) {
    const auto program = core::FindExecutable(config.signer_program);
    if (!program.has_value()) {
      error = "signing requested but '" + config.signer_program + "' was not found on PATH";
      return false;
    }
    capabilities.signer = artifacts::SignerCapability{*program, config.gpg_key};
  }

  if (config.build_services) {
    const auto program = core::FindExecutable(config.build_program);
    if (program.has_value()) {
      capabilities.build_tool = artifacts::BuildToolCapability{*program};
    } else {
      capabilities.warnings.push_back("service build requested but '" + config.build_program +
                                      "' was not found on PATH; skipping service builds");
    }
  }
  return true;
}

} // namespace forgeops::bootstrap
