#ifndef FORGEOPS_SCAFFOLD_RUN_CONTEXT_HPP_
#define FORGEOPS_SCAFFOLD_RUN_CONTEXT_HPP_

#include "core/logging/logger.hpp"

#include <filesystem>

namespace forgeops::scaffold {

// Per-run state handed to every component call instead of process globals.
// `logger` is borrowed and must outlive the context.
struct RunContext {
  std::filesystem::path base_dir;
  bool overwrite = false;
  core::logging::Logger* logger = nullptr;
};

} // namespace forgeops::scaffold

#endif // FORGEOPS_SCAFFOLD_RUN_CONTEXT_HPP_
