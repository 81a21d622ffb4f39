#pragma once

namespace forgeops::cli {

// Routes `forgeops` subcommands and returns process exit codes with a stable
// contract for scripts and CI (see core/errors/exit_codes.hpp):
//   0 => success
//   1 => command failed after valid invocation
//   2 => usage error (unknown command / invalid args / malformed env value)
//  10+ => classified bootstrap, manifest and verification failures
int Dispatch(int argc, char** argv);

} // namespace forgeops::cli
