#include "artifacts/service_build_step.hpp"

#include "core/fs_utils.hpp"
#include "core/process_utils.hpp"

#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace forgeops::artifacts {

bool RunServiceBuild(const BuildToolCapability& tool, const fs::path& module_root,
                     const fs::path& build_dir, ServiceBuildResult& result, std::string& error) {
  result = ServiceBuildResult{};
  result.build_dir = build_dir;

  const fs::path java_dir = module_root / "java";
  std::error_code ec;
  if (!fs::is_regular_file(java_dir / "pom.xml", ec) || ec) {
    return true;
  }

  if (!core::EnsureDirectoryTree(build_dir, error)) {
    return false;
  }

  std::error_code abs_ec;
  const fs::path absolute_build_dir = fs::absolute(build_dir, abs_ec);
  if (abs_ec) {
    error = "failed to resolve build dir '" + build_dir.string() + "': " + abs_ec.message();
    return false;
  }

  const std::vector<std::string> argv = {
      tool.program.string(),
      "-q",
      "-DskipTests",
      "-Dforgeops.build.dir=" + absolute_build_dir.string(),
      "package",
  };

  result.attempted = true;
  int exit_code = -1;
  if (!core::RunCommand(argv, java_dir, result.output, exit_code, error)) {
    return false;
  }
  if (exit_code != 0) {
    error = "service build exited with status " + std::to_string(exit_code);
    return false;
  }

  result.succeeded = true;
  return true;
}

} // namespace forgeops::artifacts
