#pragma once

#include <filesystem>
#include <string>

namespace forgeops::artifacts {

// Resolved build tool for the embedded service stubs (`mvn`).
struct BuildToolCapability {
  std::filesystem::path program;
};

struct ServiceBuildResult {
  bool attempted = false;
  bool succeeded = false;
  std::filesystem::path build_dir;
  std::string output;
};

// Builds `<module_root>/java` with
//   <program> -q -DskipTests -Dforgeops.build.dir=<build_dir> package
// The generated pom routes all output to `build_dir`, which callers keep
// outside the module tree so module manifests and archives stay unaffected.
//
// A module without `java/pom.xml` is not attempted. Returns false with `error`
// when the tool could not be run or exited non-zero.
bool RunServiceBuild(const BuildToolCapability& tool, const std::filesystem::path& module_root,
                     const std::filesystem::path& build_dir, ServiceBuildResult& result,
                     std::string& error);

} // namespace forgeops::artifacts
