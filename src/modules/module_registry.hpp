#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace forgeops::modules {

// One generated module. Identity is `name`, which doubles as the module's
// directory name under the bootstrap base dir.
struct ModuleDescriptor {
  std::string name;
  std::string description;
};

struct RegistryIssue {
  std::string module_name;
  std::string message;
};

// Ordered, validated module list. Construction goes through the factory
// functions below so every registry in use has passed ValidateModules.
class ModuleRegistry {
public:
  const std::vector<ModuleDescriptor>& Modules() const {
    return modules_;
  }

  std::size_t Size() const {
    return modules_.size();
  }

  const ModuleDescriptor* Find(std::string_view name) const;

  // Keeps only `names`, in registry order. Unknown names are reported in
  // `error` and nothing is changed.
  bool RetainOnly(const std::vector<std::string>& names, std::string& error);

  friend bool BuildModuleRegistry(std::vector<ModuleDescriptor> modules, ModuleRegistry& registry,
                                  std::vector<RegistryIssue>& issues);

private:
  std::vector<ModuleDescriptor> modules_;
};

// Top-level directory names the bootstrap tree reserves for its own outputs.
const std::vector<std::string>& ReservedModuleNames();

// Lowercase ASCII letters/digits plus `-`, `_` and `.`, starting with a letter
// or digit, at most 64 bytes, and not reserved.
bool IsPathSafeModuleName(std::string_view name);

// Checks non-empty descriptions, path-safe names and name uniqueness.
// Returns true when `issues` stays empty.
bool ValidateModules(const std::vector<ModuleDescriptor>& modules,
                     std::vector<RegistryIssue>& issues);

bool BuildModuleRegistry(std::vector<ModuleDescriptor> modules, ModuleRegistry& registry,
                         std::vector<RegistryIssue>& issues);

// The built-in ForgeOps module catalogue, validated like any registry file.
bool DefaultModuleRegistry(ModuleRegistry& registry, std::vector<RegistryIssue>& issues);

// Parses `name:description` lines. Blank lines and `#` comments are skipped.
bool ParseModuleList(std::string_view text, std::vector<ModuleDescriptor>& modules,
                     std::string& error);

// Loads and validates a registry file.
bool LoadModuleRegistryFile(const std::filesystem::path& path, ModuleRegistry& registry,
                            std::vector<RegistryIssue>& issues, std::string& error);

} // namespace forgeops::modules
