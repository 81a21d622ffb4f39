#include "modules/module_registry.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>

namespace forgeops::modules {

namespace {

constexpr std::size_t kMaxModuleNameLength = 64;

std::string_view Trim(std::string_view text) {
  const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

bool IsNameChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
}

std::vector<ModuleDescriptor> BuiltInModules() {
  return {
      {"secrets-lifecycle", "Secrets Lifecycle Manager (Edge-friendly)"},
      {"fleet-forensics", "Fleet Incident Collector & Forensics Snapper"},
      {"canary-deployer", "Immutable Release Canary Deployer"},
      {"zero-trust-bootstrap", "Zero-Trust Node Bootstrap & Attestor"},
      {"cost-waste-engine", "Cost & Waste Remediation Engine"},
      {"supplychain-monitor", "Supply-chain Integrity Monitor"},
      {"sbom-gen", "SBOM & Dependency Monitor"},
      {"confidential-orchestrator", "Confidential Compute Orchestrator"},
      {"file-distributor", "Secure File Distribution with Verifiable Integrity"},
      {"rbac-sudo-guard", "RBAC-enforced Local Admin Workflow Guard"},
      {"cross-cloud-net", "Cross-Cloud Network Stitching & Diagnostics"},
      {"compliance-packager", "Compliance Evidence Packager"},
      {"edge-observability", "Edge-First Observability Injector"},
      {"data-residency", "Data Residency Enforcer"},
      {"dev-ephemeral-envs", "Developer Productivity Ops (On-demand Dev Envs)"},
  };
}

} // namespace

const ModuleDescriptor* ModuleRegistry::Find(std::string_view name) const {
  for (const auto& module : modules_) {
    if (module.name == name) {
      return &module;
    }
  }
  return nullptr;
}

bool ModuleRegistry::RetainOnly(const std::vector<std::string>& names, std::string& error) {
  for (const auto& name : names) {
    if (Find(name) == nullptr) {
      error = "unknown module: " + name;
      return false;
    }
  }

  const std::set<std::string> wanted(names.begin(), names.end());
  modules_.erase(std::remove_if(modules_.begin(), modules_.end(),
                                [&wanted](const ModuleDescriptor& module) {
                                  return wanted.count(module.name) == 0U;
                                }),
                 modules_.end());
  return true;
}

const std::vector<std::string>& ReservedModuleNames() {
  static const std::vector<std::string> reserved = {"packaging", "logs", "build"};
  return reserved;
}

bool IsPathSafeModuleName(std::string_view name) {
  if (name.empty() || name.size() > kMaxModuleNameLength) {
    return false;
  }
  if (name.front() == '-' || name.front() == '_' || name.front() == '.') {
    return false;
  }
  if (!std::all_of(name.begin(), name.end(), IsNameChar)) {
    return false;
  }

  const auto& reserved = ReservedModuleNames();
  return std::find(reserved.begin(), reserved.end(), name) == reserved.end();
}

bool ValidateModules(const std::vector<ModuleDescriptor>& modules,
                     std::vector<RegistryIssue>& issues) {
  issues.clear();
  if (modules.empty()) {
    issues.push_back({"", "module list cannot be empty"});
    return false;
  }

  std::set<std::string> seen;
  for (const auto& module : modules) {
    if (module.name.empty()) {
      issues.push_back({module.name, "module name cannot be empty"});
      continue;
    }
    if (!IsPathSafeModuleName(module.name)) {
      issues.push_back({module.name, "module name is not path-safe (expected [a-z0-9][a-z0-9._-]*, "
                                     "max 64 chars, not packaging|logs|build)"});
    }
    if (Trim(module.description).empty()) {
      issues.push_back({module.name, "module description cannot be empty"});
    }
    if (!seen.insert(module.name).second) {
      issues.push_back({module.name, "duplicate module name"});
    }
  }

  return issues.empty();
}

bool BuildModuleRegistry(std::vector<ModuleDescriptor> modules, ModuleRegistry& registry,
                         std::vector<RegistryIssue>& issues) {
  if (!ValidateModules(modules, issues)) {
    return false;
  }
  registry.modules_ = std::move(modules);
  return true;
}

bool DefaultModuleRegistry(ModuleRegistry& registry, std::vector<RegistryIssue>& issues) {
  return BuildModuleRegistry(BuiltInModules(), registry, issues);
}

bool ParseModuleList(std::string_view text, std::vector<ModuleDescriptor>& modules,
                     std::string& error) {
  modules.clear();

  std::size_t line_number = 0;
  std::size_t start = 0;
  while (start < text.size()) {
    const std::size_t end = text.find('\n', start);
    const std::size_t stop = end == std::string_view::npos ? text.size() : end;
    const std::string_view line = Trim(text.substr(start, stop - start));
    ++line_number;
    start = stop + 1;

    if (line.empty() || line.front() == '#') {
      continue;
    }

    const std::size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      error = "line " + std::to_string(line_number) + ": expected 'name:description'";
      return false;
    }

    ModuleDescriptor module;
    module.name = std::string(Trim(line.substr(0, colon)));
    module.description = std::string(Trim(line.substr(colon + 1)));
    modules.push_back(std::move(module));
  }

  return true;
}

bool LoadModuleRegistryFile(const std::filesystem::path& path, ModuleRegistry& registry,
                            std::vector<RegistryIssue>& issues, std::string& error) {
  issues.clear();
  std::ifstream in_file(path, std::ios::binary);
  if (!in_file) {
    error = "unable to read module list: " + path.string();
    return false;
  }

  const std::string text((std::istreambuf_iterator<char>(in_file)),
                         std::istreambuf_iterator<char>());
  std::vector<ModuleDescriptor> modules;
  if (!ParseModuleList(text, modules, error)) {
    error = path.string() + ": " + error;
    return false;
  }

  if (!BuildModuleRegistry(std::move(modules), registry, issues)) {
    error = "invalid module list: " + path.string();
    return false;
  }
  return true;
}

} // namespace forgeops::modules
