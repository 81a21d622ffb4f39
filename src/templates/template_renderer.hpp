#pragma once

#include "modules/module_registry.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace forgeops::templates {

// Every file the scaffold generates for a module, in generation order.
enum class TemplateKind {
  kReadme,
  kEntrypoint,
  kDefaultConfig,
  kUtilsLib,
  kMetricsLib,
  kDockerfile,
  kK8sManifest,
  kCiWorkflow,
  kTestStub,
  kPackagingScript,
  kSecurityAdvisory,
  kImplementationNotes,
  kPreCommitHook,
  kServicePom,
  kServiceMain,
};

// One rendered file. `relative_path` is relative to the module root and always
// uses `/` separators.
struct ArtifactSpec {
  std::string relative_path;
  std::string content;
  bool executable = false;
};

const std::vector<TemplateKind>& AllTemplateKinds();

const char* ToString(TemplateKind kind);

// Java package segment for a module: `secrets-lifecycle` -> `secrets_lifecycle`.
std::string ServicePackageName(std::string_view module_name);

// PascalCase class stem for a module: `secrets-lifecycle` -> `SecretsLifecycle`.
std::string ServiceClassName(std::string_view module_name);

// Source-package directory of the embedded service stub, relative to the
// module root.
std::string ServiceSourceDir(std::string_view module_name);

// Pure and deterministic: output depends only on module.name and
// module.description.
ArtifactSpec RenderTemplate(const modules::ModuleDescriptor& module, TemplateKind kind);

// Extra artifacts for the secrets-lifecycle module (secret-store client
// stubs and integration guidance).
std::vector<ArtifactSpec> RenderSecretStoreExtras(const modules::ModuleDescriptor& module);

// Files written at the bootstrap base dir, next to the module directories.
std::vector<ArtifactSpec> RenderTopLevelArtifacts(const std::vector<modules::ModuleDescriptor>& modules);

// Replaces every `{{key}}` placeholder. Unknown placeholders are left as-is.
std::string SubstitutePlaceholders(std::string_view text,
                                   const std::vector<std::pair<std::string, std::string>>& values);

} // namespace forgeops::templates
