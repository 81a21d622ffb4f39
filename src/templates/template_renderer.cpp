#include "templates/template_renderer.hpp"

#include <cctype>

namespace forgeops::templates {

namespace {

enum class CommentStyle {
  kHash,
  kMarkdown,
  kBlock,
  kXml,
};

constexpr std::string_view kCopyrightLines[] = {
    "Copyright (c) 2025 Devin B. Royal.",
    "All Rights Reserved.",
};

// Prepends the copyright block in the file's own comment syntax. A leading
// shebang line stays first so generated scripts remain executable.
std::string WithHeader(CommentStyle style, std::string_view body) {
  std::string header;
  switch (style) {
  case CommentStyle::kHash:
    for (const auto line : kCopyrightLines) {
      header += "# ";
      header += line;
      header += '\n';
    }
    break;
  case CommentStyle::kMarkdown:
    header = "<!--\n";
    for (const auto line : kCopyrightLines) {
      header += "  ";
      header += line;
      header += '\n';
    }
    header += "-->\n";
    break;
  case CommentStyle::kBlock:
    header = "/*\n";
    for (const auto line : kCopyrightLines) {
      header += " * ";
      header += line;
      header += '\n';
    }
    header += " */\n";
    break;
  case CommentStyle::kXml:
    header = "<!-- ";
    header += kCopyrightLines[0];
    header += ' ';
    header += kCopyrightLines[1];
    header += " -->\n";
    break;
  }

  if (body.rfind("#!", 0) == 0U) {
    const std::size_t newline = body.find('\n');
    const std::size_t split = newline == std::string_view::npos ? body.size() : newline + 1;
    std::string out(body.substr(0, split));
    if (newline == std::string_view::npos) {
      out += '\n';
    }
    out += header;
    out += '\n';
    out.append(body.substr(split));
    return out;
  }

  return header + "\n" + std::string(body);
}

constexpr std::string_view kReadmeBody = R"TMPL(# {{name}}

{{description}}

## Overview
This is a generated scaffold intended for enterprise integration. It includes:
- hardened bash entrypoint
- configuration templates (etc/)
- packaging scripts
- CI workflow (ci/)
- Dockerfile and Kubernetes manifest stubs
- a Java service stub under java/

## Quickstart
1. Update etc/default.conf with your endpoints and secure storage references.
2. Run: bin/entrypoint.sh --help
3. Run tests: ./tests/run_tests.sh

## Integrity
packaging/SHASUMS256.txt lists the SHA-256 digest of every file in this module.
Verify with: (cd {{name}} && sha256sum -c packaging/SHASUMS256.txt)
)TMPL";

constexpr std::string_view kEntrypointBody = R"TMPL(#!/usr/bin/env bash
# Robust CLI entrypoint for {{name}}
set -euo pipefail
IFS=$'\n\t'
PROG_NAME="$(basename "$0")"

usage() {
  cat <<USAGE
Usage: $PROG_NAME [--help] [--run] [--config FILE] [--dry-run]

Options:
  --help        Show help
  --run         Execute main flow
  --config FILE Path to config (default: etc/default.conf)
  --dry-run     Validate configs and exit
USAGE
}

log() { printf '%s [INFO] %s\n' "$(date -u +'%Y-%m-%dT%H:%M:%SZ')" "$*"; }
err() { printf '%s [ERROR] %s\n' "$(date -u +'%Y-%m-%dT%H:%M:%SZ')" "$*" >&2; }
die() { err "$*"; exit 1; }

main() {
  local cfg="${CFG:-etc/default.conf}"
  [[ -f "$cfg" ]] || die "Missing config: $cfg"
  # shellcheck disable=SC1090
  source "$cfg"
  log "Loaded config: $cfg"

  if [[ "${DRY_RUN:-0}" == "1" ]]; then
    log "Dry run - config validated"
    return 0
  fi

  if [[ -f lib/utils.sh ]]; then
    # shellcheck disable=SC1091
    source lib/utils.sh
  fi

  log "{{name}} main flow executed (placeholder)."
}

if [[ $# -eq 0 ]]; then usage; exit 0; fi
while [[ $# -gt 0 ]]; do
  case "$1" in
    --help) usage; exit 0 ;;
    --run) shift; main; exit $? ;;
    --config) CFG="$2"; shift 2 ;;
    --dry-run) DRY_RUN=1; shift ;;
    *) err "Unknown arg: $1"; usage; exit 2 ;;
  esac
done
main
)TMPL";

constexpr std::string_view kDefaultConfigBody = R"TMPL(# Default configuration for {{name}}
BACKEND_ENDPOINT="https://api.example.local"
LOG_PATH="/var/log/forgeops/{{name}}.log"
MAX_RETRIES=3
RETRY_BASE_SEC=2
)TMPL";

constexpr std::string_view kUtilsLibBody = R"TMPL(#!/usr/bin/env bash
set -euo pipefail
IFS=$'\n\t'

# HTTP GET with exponential backoff.
http_get() {
  local url="$1" out=${2:-/dev/null} retries=${3:-3}
  local backoff=1 i=0
  while :; do
    if curl -fsS --max-time 30 "$url" -o "$out"; then
      return 0
    fi
    i=$((i+1))
    if [[ $i -ge $retries ]]; then return 1; fi
    sleep "$backoff"
    backoff=$((backoff*2))
  done
}

# JSON field extraction via jq when available.
json_get() { if command -v jq >/dev/null 2>&1; then jq -r "$1" <"$2"; else awk "$1" "$2"; fi }
)TMPL";

constexpr std::string_view kMetricsLibBody = R"TMPL(#!/usr/bin/env bash
# File-based metrics and healthcheck shim for {{name}}
set -euo pipefail
IFS=$'\n\t'
METRICS_FILE="${METRICS_FILE:-/var/run/forgeops/{{name}}_metrics.prom}"
health() { echo "ok"; }
emit_metric() { echo "${1} ${2:-1}" >> "${METRICS_FILE}"; }
)TMPL";

constexpr std::string_view kDockerfileBody = R"TMPL(FROM ubuntu:22.04
LABEL maintainer="DevOps Team <devops@example.com>"
LABEL org.opencontainers.image.description="{{description}}"
ENV LANG=C.UTF-8
RUN apt-get update && apt-get install -y --no-install-recommends \
    bash curl ca-certificates \
  && rm -rf /var/lib/apt/lists/*
COPY bin/ /opt/forgeops/{{name}}/bin/
COPY etc/ /opt/forgeops/{{name}}/etc/
COPY lib/ /opt/forgeops/{{name}}/lib/
WORKDIR /opt/forgeops/{{name}}
ENTRYPOINT ["/opt/forgeops/{{name}}/bin/entrypoint.sh"]
CMD ["--help"]
)TMPL";

constexpr std::string_view kK8sManifestBody = R"TMPL(apiVersion: apps/v1
kind: Deployment
metadata:
  name: {{name}}
  labels:
    app: {{name}}
spec:
  replicas: 1
  selector:
    matchLabels:
      app: {{name}}
  template:
    metadata:
      labels:
        app: {{name}}
    spec:
      containers:
      - name: {{name}}
        image: myregistry/{{name}}:latest
        args: ["--run"]
        env:
        - name: BACKEND_ENDPOINT
          valueFrom:
            configMapKeyRef:
              name: {{name}}-cfg
              key: BACKEND_ENDPOINT
)TMPL";

constexpr std::string_view kCiWorkflowBody = R"TMPL(name: {{name}} CI
on: [push, pull_request]
jobs:
  test:
    runs-on: ubuntu-latest
    steps:
      - uses: actions/checkout@v4
      - name: Run tests
        run: |
          chmod +x tests/run_tests.sh
          ./tests/run_tests.sh
)TMPL";

constexpr std::string_view kTestStubBody = R"TMPL(#!/usr/bin/env bash
set -euo pipefail
IFS=$'\n\t'
PROG="${PROG:-$(pwd)/bin/entrypoint.sh}"
if [[ ! -x "$PROG" ]]; then echo "Missing: $PROG" >&2; exit 2; fi
"$PROG" --help >/dev/null
DRY_RUN=1 "$PROG" --config etc/default.conf --dry-run
echo "OK: {{name}}"
)TMPL";

constexpr std::string_view kPackagingScriptBody = R"TMPL(#!/usr/bin/env bash
set -euo pipefail
ROOT_DIR="$(cd "$(dirname "${BASH_SOURCE[0]}")/.." && pwd)"
OUT="${OUT:-${ROOT_DIR}/../{{name}}.tar.gz}"
if [[ -d "${ROOT_DIR}/java" ]] && command -v mvn >/dev/null 2>&1; then
  (cd "${ROOT_DIR}/java" && mvn -q -DskipTests package)
fi
tar -czf "${OUT}" -C "${ROOT_DIR}" .
echo "Created: ${OUT}"
)TMPL";

constexpr std::string_view kSecurityAdvisoryBody = R"TMPL(# Security Advisory - {{name}}

- DO NOT store production secrets in etc/; use environment variables or a secret store.
- Ensure TLS verification and pin certificates where possible.
- Use HSM/KMS-backed keys for signing and encryption.
- Conduct a security review before production deployment.
)TMPL";

constexpr std::string_view kImplementationNotesBody = R"TMPL(# Implementation Notes - {{name}}

{{description}}

Module {{name}} was scaffolded with a bash entrypoint, shell libraries and a
Java service stub ({{service_class}}Service in package com.forgeops.{{package}}).
Replace the placeholder main flow in bin/entrypoint.sh before deployment.
)TMPL";

constexpr std::string_view kPreCommitHookBody = R"TMPL(#!/usr/bin/env bash
# Pre-commit hook for {{name}}: refuse commits that add obvious secrets.
set -euo pipefail
if git diff --cached --name-only | grep -E '\.(pem|key|p12)$' >/dev/null; then
  echo "refusing to commit key material in {{name}}" >&2
  exit 1
fi
)TMPL";

constexpr std::string_view kServicePomBody = R"TMPL(<project xmlns="http://maven.apache.org/POM/4.0.0">
  <modelVersion>4.0.0</modelVersion>
  <groupId>com.forgeops</groupId>
  <artifactId>{{name}}</artifactId>
  <version>0.1.0</version>
  <name>{{description}}</name>
  <properties>
    <maven.compiler.release>17</maven.compiler.release>
    <forgeops.build.dir>${project.basedir}/target</forgeops.build.dir>
  </properties>
  <build>
    <directory>${forgeops.build.dir}</directory>
  </build>
</project>
)TMPL";

constexpr std::string_view kServiceMainBody = R"TMPL(package com.forgeops.{{package}};

public class {{service_class}}Service {
    public void start() {
        System.out.println("{{name}} service started");
    }

    public static void main(String[] args) {
        new {{service_class}}Service().start();
    }
}
)TMPL";

struct KindTemplate {
  std::string_view body;
  CommentStyle style;
  bool executable;
};

KindTemplate TemplateFor(TemplateKind kind) {
  switch (kind) {
  case TemplateKind::kReadme:
    return {kReadmeBody, CommentStyle::kMarkdown, false};
  case TemplateKind::kEntrypoint:
    return {kEntrypointBody, CommentStyle::kHash, true};
  case TemplateKind::kDefaultConfig:
    return {kDefaultConfigBody, CommentStyle::kHash, false};
  case TemplateKind::kUtilsLib:
    return {kUtilsLibBody, CommentStyle::kHash, false};
  case TemplateKind::kMetricsLib:
    return {kMetricsLibBody, CommentStyle::kHash, true};
  case TemplateKind::kDockerfile:
    return {kDockerfileBody, CommentStyle::kHash, false};
  case TemplateKind::kK8sManifest:
    return {kK8sManifestBody, CommentStyle::kHash, false};
  case TemplateKind::kCiWorkflow:
    return {kCiWorkflowBody, CommentStyle::kHash, false};
  case TemplateKind::kTestStub:
    return {kTestStubBody, CommentStyle::kHash, true};
  case TemplateKind::kPackagingScript:
    return {kPackagingScriptBody, CommentStyle::kHash, true};
  case TemplateKind::kSecurityAdvisory:
    return {kSecurityAdvisoryBody, CommentStyle::kMarkdown, false};
  case TemplateKind::kImplementationNotes:
    return {kImplementationNotesBody, CommentStyle::kMarkdown, false};
  case TemplateKind::kPreCommitHook:
    return {kPreCommitHookBody, CommentStyle::kHash, true};
  case TemplateKind::kServicePom:
    return {kServicePomBody, CommentStyle::kXml, false};
  case TemplateKind::kServiceMain:
    return {kServiceMainBody, CommentStyle::kBlock, false};
  }

  return {kReadmeBody, CommentStyle::kMarkdown, false};
}

std::string RelativePathFor(const modules::ModuleDescriptor& module, TemplateKind kind) {
  switch (kind) {
  case TemplateKind::kReadme:
    return "README.md";
  case TemplateKind::kEntrypoint:
    return "bin/entrypoint.sh";
  case TemplateKind::kDefaultConfig:
    return "etc/default.conf";
  case TemplateKind::kUtilsLib:
    return "lib/utils.sh";
  case TemplateKind::kMetricsLib:
    return "lib/metrics.sh";
  case TemplateKind::kDockerfile:
    return "docker/Dockerfile";
  case TemplateKind::kK8sManifest:
    return "k8s/deployment.yaml";
  case TemplateKind::kCiWorkflow:
    return "ci/ci.yml";
  case TemplateKind::kTestStub:
    return "tests/run_tests.sh";
  case TemplateKind::kPackagingScript:
    return "packaging/make_package.sh";
  case TemplateKind::kSecurityAdvisory:
    return "docs/SECURITY_ADVISORY.md";
  case TemplateKind::kImplementationNotes:
    return "docs/IMPLEMENTATION_NOTES.md";
  case TemplateKind::kPreCommitHook:
    return "hooks/pre-commit";
  case TemplateKind::kServicePom:
    return "java/pom.xml";
  case TemplateKind::kServiceMain:
    return ServiceSourceDir(module.name) + "/" + ServiceClassName(module.name) + "Service.java";
  }

  return "README.md";
}

std::vector<std::pair<std::string, std::string>> ModuleValues(
    const modules::ModuleDescriptor& module) {
  return {
      {"name", module.name},
      {"description", module.description},
      {"package", ServicePackageName(module.name)},
      {"service_class", ServiceClassName(module.name)},
  };
}

} // namespace

const std::vector<TemplateKind>& AllTemplateKinds() {
  static const std::vector<TemplateKind> kinds = {
      TemplateKind::kReadme,          TemplateKind::kEntrypoint,
      TemplateKind::kDefaultConfig,   TemplateKind::kUtilsLib,
      TemplateKind::kMetricsLib,      TemplateKind::kDockerfile,
      TemplateKind::kK8sManifest,     TemplateKind::kCiWorkflow,
      TemplateKind::kTestStub,        TemplateKind::kPackagingScript,
      TemplateKind::kSecurityAdvisory, TemplateKind::kImplementationNotes,
      TemplateKind::kPreCommitHook,   TemplateKind::kServicePom,
      TemplateKind::kServiceMain,
  };
  return kinds;
}

const char* ToString(TemplateKind kind) {
  switch (kind) {
  case TemplateKind::kReadme:
    return "README";
  case TemplateKind::kEntrypoint:
    return "Entrypoint";
  case TemplateKind::kDefaultConfig:
    return "DefaultConfig";
  case TemplateKind::kUtilsLib:
    return "UtilsLib";
  case TemplateKind::kMetricsLib:
    return "MetricsLib";
  case TemplateKind::kDockerfile:
    return "Dockerfile";
  case TemplateKind::kK8sManifest:
    return "K8sManifest";
  case TemplateKind::kCiWorkflow:
    return "CiWorkflow";
  case TemplateKind::kTestStub:
    return "TestStub";
  case TemplateKind::kPackagingScript:
    return "PackagingScript";
  case TemplateKind::kSecurityAdvisory:
    return "SecurityAdvisory";
  case TemplateKind::kImplementationNotes:
    return "ImplementationNotes";
  case TemplateKind::kPreCommitHook:
    return "PreCommitHook";
  case TemplateKind::kServicePom:
    return "ServicePom";
  case TemplateKind::kServiceMain:
    return "ServiceMain";
  }

  return "README";
}

std::string ServicePackageName(std::string_view module_name) {
  std::string package;
  package.reserve(module_name.size());
  for (const char c : module_name) {
    package.push_back((c == '-' || c == '.') ? '_' : c);
  }
  if (!package.empty() && std::isdigit(static_cast<unsigned char>(package.front())) != 0) {
    package.insert(package.begin(), '_');
  }
  return package;
}

std::string ServiceClassName(std::string_view module_name) {
  std::string name;
  bool upper_next = true;
  for (const char c : module_name) {
    if (c == '-' || c == '_' || c == '.') {
      upper_next = true;
      continue;
    }
    if (upper_next) {
      name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
      upper_next = false;
    } else {
      name.push_back(c);
    }
  }
  if (!name.empty() && std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    name.insert(0, "M");
  }
  return name;
}

std::string ServiceSourceDir(std::string_view module_name) {
  return "java/src/main/java/com/forgeops/" + ServicePackageName(module_name);
}

std::string SubstitutePlaceholders(std::string_view text,
                                   const std::vector<std::pair<std::string, std::string>>& values) {
  std::string out;
  out.reserve(text.size());

  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t open = text.find("{{", pos);
    if (open == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    const std::size_t close = text.find("}}", open + 2);
    if (close == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }

    out.append(text.substr(pos, open - pos));
    const std::string_view key = text.substr(open + 2, close - open - 2);
    bool replaced = false;
    for (const auto& [name, value] : values) {
      if (key == name) {
        out += value;
        replaced = true;
        break;
      }
    }
    if (!replaced) {
      out.append(text.substr(open, close + 2 - open));
    }
    pos = close + 2;
  }
  return out;
}

ArtifactSpec RenderTemplate(const modules::ModuleDescriptor& module, TemplateKind kind) {
  const KindTemplate tmpl = TemplateFor(kind);

  ArtifactSpec spec;
  spec.relative_path = RelativePathFor(module, kind);
  spec.content = WithHeader(tmpl.style, SubstitutePlaceholders(tmpl.body, ModuleValues(module)));
  spec.executable = tmpl.executable;
  return spec;
}

} // namespace forgeops::templates
