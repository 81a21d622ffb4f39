#ifndef FORGEOPS_TESTS_COMMON_ENV_OVERRIDE_HPP_
#define FORGEOPS_TESTS_COMMON_ENV_OVERRIDE_HPP_

#include "assertions.hpp"

#include <cstdlib>
#include <optional>
#include <string>

namespace forgeops::tests::common {

inline std::optional<std::string> ReadEnvVar(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

inline void SetEnvVar(const char* name, const char* value) {
#if defined(_WIN32)
  if (_putenv_s(name, value) != 0) {
    Fail("failed to set environment variable");
  }
#else
  if (setenv(name, value, 1) != 0) {
    Fail("failed to set environment variable");
  }
#endif
}

inline void UnsetEnvVar(const char* name) {
#if defined(_WIN32)
  if (_putenv_s(name, "") != 0) {
    Fail("failed to unset environment variable");
  }
#else
  if (unsetenv(name) != 0) {
    Fail("failed to unset environment variable");
  }
#endif
}

// Sets (or clears, when `value` is null) one variable for the scope's lifetime.
class ScopedEnvOverride {
public:
  ScopedEnvOverride(const char* name, const char* value)
      : name_(name), previous_(ReadEnvVar(name)) {
    if (value == nullptr) {
      UnsetEnvVar(name_);
    } else {
      SetEnvVar(name_, value);
    }
  }

  ~ScopedEnvOverride() {
    if (previous_.has_value()) {
      SetEnvVar(name_, previous_->c_str());
      return;
    }
    UnsetEnvVar(name_);
  }

  ScopedEnvOverride(const ScopedEnvOverride&) = delete;
  ScopedEnvOverride& operator=(const ScopedEnvOverride&) = delete;

private:
  const char* name_ = "";
  std::optional<std::string> previous_;
};

} // namespace forgeops::tests::common

#endif // FORGEOPS_TESTS_COMMON_ENV_OVERRIDE_HPP_
