#pragma once

#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "p1ck/engine/platform/platform.hpp"

namespace p1ck::test_helpers {

inline engine::platform::platform_identity identity(engine::platform::os_kind os, engine::platform::arch_kind arch) {
  return engine::platform::platform_identity{os, arch};
}

// sets an environment variable for the lifetime of the object, restoring the previous value afterwards
class scoped_env {
public:
  scoped_env(std::string name, const std::string& value) : name_(std::move(name)) {
    if (const char* previous = std::getenv(name_.c_str())) {
      previous_ = previous;
    }
    set(value);
  }

  ~scoped_env() {
    if (previous_) {
      set(*previous_);
    } else {
      unset();
    }
  }

  scoped_env(const scoped_env&) = delete;
  scoped_env& operator=(const scoped_env&) = delete;

private:
  void set(const std::string& value) {
#ifdef _WIN32
    _putenv_s(name_.c_str(), value.c_str());
#else
    setenv(name_.c_str(), value.c_str(), 1);
#endif
  }

  void unset() {
#ifdef _WIN32
    _putenv_s(name_.c_str(), "");
#else
    unsetenv(name_.c_str());
#endif
  }

  std::string name_;
  std::optional<std::string> previous_;
};

// release assets of a typical rust cli, one primary and one auxiliary per target
inline std::vector<std::string> typstyle_assets() {
  return {
      "typstyle-alpine-x64",         "typstyle-alpine-x64.debug",   "typstyle-darwin-arm64",
      "typstyle-darwin-arm64.dwarf", "typstyle-darwin-x64",         "typstyle-darwin-x64.dwarf",
      "typstyle-linux-arm64",        "typstyle-linux-arm64.debug",  "typstyle-linux-armhf",
      "typstyle-linux-armhf.debug",  "typstyle-linux-x64",          "typstyle-linux-x64.debug",
      "typstyle-win32-arm64.exe",    "typstyle-win32-arm64.pdb",    "typstyle-win32-x64.exe",
      "typstyle-win32-x64.pdb",
  };
}

} // namespace p1ck::test_helpers
