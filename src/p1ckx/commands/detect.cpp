#include "detect.hpp"

#include <iostream>

#include "p1ck/engine/platform/platform.hpp"

namespace p1ckx::commands {

int detect_command() {
  auto identity = p1ck::engine::platform::detect_platform();
  std::cout << identity.to_string() << std::endl;
  return identity.is_known() ? 0 : 1;
}

} // namespace p1ckx::commands
