#pragma once

#include <string>
#include <vector>

namespace p1ckx::commands {

struct select_request {
  std::vector<std::string> names;
  std::string input_file;
  std::string platform; // explicit os:arch, empty to use P1CK_PLATFORM or detection
  std::vector<std::string> aux_suffixes;
  bool first_only = false;
};

int select_command(const select_request& request);

} // namespace p1ckx::commands
