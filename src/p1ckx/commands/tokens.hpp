#pragma once

#include <string>
#include <vector>

namespace p1ckx::commands {

struct tokens_request {
  std::vector<std::string> names;
  std::string input_file;
  std::string platform;
};

// prints each candidate with its recognized tokens and whether it matches the platform
int tokens_command(const tokens_request& request);

} // namespace p1ckx::commands
