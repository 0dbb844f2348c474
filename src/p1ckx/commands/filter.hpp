#pragma once

#include <string>
#include <vector>

namespace p1ckx::commands {

struct filter_request {
  std::vector<std::string> names;
  std::string input_file;
  std::vector<std::string> prompts;
  bool all = false;
  bool case_sensitive = false;
  bool sort = false;
  bool reverse = false;
};

int filter_command(const filter_request& request);

} // namespace p1ckx::commands
