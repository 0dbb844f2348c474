#include "filter.hpp"
#include "candidate_input.hpp"

#include <iostream>

#include <redlog.hpp>

#include "p1ck/utils/filter.hpp"

namespace p1ckx::commands {

int filter_command(const filter_request& request) {
  auto log = redlog::get_logger("p1ckx.filter");

  if (request.prompts.empty()) {
    log.err("at least one prompt required");
    std::cerr << "error: at least one prompt (-P/--prompt) is required" << std::endl;
    return 1;
  }

  auto candidates = gather_candidates(request.names, request.input_file);
  if (!candidates.ok()) {
    std::cerr << "error: " << candidates.status_info.message << std::endl;
    return 1;
  }

  std::vector<p1ck::utils::prompt> prompts;
  prompts.reserve(request.prompts.size());
  for (const auto& text : request.prompts) {
    prompts.push_back(p1ck::utils::parse_prompt(text));
  }
  auto mode = request.all ? p1ck::utils::combination::all : p1ck::utils::combination::any;

  std::vector<std::string> output;
  if (request.sort) {
    output = p1ck::utils::sort_list(candidates.value, prompts, mode, request.case_sensitive, request.reverse);
  } else {
    output = p1ck::utils::select_list(candidates.value, prompts, mode, request.case_sensitive);
  }

  log.dbg("filtered", redlog::field("input", candidates.value.size()), redlog::field("output", output.size()));
  for (const auto& name : output) {
    std::cout << name << "\n";
  }
  return output.empty() ? 1 : 0;
}

} // namespace p1ckx::commands
