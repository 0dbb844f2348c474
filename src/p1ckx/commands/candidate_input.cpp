#include "candidate_input.hpp"

#include <fstream>
#include <iostream>

#include <redlog.hpp>

#include "p1ck/utils/string_utils.hpp"

namespace p1ckx::commands {

std::vector<std::string> read_candidate_lines(std::istream& input) {
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(input, line)) {
    std::string trimmed = p1ck::utils::trim_copy(line);
    if (!trimmed.empty()) {
      lines.push_back(std::move(trimmed));
    }
  }
  return lines;
}

p1ck::engine::result<std::vector<std::string>> gather_candidates(
    const std::vector<std::string>& names, const std::string& input_file
) {
  using p1ck::engine::error_code;
  using p1ck::engine::error_result;
  using p1ck::engine::ok_result;

  auto log = redlog::get_logger("p1ckx.input");
  if (!names.empty()) {
    return ok_result(names);
  }

  if (!input_file.empty()) {
    std::ifstream file(input_file);
    if (!file) {
      log.err("failed to open candidate list", redlog::field("path", input_file));
      return error_result<std::vector<std::string>>(error_code::io_error, "could not read input file: " + input_file);
    }
    auto lines = read_candidate_lines(file);
    log.dbg("read candidates from file", redlog::field("path", input_file), redlog::field("count", lines.size()));
    return ok_result(std::move(lines));
  }

  auto lines = read_candidate_lines(std::cin);
  log.dbg("read candidates from stdin", redlog::field("count", lines.size()));
  return ok_result(std::move(lines));
}

} // namespace p1ckx::commands
