#pragma once

#include "p1ck/engine/result.hpp"
#include <istream>
#include <string>
#include <vector>

namespace p1ckx::commands {

// one candidate per line, surrounding whitespace trimmed, blank lines skipped
std::vector<std::string> read_candidate_lines(std::istream& input);

// positional names win; otherwise the named file, otherwise stdin
p1ck::engine::result<std::vector<std::string>> gather_candidates(
    const std::vector<std::string>& names, const std::string& input_file
);

} // namespace p1ckx::commands
