#pragma once

#include "utils/match_pos.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace p1ck::utils {

enum class combination { any, all };

struct prompt {
  std::string text;
  match_pos position = match_pos::anywhere;
};

// "^text" anchors at the beginning, "text$" at the end, anything else matches anywhere
prompt parse_prompt(std::string_view text);

bool matches_prompts(
    std::string_view item, const std::vector<prompt>& prompts, combination mode = combination::any,
    bool case_sensitive = false
);

// items matching the prompts, in input order
std::vector<std::string> select_list(
    const std::vector<std::string>& items, const std::vector<prompt>& prompts, combination mode = combination::any,
    bool case_sensitive = false
);

// stable reorder moving matching items to the front, or to the back when reverse is set
std::vector<std::string> sort_list(
    std::vector<std::string> items, const std::vector<prompt>& prompts, combination mode = combination::any,
    bool case_sensitive = false, bool reverse = false
);

} // namespace p1ck::utils
