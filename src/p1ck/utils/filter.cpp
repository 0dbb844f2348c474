#include "filter.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <iterator>

namespace p1ck::utils {

prompt parse_prompt(std::string_view text) {
  prompt parsed;
  if (text.size() > 1 && text.front() == '^') {
    parsed.text = std::string(text.substr(1));
    parsed.position = match_pos::begin;
  } else if (text.size() > 1 && text.back() == '$') {
    parsed.text = std::string(text.substr(0, text.size() - 1));
    parsed.position = match_pos::end;
  } else {
    parsed.text = std::string(text);
  }
  return parsed;
}

bool matches_prompts(std::string_view item, const std::vector<prompt>& prompts, combination mode, bool case_sensitive) {
  std::string folded = case_sensitive ? std::string(item) : to_lower(item);
  auto hit = [&](const prompt& p) {
    return case_sensitive ? matches_at(folded, p.text, p.position) : matches_at(folded, to_lower(p.text), p.position);
  };

  if (mode == combination::all) {
    return std::all_of(prompts.begin(), prompts.end(), hit);
  }
  return std::any_of(prompts.begin(), prompts.end(), hit);
}

std::vector<std::string> select_list(
    const std::vector<std::string>& items, const std::vector<prompt>& prompts, combination mode, bool case_sensitive
) {
  std::vector<std::string> selected;
  std::copy_if(items.begin(), items.end(), std::back_inserter(selected), [&](const std::string& item) {
    return matches_prompts(item, prompts, mode, case_sensitive);
  });
  return selected;
}

std::vector<std::string> sort_list(
    std::vector<std::string> items, const std::vector<prompt>& prompts, combination mode, bool case_sensitive,
    bool reverse
) {
  std::stable_partition(items.begin(), items.end(), [&](const std::string& item) {
    return matches_prompts(item, prompts, mode, case_sensitive) != reverse;
  });
  return items;
}

} // namespace p1ck::utils
