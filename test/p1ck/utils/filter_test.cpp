#include <doctest/doctest.h>

#include "p1ck/utils/filter.hpp"

#include <initializer_list>

namespace {

using p1ck::utils::combination;
using p1ck::utils::match_pos;
using p1ck::utils::matches_prompts;
using p1ck::utils::parse_prompt;
using p1ck::utils::prompt;
using p1ck::utils::select_list;
using p1ck::utils::sort_list;

using names = std::vector<std::string>;

std::vector<prompt> prompts(std::initializer_list<const char*> texts) {
  std::vector<prompt> out;
  for (const char* text : texts) {
    out.push_back(prompt{text, match_pos::anywhere});
  }
  return out;
}

} // namespace

TEST_CASE("prompt positions anchor matches") {
  CHECK(matches_prompts("asdfoo123", {prompt{"foo", match_pos::anywhere}}));
  CHECK_FALSE(matches_prompts("asdfoo123", {prompt{"foo", match_pos::begin}}));
  CHECK(matches_prompts("asdfoo123", {prompt{"asd", match_pos::begin}}));
  CHECK(matches_prompts("asdfoo123", {prompt{"123", match_pos::end}}));
  CHECK_FALSE(matches_prompts("asdfoo123", {prompt{"asd", match_pos::end}}));
  CHECK(matches_prompts("asd-foo-123", {prompt{"foo", match_pos::word}}));
  CHECK(matches_prompts("foo", {prompt{"foo", match_pos::word}}));
  CHECK(matches_prompts("food-foo", {prompt{"foo", match_pos::word}}));
  CHECK_FALSE(matches_prompts("asdfoo123", {prompt{"foo", match_pos::word}}));
}

TEST_CASE("prompt parsing reads anchors") {
  auto begin = parse_prompt("^asd");
  CHECK(begin.text == "asd");
  CHECK(begin.position == match_pos::begin);

  auto end = parse_prompt(".exe$");
  CHECK(end.text == ".exe");
  CHECK(end.position == match_pos::end);

  auto plain = parse_prompt("^");
  CHECK(plain.text == "^");
  CHECK(plain.position == match_pos::anywhere);
}

TEST_CASE("select_list combines prompts") {
  CHECK(select_list({"12", "13", "23"}, prompts({"1"}), combination::all) == names{"12", "13"});
  CHECK(select_list({"12", "13", "23", "34"}, prompts({"1", "2"}), combination::any) == names{"12", "13", "23"});
  CHECK(select_list({"12", "13", "23", "34", "21"}, prompts({"1", "2"}), combination::all) == names{"12", "21"});
}

TEST_CASE("select_list honors case sensitivity") {
  names items{"Tool-Linux", "tool-windows"};
  CHECK(select_list(items, prompts({"LINUX"})) == names{"Tool-Linux"});
  CHECK(select_list(items, prompts({"LINUX"}), combination::any, true).empty());
  CHECK(select_list(items, prompts({"Linux"}), combination::any, true) == names{"Tool-Linux"});
}

TEST_CASE("empty prompt lists match nothing for any and everything for all") {
  names items{"a", "b"};
  CHECK(select_list(items, {}, combination::any).empty());
  CHECK(select_list(items, {}, combination::all) == items);
}

TEST_CASE("sort_list moves matches to the front stably") {
  CHECK(sort_list({"12", "13", "23"}, prompts({"2"})) == names{"12", "23", "13"});
  CHECK(sort_list({"foo", "bar", "baz"}, prompts({"a"})) == names{"bar", "baz", "foo"});
}

TEST_CASE("sort_list can push matches to the back") {
  names items{"app.pdb", "app.exe", "app.sha256", "app.zip"};
  std::vector<prompt> unwanted{prompt{".pdb", match_pos::end}, prompt{".sha256", match_pos::end}};
  CHECK(sort_list(items, unwanted, combination::any, false, true) == names{"app.exe", "app.zip", "app.pdb", "app.sha256"});
}
