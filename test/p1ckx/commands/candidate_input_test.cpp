#include <doctest/doctest.h>

#include "commands/candidate_input.hpp"

#include <sstream>

namespace {

using p1ck::engine::error_code;
using p1ckx::commands::gather_candidates;
using p1ckx::commands::read_candidate_lines;

using names = std::vector<std::string>;

} // namespace

TEST_CASE("candidate lines are trimmed and blank lines skipped") {
  std::istringstream input("typstyle-linux-x64\n\n   typstyle-linux-x64.debug  \n\t\n typstyle-darwin-arm64\r\n");
  CHECK(
      read_candidate_lines(input) ==
      names{"typstyle-linux-x64", "typstyle-linux-x64.debug", "typstyle-darwin-arm64"}
  );
}

TEST_CASE("candidate lines keep order and duplicates") {
  std::istringstream input("b-linux-x64\na-linux-x64\nb-linux-x64");
  CHECK(read_candidate_lines(input) == names{"b-linux-x64", "a-linux-x64", "b-linux-x64"});
}

TEST_CASE("empty candidate input yields no lines") {
  std::istringstream empty("");
  CHECK(read_candidate_lines(empty).empty());

  std::istringstream blank("\n  \n\r\n");
  CHECK(read_candidate_lines(blank).empty());
}

TEST_CASE("positional candidates take precedence over the input file") {
  auto gathered = gather_candidates({"app-linux-x64"}, "/nonexistent/p1ck/candidates.txt");
  REQUIRE(gathered.ok());
  CHECK(gathered.value == names{"app-linux-x64"});
}

TEST_CASE("unreadable candidate files are io errors") {
  auto gathered = gather_candidates({}, "/nonexistent/p1ck/candidates.txt");
  CHECK_FALSE(gathered.ok());
  CHECK(gathered.status_info.code == error_code::io_error);
}
