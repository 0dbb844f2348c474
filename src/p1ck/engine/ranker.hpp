#pragma once

#include "engine/normalizer.hpp"
#include "engine/platform/platform.hpp"
#include "engine/vocabulary.hpp"
#include <string>
#include <vector>

namespace p1ck::engine {

// per-candidate annotations, only alive for the duration of a ranking
struct scored_candidate {
  std::string name;
  token_set tokens;
  bool matched = false;
  bool auxiliary = false;
};

// total order: matches first, primary before auxiliary, shorter name first, then lexicographic
bool candidate_less(const scored_candidate& lhs, const scored_candidate& rhs) noexcept;

// annotate every candidate against the identity, preserving input order
std::vector<scored_candidate> score(
    const std::vector<std::string>& candidates, const platform::platform_identity& identity, const vocabulary& vocab
);

// matching candidates only, best first; empty when nothing matches
std::vector<std::string> rank(
    const std::vector<std::string>& candidates, const platform::platform_identity& identity, const vocabulary& vocab
);

} // namespace p1ck::engine
