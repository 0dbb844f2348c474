#include "ranker.hpp"
#include <redlog.hpp>
#include <algorithm>

namespace p1ck::engine {

bool candidate_less(const scored_candidate& lhs, const scored_candidate& rhs) noexcept {
  if (lhs.matched != rhs.matched) {
    return lhs.matched;
  }
  if (lhs.auxiliary != rhs.auxiliary) {
    return !lhs.auxiliary;
  }
  if (lhs.name.size() != rhs.name.size()) {
    return lhs.name.size() < rhs.name.size();
  }
  return lhs.name < rhs.name;
}

std::vector<scored_candidate> score(
    const std::vector<std::string>& candidates, const platform::platform_identity& identity, const vocabulary& vocab
) {
  auto log = redlog::get_logger("p1ck.ranker");
  const bool tracing = static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::trace);

  // the identity goes through the same token vocabulary as the candidates;
  // an unknown half yields no token, so nothing can match it
  const token_set target = normalize(identity);
  const bool target_complete = !target.os.empty() && !target.arch.empty();

  std::vector<scored_candidate> scored;
  scored.reserve(candidates.size());
  for (const auto& name : candidates) {
    scored_candidate entry;
    entry.name = name;
    entry.tokens = normalize(name, vocab);
    entry.auxiliary = entry.tokens.auxiliary;
    entry.matched =
        target_complete && entry.tokens.has_os(target.os.front()) && entry.tokens.has_arch(target.arch.front());
    if (tracing) {
      log.trc(
          "scored candidate", redlog::field("name", name), redlog::field("tokens", entry.tokens.to_string()),
          redlog::field("matched", entry.matched)
      );
    }
    scored.push_back(std::move(entry));
  }
  return scored;
}

std::vector<std::string> rank(
    const std::vector<std::string>& candidates, const platform::platform_identity& identity, const vocabulary& vocab
) {
  auto log = redlog::get_logger("p1ck.ranker");

  std::vector<scored_candidate> scored = score(candidates, identity, vocab);
  scored.erase(
      std::remove_if(scored.begin(), scored.end(), [](const scored_candidate& entry) { return !entry.matched; }),
      scored.end()
  );
  std::sort(scored.begin(), scored.end(), candidate_less);

  std::vector<std::string> ordered;
  ordered.reserve(scored.size());
  for (auto& entry : scored) {
    ordered.push_back(std::move(entry.name));
  }

  log.dbg(
      "ranked candidates", redlog::field("platform", identity.to_string()),
      redlog::field("candidates", candidates.size()), redlog::field("matches", ordered.size())
  );
  return ordered;
}

} // namespace p1ck::engine
