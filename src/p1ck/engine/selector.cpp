#include "selector.hpp"
#include "engine/ranker.hpp"
#include <redlog.hpp>

namespace p1ck::engine {

platform::platform_identity resolve_identity(const selection_options& options) {
  if (options.mode == platform_mode::explicit_identity) {
    return options.identity;
  }
  return platform::detect_platform();
}

std::vector<std::string> select(const std::vector<std::string>& candidates) {
  return rank(candidates, platform::detect_platform(), default_vocabulary());
}

std::vector<std::string> select(const std::vector<std::string>& candidates, const selection_options& options) {
  auto log = redlog::get_logger("p1ck.select");
  platform::platform_identity identity = resolve_identity(options);
  log.vrb(
      "selecting assets", redlog::field("platform", identity.to_string()),
      redlog::field("mode", std::string(options.mode == platform_mode::explicit_identity ? "explicit" : "auto")),
      redlog::field("candidates", candidates.size())
  );

  if (candidates.empty()) {
    return {};
  }
  if (!identity.is_known()) {
    log.wrn("platform is not fully recognized, nothing can match", redlog::field("platform", identity.to_string()));
    return {};
  }
  return rank(candidates, identity, options.vocab);
}

std::vector<std::string> select(
    const std::vector<std::string>& candidates, const platform::platform_identity& identity
) {
  return rank(candidates, identity, default_vocabulary());
}

} // namespace p1ck::engine
