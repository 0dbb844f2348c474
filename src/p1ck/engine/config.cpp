#include "config.hpp"
#include <redlog.hpp>

namespace p1ck::engine {

selection_options load_options(const utils::env_config& env) {
  auto log = redlog::get_logger("p1ck.config");
  selection_options options;

  for (const auto& suffix : env.get_list("AUX_SUFFIXES")) {
    status added = options.vocab.add_auxiliary_marker(suffix, match_pos::end);
    if (!added.ok()) {
      log.wrn("ignoring auxiliary suffix", redlog::field("suffix", suffix), redlog::field("error", added.message));
    }
  }

  std::string platform_text = env.get<std::string>("PLATFORM", "");
  if (platform_text.empty()) {
    return options;
  }

  auto parsed = platform::parse_platform(platform_text, options.vocab);
  if (!parsed.ok()) {
    log.wrn(
        "invalid platform override, falling back to detection", redlog::field("variable", env.env_name("PLATFORM")),
        redlog::field("error", parsed.status_info.message)
    );
    return options;
  }

  options.mode = platform_mode::explicit_identity;
  options.identity = parsed.value;
  log.dbg("platform override from environment", redlog::field("platform", parsed.value.to_string()));
  return options;
}

selection_options load_options() { return load_options(utils::env_config(k_env_prefix)); }

} // namespace p1ck::engine
