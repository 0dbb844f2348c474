#include "select.hpp"
#include "candidate_input.hpp"

#include <iostream>

#include <redlog.hpp>

#include "p1ck/engine/config.hpp"
#include "p1ck/engine/selector.hpp"

namespace p1ckx::commands {

int select_command(const select_request& request) {
  auto log = redlog::get_logger("p1ckx.select");

  p1ck::engine::selection_options options = p1ck::engine::load_options();
  for (const auto& suffix : request.aux_suffixes) {
    auto added = options.vocab.add_auxiliary_marker(suffix);
    if (!added.ok()) {
      log.err("invalid auxiliary suffix", redlog::field("suffix", suffix));
      std::cerr << "error: " << added.message << std::endl;
      return 1;
    }
  }

  if (!request.platform.empty()) {
    auto parsed = p1ck::engine::platform::parse_platform(request.platform, options.vocab);
    if (!parsed.ok()) {
      std::cerr << "error: " << parsed.status_info.message << std::endl;
      return 1;
    }
    options.mode = p1ck::engine::platform_mode::explicit_identity;
    options.identity = parsed.value;
  }

  auto candidates = gather_candidates(request.names, request.input_file);
  if (!candidates.ok()) {
    std::cerr << "error: " << candidates.status_info.message << std::endl;
    return 1;
  }

  auto identity = p1ck::engine::resolve_identity(options);
  options.mode = p1ck::engine::platform_mode::explicit_identity;
  options.identity = identity;

  auto selected = p1ck::engine::select(candidates.value, options);
  if (selected.empty()) {
    log.err(
        "no compatible asset", redlog::field("platform", identity.to_string()),
        redlog::field("candidates", candidates.value.size())
    );
    std::cerr << "error: no compatible asset found for " << identity.to_string() << std::endl;
    return 1;
  }

  log.vrb("selected asset", redlog::field("name", selected.front()), redlog::field("matches", selected.size()));
  if (request.first_only) {
    std::cout << selected.front() << "\n";
    return 0;
  }
  for (const auto& name : selected) {
    std::cout << name << "\n";
  }
  return 0;
}

} // namespace p1ckx::commands
