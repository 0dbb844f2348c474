#include "tokens.hpp"
#include "candidate_input.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

#include <redlog.hpp>

#include "p1ck/engine/config.hpp"
#include "p1ck/engine/ranker.hpp"

namespace p1ckx::commands {

int tokens_command(const tokens_request& request) {
  auto log = redlog::get_logger("p1ckx.tokens");

  p1ck::engine::selection_options options = p1ck::engine::load_options();
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
  auto scored = p1ck::engine::score(candidates.value, identity, options.vocab);
  log.dbg("scored candidates", redlog::field("platform", identity.to_string()), redlog::field("count", scored.size()));

  size_t width = 0;
  for (const auto& entry : scored) {
    width = std::max(width, entry.name.size());
  }

  std::cout << "platform: " << identity.to_string() << "\n";
  for (const auto& entry : scored) {
    std::cout << std::left << std::setw(static_cast<int>(width)) << entry.name << "  " << entry.tokens.to_string()
              << "  " << (entry.matched ? "match" : "-") << "\n";
  }
  return 0;
}

} // namespace p1ckx::commands
