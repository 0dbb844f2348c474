#include "commands/detect.hpp"
#include "commands/filter.hpp"
#include "commands/select.hpp"
#include "commands/tokens.hpp"
#include <args.hxx>
#include <redlog.hpp>
#include <algorithm>
#include <iostream>
#include <string>

#include "p1ck/engine/config.hpp"
#include "p1ck/utils/env_config.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

// -v flags and P1CK_VERBOSE both raise the level, whichever is higher wins.
// info -> verbose -> trace -> debug -> pedantic
void apply_verbosity() {
  p1ck::utils::env_config env(p1ck::engine::k_env_prefix);
  int count = std::max(static_cast<int>(args::get(verbosity_flag)), env.get<int>("VERBOSE", 0));

  redlog::level log_level = redlog::level::pedantic;
  switch (count) {
  case 0:
    log_level = redlog::level::info;
    break;
  case 1:
    log_level = redlog::level::verbose;
    break;
  case 2:
    log_level = redlog::level::trace;
    break;
  case 3:
    log_level = redlog::level::debug;
    break;
  default:
    log_level = count < 0 ? redlog::level::info : redlog::level::pedantic;
    break;
  }

  redlog::set_level(log_level);
}
} // namespace cli

int cmd_select(
    args::ValueFlag<std::string>& platform_flag, args::ValueFlag<std::string>& input_flag, args::Flag& first_flag,
    args::ValueFlagList<std::string>& aux_flag, args::PositionalList<std::string>& names_list
) {
  cli::apply_verbosity();

  p1ckx::commands::select_request request;
  if (platform_flag) {
    request.platform = args::get(platform_flag);
  }
  if (input_flag) {
    request.input_file = args::get(input_flag);
  }
  if (aux_flag) {
    request.aux_suffixes = args::get(aux_flag);
  }
  if (names_list) {
    request.names = args::get(names_list);
  }
  request.first_only = args::get(first_flag);

  return p1ckx::commands::select_command(request);
}

int cmd_tokens(
    args::ValueFlag<std::string>& platform_flag, args::ValueFlag<std::string>& input_flag,
    args::PositionalList<std::string>& names_list
) {
  cli::apply_verbosity();

  p1ckx::commands::tokens_request request;
  if (platform_flag) {
    request.platform = args::get(platform_flag);
  }
  if (input_flag) {
    request.input_file = args::get(input_flag);
  }
  if (names_list) {
    request.names = args::get(names_list);
  }

  return p1ckx::commands::tokens_command(request);
}

int cmd_filter(
    args::ValueFlagList<std::string>& prompt_flag, args::ValueFlag<std::string>& input_flag, args::Flag& all_flag,
    args::Flag& case_flag, args::Flag& sort_flag, args::Flag& reverse_flag,
    args::PositionalList<std::string>& names_list
) {
  cli::apply_verbosity();

  p1ckx::commands::filter_request request;
  if (prompt_flag) {
    request.prompts = args::get(prompt_flag);
  }
  if (input_flag) {
    request.input_file = args::get(input_flag);
  }
  if (names_list) {
    request.names = args::get(names_list);
  }
  request.all = args::get(all_flag);
  request.case_sensitive = args::get(case_flag);
  request.sort = args::get(sort_flag);
  request.reverse = args::get(reverse_flag);

  return p1ckx::commands::filter_command(request);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("p1ckx - pick the release asset built for this platform");
  parser.helpParams.showTerminator = false;
  parser.helpParams.helpindent = 2;
  parser.helpParams.width = 120;

  // global flags
  parser.Add(cli::arguments);

  // select command
  args::Command select_cmd(parser, "select", "order candidate asset names by fitness for the platform");
  args::ValueFlag<std::string> select_platform_flag(
      select_cmd, "os:arch", "target platform (default: P1CK_PLATFORM or detected)", {'p', "platform"}
  );
  args::ValueFlag<std::string> select_input_flag(
      select_cmd, "file", "read candidates from file, one per line (default: stdin)", {'f', "file"}
  );
  args::Flag select_first_flag(select_cmd, "first", "print only the best match", {"first"});
  args::ValueFlagList<std::string> select_aux_flag(
      select_cmd, "suffix", "extra auxiliary artifact suffix", {"aux-suffix"}
  );
  args::PositionalList<std::string> select_names(select_cmd, "names", "candidate asset names");

  // detect command
  args::Command detect_cmd(parser, "detect", "print the detected os:arch");

  // tokens command
  args::Command tokens_cmd(parser, "tokens", "show recognized tokens for each candidate");
  args::ValueFlag<std::string> tokens_platform_flag(tokens_cmd, "os:arch", "target platform", {'p', "platform"});
  args::ValueFlag<std::string> tokens_input_flag(tokens_cmd, "file", "read candidates from file", {'f', "file"});
  args::PositionalList<std::string> tokens_names(tokens_cmd, "names", "candidate asset names");

  // filter command
  args::Command filter_cmd(parser, "filter", "keep or reorder names by substring prompts");
  args::ValueFlagList<std::string> filter_prompt_flag(
      filter_cmd, "prompt", "substring to look for (^text anchors start, text$ anchors end)", {'P', "prompt"}
  );
  args::ValueFlag<std::string> filter_input_flag(filter_cmd, "file", "read names from file", {'f', "file"});
  args::Flag filter_all_flag(filter_cmd, "all", "require every prompt instead of any", {"all"});
  args::Flag filter_case_flag(filter_cmd, "case-sensitive", "compare case-sensitively", {"case-sensitive"});
  args::Flag filter_sort_flag(filter_cmd, "sort", "move matches to the front instead of dropping others", {"sort"});
  args::Flag filter_reverse_flag(filter_cmd, "reverse", "with --sort, move matches to the back", {"reverse"});
  args::PositionalList<std::string> filter_names(filter_cmd, "names", "names to filter");

  try {
    parser.ParseCLI(argc, argv);

    if (select_cmd) {
      return cmd_select(select_platform_flag, select_input_flag, select_first_flag, select_aux_flag, select_names);
    } else if (detect_cmd) {
      cli::apply_verbosity();
      return p1ckx::commands::detect_command();
    } else if (tokens_cmd) {
      return cmd_tokens(tokens_platform_flag, tokens_input_flag, tokens_names);
    } else if (filter_cmd) {
      return cmd_filter(
          filter_prompt_flag, filter_input_flag, filter_all_flag, filter_case_flag, filter_sort_flag,
          filter_reverse_flag, filter_names
      );
    } else {
      std::cerr << "error: no command specified" << std::endl;
      std::cerr << parser;
      return 1;
    }

  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::ParseError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  } catch (const args::ValidationError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  return 0;
}
