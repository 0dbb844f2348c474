#include "env_config.hpp"
#include "string_utils.hpp"
#include <redlog.hpp>
#include <cstdlib>
#include <exception>

namespace p1ck::utils {

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(env_name(name).c_str());
  return value ? trim_copy(value) : std::string();
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(value);
  return lower_value == "1" || lower_value == "true" || lower_value == "yes" || lower_value == "on";
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  try {
    return std::stoi(value);
  } catch (const std::exception& e) {
    auto log = redlog::get_logger("p1ck.config");
    log.wrn(
        "failed to parse integer, using default", redlog::field("variable", env_name(name)),
        redlog::field("value", value), redlog::field("error", std::string(e.what()))
    );
    return default_value;
  }
}

std::vector<std::string> env_config::get_list(const std::string& name, char delimiter) const {
  return split_trimmed(get_env_value(name), delimiter);
}

} // namespace p1ck::utils
