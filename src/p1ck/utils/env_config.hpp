#pragma once

#include <string>
#include <vector>

namespace p1ck::utils {

// typed access to prefixed environment variables, e.g. env_config("P1CK").get<int>("VERBOSE", 0) reads P1CK_VERBOSE
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  std::vector<std::string> get_list(const std::string& name, char delimiter = ',') const;

  bool has(const std::string& name) const { return !get_env_value(name).empty(); }

  std::string env_name(const std::string& name) const { return prefix_ + name; }

private:
  std::string prefix_;
  std::string get_env_value(const std::string& name) const;
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> bool env_config::get<bool>(const std::string& name, bool default_value) const;
template <> int env_config::get<int>(const std::string& name, int default_value) const;

} // namespace p1ck::utils
