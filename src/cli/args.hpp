#pragma once
#include "bitcache/config.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace bitcache::cli {

struct Args {
  std::map<std::string, std::string> values; // --name value / --name=value
  std::set<std::string> switches;            // --name
  std::vector<std::string> positional;

  [[nodiscard]] bool has(const std::string& name) const { return values.contains(name); }
  [[nodiscard]] bool on(const std::string& name) const { return switches.contains(name); }
};

// Parse argv[1..argc). Throws std::invalid_argument on unknown or incomplete options.
Args parse_args(int argc, char** argv, const std::set<std::string>& value_opts,
                const std::set<std::string>& switch_opts = {});

// First missing option among `required`, or "" if all are present
std::string first_missing(const Args& args, const std::vector<std::string>& required);

// Config file settings overridden by --ssh-key / --max-attempts / --timeout.
Settings resolve_settings(const Args& args);

} // namespace bitcache::cli
