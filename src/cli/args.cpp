#include "cli/args.hpp"

#include "bitcache/errors.hpp"

#include <charconv>
#include <stdexcept>
#include <string_view>

namespace bitcache::cli {

Args parse_args(int argc, char **argv, const std::set<std::string> &value_opts,
                const std::set<std::string> &switch_opts) {
  Args out;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if (arg == "--") {
      for (++i; i < argc; ++i)
        out.positional.emplace_back(argv[i]);
      break;
    }
    if (!arg.starts_with("--")) {
      out.positional.emplace_back(arg);
      continue;
    }

    std::string name{arg.substr(2)};
    std::string value;
    bool inline_value = false;
    if (const auto eq = name.find('='); eq != std::string::npos) {
      value = name.substr(eq + 1);
      name.resize(eq);
      inline_value = true;
    }

    if (switch_opts.contains(name) && !inline_value) {
      out.switches.insert(name);
    } else if (value_opts.contains(name)) {
      if (!inline_value) {
        if (i + 1 >= argc)
          throw std::invalid_argument("option --" + name + " needs a value");
        value = argv[++i];
      }
      out.values[name] = value;
    } else {
      throw std::invalid_argument("unknown option: " + std::string(arg));
    }
  }
  return out;
}

std::string first_missing(const Args &args, const std::vector<std::string> &required) {
  for (const auto &name : required) {
    if (!args.has(name) || args.values.at(name).empty())
      return name;
  }
  return {};
}

static long long positive_number(const std::string &name, const std::string &value) {
  long long out = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec != std::errc{} || ptr != value.data() + value.size() || out < 1) {
    throw Error(ErrorKind::InvalidArgument, "--" + name + " expects a positive number: " + value);
  }
  return out;
}

Settings resolve_settings(const Args &args) {
  Settings s{};
  if (const auto path = default_config_path()) {
    s = load_settings(*path);
  }
  if (args.has("ssh-key"))
    s.ssh_key = args.values.at("ssh-key");
  if (args.has("max-attempts"))
    s.retry.max_attempts = static_cast<int>(positive_number("max-attempts", args.values.at("max-attempts")));
  if (args.has("timeout"))
    s.timeout = std::chrono::seconds(positive_number("timeout", args.values.at("timeout")));
  return s;
}

} // namespace bitcache::cli
