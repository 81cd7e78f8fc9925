#include "bitcache/config.hpp"

#include "bitcache/errors.hpp"
#include "bitcache/fs.hpp"
#include "bitcache/util.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>
#include <string_view>

namespace {

long long parse_number(std::string_view key, const std::string &value, long long min) {
  long long out = 0;
  const auto *first = value.data();
  const auto *last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr != last || out < min) {
    throw bitcache::Error(bitcache::ErrorKind::InvalidArgument,
                          "config: bad value for '" + std::string(key) + "': " + value);
  }
  return out;
}

const char *env_or_null(const char *name) {
  const char *v = std::getenv(name);
  return (v != nullptr && *v != '\0') ? v : nullptr;
}

} // namespace

namespace bitcache {

std::optional<std::filesystem::path> default_config_path() {
  if (const char *explicit_path = env_or_null("BITCACHE_CONFIG"))
    return std::filesystem::path(explicit_path);
  if (const char *xdg = env_or_null("XDG_CONFIG_HOME"))
    return std::filesystem::path(xdg) / "bitcache" / "config";
  if (const char *home = env_or_null("HOME"))
    return std::filesystem::path(home) / ".config" / "bitcache" / "config";
  return std::nullopt;
}

Settings load_settings(const std::filesystem::path &path) {
  Settings out{};
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos)
      continue;
    const std::string key = strutil::trim(sv.substr(0, colon));
    const std::string value = strutil::trim(sv.substr(colon + 1));

    if (key == "author") {
      out.identity.name = value;
    } else if (key == "email") {
      out.identity.email = value;
    } else if (key == "ssh-key") {
      out.ssh_key = value;
    } else if (key == "max-attempts") {
      out.retry.max_attempts = static_cast<int>(parse_number(key, value, 1));
    } else if (key == "backoff-ms") {
      out.retry.backoff = std::chrono::milliseconds(parse_number(key, value, 0));
    } else if (key == "max-backoff-ms") {
      out.retry.max_backoff = std::chrono::milliseconds(parse_number(key, value, 0));
    } else if (key == "timeout-seconds") {
      out.timeout = std::chrono::seconds(parse_number(key, value, 0));
    } else if (key == "scratch-dir") {
      out.scratch_dir = value;
    }
  }
  return out;
}

} // namespace bitcache
