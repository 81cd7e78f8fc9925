#pragma once
#include "bitcache/consts.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace bitcache {

struct Identity {
  std::string name;
  std::string email;
};

// Commit retry parameters for publish
struct RetryPolicy {
  int max_attempts = consts::kDefaultMaxAttempts;          // total attempts, >= 1
  std::chrono::milliseconds backoff = consts::kDefaultBackoff; // delay before 2nd attempt
  std::chrono::milliseconds max_backoff = consts::kDefaultMaxBackoff;
};

struct Settings {
  Identity identity;                  // empty fields -> git's own configuration
  std::string ssh_key;                // optional transport credential reference
  RetryPolicy retry;
  std::chrono::seconds timeout = consts::kDefaultGitTimeout;
  std::filesystem::path scratch_dir;  // empty -> system temp directory
};

// $BITCACHE_CONFIG, else $XDG_CONFIG_HOME/bitcache/config, else ~/.config/bitcache/config.
// Returns std::nullopt if none of the variables can be resolved.
std::optional<std::filesystem::path> default_config_path();

// Read settings from a "key: value" file (defaults if the file is missing).
Settings load_settings(const std::filesystem::path& path);

} // namespace bitcache
