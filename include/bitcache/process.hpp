#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bitcache::process {

struct Options {
  std::filesystem::path cwd;                                // empty -> inherit
  std::vector<std::pair<std::string, std::string>> env;     // added/overridden variables
  std::chrono::seconds timeout{0};                          // 0 -> no limit
};

struct Result {
  int exit_code = -1;   // exit status, or -1 if killed by a signal
  bool timed_out = false;
  std::string out;      // captured stdout
  std::string err;      // captured stderr

  [[nodiscard]] bool ok() const { return exit_code == 0 && !timed_out; }
};

// Run argv[0] (searched on PATH) with the given arguments, capturing both streams.
// Blocks until the child exits or the timeout expires (the child is then killed).
// Throws Error{IoError} if the child cannot be started.
Result run(const std::vector<std::string>& argv, const Options& opts = {});

// Is `name` an executable file in one of the PATH directories?
bool on_path(std::string_view name);

} // namespace bitcache::process
