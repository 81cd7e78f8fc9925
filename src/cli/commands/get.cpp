#include "bitcache/errors.hpp"
#include "bitcache/git_session.hpp"
#include "bitcache/workflow.hpp"
#include "cli/args.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

static void get_usage() {
  std::cerr << "usage: bitcache get --repo <url> --md5 <digest> [--ssh-key <file>] "
               "[--output <dir>] [--timeout <seconds>] [--quiet]\n";
}

int cmd_get(int argc, char **argv) {
  bitcache::cli::Args args;
  try {
    args = bitcache::cli::parse_args(argc, argv, {"repo", "md5", "ssh-key", "output", "timeout"},
                                     {"quiet"});
  } catch (const std::invalid_argument &e) {
    std::cerr << "get: " << e.what() << "\n";
    get_usage();
    return 2;
  }
  if (const std::string missing = bitcache::cli::first_missing(args, {"repo", "md5"});
      !missing.empty()) {
    std::cerr << "get: missing --" << missing << "\n";
    get_usage();
    return 2;
  }

  try {
    const auto settings = bitcache::cli::resolve_settings(args);
    bitcache::GitStore store{args.values.at("repo"), bitcache::git_options_from(settings)};

    const bitcache::GetRequest request{
        .digest = args.values.at("md5"),
        .dest_dir = args.has("output") ? args.values.at("output") : std::string{},
    };
    const bool quiet = args.on("quiet");
    const auto result = bitcache::get_artifact(store, request, quiet ? nullptr : &std::cout);

    if (quiet) {
      std::cout << result.saved_to.string() << "\n";
    } else {
      std::cout << "Successfully retrieved bitstream:\n";
      std::cout << "  Source file: " << result.record.source_name << "\n";
      std::cout << "  MD5: " << result.record.digest << "\n";
      std::cout << "  Timestamp: " << result.record.published_at << "\n";
      std::cout << "  Saved to: " << result.saved_to.string() << "\n";
    }
    return 0;
  } catch (const bitcache::Error &e) {
    std::cerr << "get: " << bitcache::to_string(e.kind()) << ": " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "get: " << e.what() << "\n";
    return 1;
  }
}
