#include "bitcache/errors.hpp"
#include "bitcache/git_session.hpp"
#include "bitcache/workflow.hpp"
#include "cli/args.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

static void publish_usage() {
  std::cerr << "usage: bitcache publish --repo <url> --source <file> --bitstream <file> "
               "--path <dir> [--ssh-key <file>] [--max-attempts <n>] [--timeout <seconds>] "
               "[--quiet]\n";
}

int cmd_publish(int argc, char **argv) {
  bitcache::cli::Args args;
  try {
    args = bitcache::cli::parse_args(
        argc, argv, {"repo", "source", "bitstream", "path", "ssh-key", "max-attempts", "timeout"},
        {"quiet"});
  } catch (const std::invalid_argument &e) {
    std::cerr << "publish: " << e.what() << "\n";
    publish_usage();
    return 2;
  }
  // --path may legitimately be empty (store root), so it is only required to be given
  const std::string missing = bitcache::cli::first_missing(args, {"repo", "source", "bitstream"});
  if (!missing.empty() || !args.has("path")) {
    std::cerr << "publish: missing --" << (missing.empty() ? "path" : missing) << "\n";
    publish_usage();
    return 2;
  }

  try {
    const auto settings = bitcache::cli::resolve_settings(args);
    bitcache::GitStore store{args.values.at("repo"), bitcache::git_options_from(settings)};

    const bitcache::PublishRequest request{
        .source = args.values.at("source"),
        .binary = args.values.at("bitstream"),
        .target_dir = args.values.at("path"),
    };
    const bitcache::PublishOptions options{
        .retry = settings.retry,
        .progress = args.on("quiet") ? nullptr : &std::cout,
    };
    if (!args.on("quiet"))
      std::cout << "Publishing bitstream...\n";
    const auto result = bitcache::publish_artifact(store, request, options);
    if (args.on("quiet"))
      std::cout << result.record.digest << "\n";
    return 0;
  } catch (const bitcache::Error &e) {
    std::cerr << "publish: " << bitcache::to_string(e.kind()) << ": " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "publish: " << e.what() << "\n";
    return 1;
  }
}
