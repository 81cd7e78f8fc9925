#include "bitcache/consts.hpp"
#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  bitcache::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    bitcache::cli::print_usage(std::cerr);
    return 2;
  }
  const std::string cmd = argv[1];
  if (cmd == "help" || cmd == "--help" || cmd == "-h") {
    bitcache::cli::print_usage(std::cout);
    return 0;
  }
  if (cmd == "--version") {
    std::cout << "bitcache " << bitcache::consts::kVersion << "\n";
    return 0;
  }

  const auto fn = bitcache::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    bitcache::cli::print_usage(std::cerr);
    return 2;
  }
  // Subcommand sees itself as argv[0]
  return fn(argc - 1, argv + 1);
}
