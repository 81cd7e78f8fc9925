#pragma once
#include <ostream>
#include <string>
#include "cli/command.hpp"

namespace bitcache::cli {

void register_command(const std::string& name, command_fn fn, const std::string& help);
command_fn find_command(const std::string& name);

// Command list; main sends it to stdout for `help`, to stderr on misuse
void print_usage(std::ostream& os);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace bitcache::cli
