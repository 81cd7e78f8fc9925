#pragma once

namespace bitcache::cli {

// Handler receives argv starting at the subcommand name
using command_fn = int (*)(int argc, char **argv);

} // namespace bitcache::cli
