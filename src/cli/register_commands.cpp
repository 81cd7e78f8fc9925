#include "cli/registry.hpp"

int cmd_publish(int argc, char **argv);
int cmd_get(int argc, char **argv);
int cmd_hash(int argc, char **argv);

namespace bitcache::cli {

void register_all_commands() {
  register_command("publish", ::cmd_publish,
                   "Publish a binary: bitcache publish --repo <url> --source <file> "
                   "--bitstream <file> --path <dir> [--ssh-key <file>]");
  register_command("get", ::cmd_get,
                   "Fetch a binary by source MD5: bitcache get --repo <url> --md5 <digest> "
                   "[--ssh-key <file>] [--output <dir>]");
  register_command("hash", ::cmd_hash, "Print the source MD5 of file(s): bitcache hash <file>...");
}

} // namespace bitcache::cli
