#include "cli/registry.hpp"

#include "bitcache/consts.hpp"

#include <algorithm>
#include <map>

namespace bitcache::cli {

struct entry {
  command_fn fn;
  std::string help;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table()[name] = entry{.fn = fn, .help = help};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage(std::ostream &os) {
  std::size_t width = 0;
  for (const auto &[name, e] : table())
    width = std::max(width, name.size());

  os << "bitcache " << consts::kVersion << " - binary cache keyed by source MD5, stored in git\n\n";
  os << "usage: bitcache <command> [options]\n\n";
  os << "commands:\n";
  for (const auto &[name, e] : table()) {
    os << "  " << name << std::string(width - name.size() + 2, ' ') << e.help << "\n";
  }
  os << "\nsettings are read from $BITCACHE_CONFIG or ~/.config/bitcache/config\n";
}

} // namespace bitcache::cli
