#include "bitcache/errors.hpp"
#include "bitcache/workflow.hpp"

#include <iostream>
#include <stdexcept>

// Same digest publish would key the artifact with, md5sum-style output
int cmd_hash(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: bitcache hash <file> [<file> ...]\n";
    return 2;
  }
  int rc = 0;
  for (int i = 1; i < argc; ++i) {
    try {
      std::cout << bitcache::source_digest(argv[i]) << "  " << argv[i] << "\n";
    } catch (const bitcache::Error &e) {
      std::cerr << "hash: " << bitcache::to_string(e.kind()) << ": " << e.what() << "\n";
      rc = 1;
    } catch (const std::exception &e) {
      std::cerr << "hash: " << e.what() << "\n";
      rc = 1;
    }
  }
  return rc;
}
