#include "bitcache/fs.hpp"

#include "bitcache/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <system_error>

namespace bitcache::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  if (p.parent_path().empty())
    return;
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw Error(ErrorKind::IoError,
                "mkdir -p failed: " + p.parent_path().string() + ": " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw Error(ErrorKind::IoError, "open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  const auto end = ifs.tellg();
  if (end < 0) {
    throw Error(ErrorKind::IoError, "not a readable file: " + p.string());
  }
  auto n = static_cast<std::size_t>(end);
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw Error(ErrorKind::IoError, "read failed: " + p.string());
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw Error(ErrorKind::IoError, "open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw Error(ErrorKind::IoError, "flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(p, ec);
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
      std::filesystem::remove(tmp, ec);
      throw Error(ErrorKind::IoError,
                  "atomic replace failed: " + p.string() + ": " + ec.message());
    }
  }
}

std::filesystem::path make_unique_dir(const std::filesystem::path &base, std::string_view prefix) {
  std::error_code ec;
  std::filesystem::create_directories(base, ec);
  if (ec)
    throw Error(ErrorKind::IoError, "mkdir -p failed: " + base.string() + ": " + ec.message());

  std::string templ = (base / std::string(prefix)).string() + "XXXXXX";
  if (::mkdtemp(templ.data()) == nullptr) {
    throw Error(ErrorKind::IoError,
                "mkdtemp failed under " + base.string() + ": " + std::strerror(errno));
  }
  return templ;
}

bool remove_tree(const std::filesystem::path &p) noexcept {
  if (p.empty())
    return true;
  std::error_code ec;
  std::filesystem::remove_all(p, ec);
  if (ec) {
    // git marks pack files read-only; make everything writable and try again
    for (auto it = std::filesystem::recursive_directory_iterator(p, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
      std::error_code perm_ec;
      std::filesystem::permissions(it->path(), std::filesystem::perms::owner_all,
                                   std::filesystem::perm_options::add, perm_ec);
    }
    ec.clear();
    std::filesystem::remove_all(p, ec);
  }
  if (ec)
    return false;
  return !std::filesystem::exists(p, ec) && !ec;
}

TempDir::TempDir(const std::filesystem::path &base, std::string_view prefix)
    : path_(make_unique_dir(base, prefix)) {}

TempDir::~TempDir() { remove(); }

void TempDir::remove() noexcept {
  if (removed_)
    return;
  removed_ = true;
  if (!remove_tree(path_))
    std::cerr << "warning: could not remove " << path_.string() << "\n";
}

} // namespace bitcache::fs
