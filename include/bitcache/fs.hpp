#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bitcache::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

inline void write_file_atomic(const std::filesystem::path& p, std::string_view text) {
  write_file_atomic(p, std::span<const std::uint8_t>(
                           reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

// Create a fresh, uniquely named directory "<base>/<prefix>XXXXXX" (mode 0700).
std::filesystem::path make_unique_dir(const std::filesystem::path& base, std::string_view prefix);

// Recursively delete `p`; never throws. Returns false if something was left behind.
bool remove_tree(const std::filesystem::path& p) noexcept;

// Owns a unique directory and removes it on destruction.
class TempDir {
public:
  TempDir(const std::filesystem::path& base, std::string_view prefix);
  ~TempDir();

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

  // Remove the directory now; later calls are no-ops.
  void remove() noexcept;

private:
  std::filesystem::path path_;
  bool removed_ = false;
};

} // namespace bitcache::fs
