#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace bitcache {

// Raw 16-byte MD5 digest (binary, not hex)
using digest = std::array<std::uint8_t, 16>;

/** Compute MD5 of arbitrary bytes. */
digest md5(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest md5(std::string_view s) {
  return md5(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/**
 * Stream the file at `path` through MD5 in fixed-size chunks.
 * Throws Error{IoError} if the file cannot be opened or read.
 */
digest md5_file(const std::filesystem::path &path);

/** Convert binary digest to 32-char lowercase hex. */
std::string to_hex(const digest &d);

} // namespace bitcache
