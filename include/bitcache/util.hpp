#pragma once
#include <string>
#include <string_view>

namespace bitcache {

// Validate 32-char lowercase/uppercase hex
auto looks_hex32(std::string_view str) -> bool;

// Well-formed UTF-8 (no overlongs, surrogates or truncated sequences)
auto is_utf8(std::string_view str) -> bool;

// Lowercase ASCII copy (digests are compared in lowercase)
auto to_lower(std::string_view str) -> std::string;

// Normalize a store-relative path to generic "a/b/c" form.
// Throws Error{InvalidArgument} for absolute paths, ".." components,
// or paths that enter the .git directory. Empty input yields "".
auto normalize_store_path(std::string_view path) -> std::string;

// Join a store-relative directory and a filename ("" dir -> just the name)
auto join_store_path(std::string_view dir, std::string_view name) -> std::string;

// Last component of a store-relative path
auto store_basename(std::string_view path) -> std::string;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip leading/trailing whitespace (space, tab, CR, LF)
  auto trim(std::string_view sv) -> std::string;
}

}
