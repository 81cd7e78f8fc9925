// String and store-path helpers
#include "bitcache/util.hpp"

#include "bitcache/consts.hpp"
#include "bitcache/errors.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace bitcache {

bool looks_hex32(std::string_view str) {
  if (str.size() != consts::kDigestHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

bool is_utf8(std::string_view str) {
  std::size_t i = 0;
  while (i < str.size()) {
    const auto c = static_cast<unsigned char>(str[i]);
    std::size_t len = 0;
    char32_t cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + len > str.size())
      return false;
    for (std::size_t k = 1; k < len; ++k) {
      const auto cc = static_cast<unsigned char>(str[i + k]);
      if ((cc & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong forms, surrogates and values past U+10FFFF
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
        (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
      return false;
    i += len;
  }
  return true;
}

std::string to_lower(std::string_view str) {
  std::string out(str);
  std::ranges::transform(out, out.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return out;
}

std::string normalize_store_path(std::string_view path) {
  const std::string original(path);
  if (!path.empty() && (path.front() == '/' || path.front() == '\\')) {
    throw Error(ErrorKind::InvalidArgument, "store path must be relative: " + original);
  }

  // split on '/' and '\', dropping empty and "." components
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= path.size(); ++i) {
    if (i == path.size() || path[i] == '/' || path[i] == '\\') {
      const auto part = path.substr(start, i - start);
      start = i + 1;
      if (part.empty() || part == ".")
        continue;
      if (part == "..")
        throw Error(ErrorKind::InvalidArgument, "store path may not contain '..': " + original);
      if (parts.empty() && part.find(':') != std::string_view::npos)
        throw Error(ErrorKind::InvalidArgument, "store path must be relative: " + original);
      parts.push_back(part);
    }
  }
  if (!parts.empty() && to_lower(parts.front()) == consts::kGitDir) {
    throw Error(ErrorKind::InvalidArgument, "store path may not enter .git: " + original);
  }

  std::string out;
  for (const auto part : parts) {
    if (!out.empty())
      out.push_back('/');
    out.append(part);
  }
  return out;
}

std::string join_store_path(std::string_view dir, std::string_view name) {
  if (dir.empty())
    return std::string(name);
  std::string out(dir);
  if (out.back() != '/')
    out.push_back('/');
  out.append(name);
  return out;
}

std::string store_basename(std::string_view path) {
  const auto pos = path.find_last_of('/');
  return std::string(pos == std::string_view::npos ? path : path.substr(pos + 1));
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!sv.empty() && blank(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && blank(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

} // namespace strutil

} // namespace bitcache
