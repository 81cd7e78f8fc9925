#include "bitcache/time.hpp"

#include <cctype>
#include <cstdio>

#if defined(_WIN32)
#include <time.h>
#include <windows.h>
static std::time_t timegm_portable(std::tm *t) { return _mkgmtime(t); }
#else
// POSIX/macOS have timegm
static std::time_t timegm_portable(std::tm *t) { return timegm(t); }
#endif

namespace {

// Read exactly `width` digits at `pos`; advances pos. -1 on failure.
int read_digits(std::string_view s, std::size_t &pos, std::size_t width) {
  if (pos + width > s.size())
    return -1;
  int v = 0;
  for (std::size_t i = 0; i < width; ++i) {
    const char c = s[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return -1;
    v = (v * 10) + (c - '0');
  }
  pos += width;
  return v;
}

bool expect(std::string_view s, std::size_t &pos, char c) {
  if (pos >= s.size() || s[pos] != c)
    return false;
  ++pos;
  return true;
}

} // namespace

namespace bitcache::timeutil {

std::string format_iso8601_utc(std::time_t when) {
  std::tm gt{};
#if defined(_WIN32)
  gmtime_s(&gt, &when);
#else
  gmtime_r(&when, &gt);
#endif
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", gt.tm_year + 1900,
                gt.tm_mon + 1, gt.tm_mday, gt.tm_hour, gt.tm_min, gt.tm_sec);
  return std::string(buf);
}

std::string now_iso8601_utc() { return format_iso8601_utc(std::time(nullptr)); }

std::optional<std::time_t> parse_iso8601(std::string_view s) {
  std::size_t pos = 0;
  std::tm t{};
  const int year = read_digits(s, pos, 4);
  if (year < 0 || !expect(s, pos, '-'))
    return std::nullopt;
  const int mon = read_digits(s, pos, 2);
  if (mon < 1 || mon > 12 || !expect(s, pos, '-'))
    return std::nullopt;
  const int day = read_digits(s, pos, 2);
  if (day < 1 || day > 31)
    return std::nullopt;
  if (pos >= s.size() || (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' '))
    return std::nullopt;
  ++pos;
  const int hh = read_digits(s, pos, 2);
  if (hh < 0 || hh > 23 || !expect(s, pos, ':'))
    return std::nullopt;
  const int mm = read_digits(s, pos, 2);
  if (mm < 0 || mm > 59 || !expect(s, pos, ':'))
    return std::nullopt;
  const int ss = read_digits(s, pos, 2);
  if (ss < 0 || ss > 60)
    return std::nullopt;

  // fractional seconds are ignored
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    const std::size_t frac_start = pos;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])))
      ++pos;
    if (pos == frac_start)
      return std::nullopt;
  }

  int offset_minutes = 0;
  if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z')) {
    ++pos;
  } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
    const int sign = s[pos] == '-' ? -1 : 1;
    ++pos;
    const int oh = read_digits(s, pos, 2);
    if (oh < 0 || !expect(s, pos, ':'))
      return std::nullopt;
    const int om = read_digits(s, pos, 2);
    if (om < 0)
      return std::nullopt;
    offset_minutes = sign * ((oh * 60) + om);
  } else {
    return std::nullopt;
  }
  if (pos != s.size())
    return std::nullopt;

  t.tm_year = year - 1900;
  t.tm_mon = mon - 1;
  t.tm_mday = day;
  t.tm_hour = hh;
  t.tm_min = mm;
  t.tm_sec = ss;
  const std::time_t local = timegm_portable(&t);
  return local - (static_cast<std::time_t>(offset_minutes) * 60);
}

} // namespace bitcache::timeutil
