#include "bitcache/errors.hpp"
#include "bitcache/metadata.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static bitcache::ArtifactRecord rec(const std::string& d, const std::string& path,
                                    const std::string& when) {
  return bitcache::ArtifactRecord{
      .digest = d, .artifact_path = path, .source_name = "top.vhd", .published_at = when};
}

static bool throws_parse_error(std::string_view text) {
  try {
    (void)bitcache::MetadataIndex::load(text);
  } catch (const bitcache::Error& e) {
    return e.kind() == bitcache::ErrorKind::ParseError;
  }
  return false;
}

int main() {
  const std::string d1 = "0cc175b9c0f1b6a831c399e269772661";
  const std::string d2 = "92eb5ffee6ae2fec3ad71c777531578f";
  const fs::path dir = fs::temp_directory_path() / ("bitcache_meta_" + std::to_string(std::random_device{}()));

  try {
    // Empty and whitespace-only documents are an empty index
    if (!bitcache::MetadataIndex::load(std::string_view{}).empty() ||
        !bitcache::MetadataIndex::load(std::string_view{" \n\t"}).empty()) {
      std::cerr << "empty input did not yield an empty index\n";
      return 1;
    }

    bitcache::MetadataIndex idx;
    idx.upsert(d2, rec(d2, "builds/y/b.bit", "2024-03-01T10:00:00Z"));
    idx.upsert(d1, rec(d1, "builds/x/a.bit", "2024-03-01T09:00:00Z"));

    // Round trip, and the output is canonical
    const std::string text = idx.serialize();
    const auto back = bitcache::MetadataIndex::load(text);
    if (back != idx) { std::cerr << "round trip changed the index\n"; return 1; }
    if (back.serialize() != text) { std::cerr << "serialization not canonical\n"; return 1; }
    if (text.find(d1) > text.find(d2)) { std::cerr << "entries not sorted by digest\n"; return 1; }
    if (text.find("\"binary_path\": \"builds/x/a.bit\"") == std::string::npos ||
        text.find("\"source_file\": \"top.vhd\"") == std::string::npos) {
      std::cerr << "unexpected document layout:\n" << text;
      return 1;
    }

    // Idempotent upsert
    auto twice = idx;
    twice.upsert(d1, rec(d1, "builds/x/a.bit", "2024-03-01T09:00:00Z"));
    twice.upsert(d1, rec(d1, "builds/x/a.bit", "2024-03-01T09:00:00Z"));
    if (twice != idx || twice.size() != 2) { std::cerr << "upsert not idempotent\n"; return 1; }

    // Overwrite updates path and time; an older timestamp never wins
    twice.upsert(d1, rec(d1, "builds/z/a.bit", "2024-04-01T00:00:00Z"));
    twice.upsert(d1, rec(d1, "builds/w/a.bit", "2023-01-01T00:00:00Z"));
    const auto got = twice.lookup(d1);
    if (!got || got->artifact_path != "builds/w/a.bit" || got->published_at != "2024-04-01T00:00:00Z") {
      std::cerr << "overwrite semantics wrong\n";
      return 1;
    }
    if (twice.lookup("ffffffffffffffffffffffffffffffff")) { std::cerr << "lookup invented a record\n"; return 1; }
    if (twice.find_by_path("builds/y/b.bit") != d2 || twice.find_by_path("nope")) {
      std::cerr << "find_by_path mismatch\n";
      return 1;
    }

    // Documents written by other tools: key order and RFC 3339 offsets are accepted
    const auto foreign = bitcache::MetadataIndex::load(
        R"({"entries":{")" + d1 + R"(":{"timestamp":"2024-03-01T09:00:00.123456+00:00",)"
        R"("source_file":"a.vhd","binary_path":"x/a.bit","md5":")" + d1 + R"("}}})");
    if (foreign.size() != 1 || foreign.lookup(d1)->published_at != "2024-03-01T09:00:00.123456+00:00") {
      std::cerr << "foreign document not preserved verbatim\n";
      return 1;
    }

    // Corrupt documents are errors, never an empty index
    if (!throws_parse_error("{ not json") || !throws_parse_error("[]") ||
        !throws_parse_error("{}") || !throws_parse_error(R"({"entries": []})") ||
        !throws_parse_error(R"({"entries": {"abc": {"md5": "abc"}}})") ||
        !throws_parse_error(R"({"entries": {"abc": {"md5": "def", "binary_path": "p",)"
                            R"( "source_file": "s", "timestamp": "t"}}})")) {
      std::cerr << "corrupt metadata accepted\n";
      return 1;
    }

    // Bytes that are not UTF-8 are refused, never rewritten on the way out
    {
      bitcache::MetadataIndex raw;
      raw.upsert(d1, bitcache::ArtifactRecord{.digest = d1, .artifact_path = "b/x\xff.bit",
                                              .source_name = "s\xfe.vhd", .published_at = "2024-03-01T09:00:00Z"});
      bool refused = false;
      try {
        (void)raw.serialize();
      } catch (const bitcache::Error& e) {
        refused = e.kind() == bitcache::ErrorKind::InvalidArgument;
      }
      if (!refused) { std::cerr << "non-UTF-8 record serialized\n"; return 1; }
    }
    if (!throws_parse_error(R"({"entries": {")" + d1 + R"(": {"md5": ")" + d1 +
                            "\", \"binary_path\": \"b/x\xff.bit\", \"source_file\": \"s\", "
                            "\"timestamp\": \"t\"}}}")) {
      std::cerr << "non-UTF-8 document accepted\n";
      return 1;
    }

    // File helpers: missing file is empty, save/load round trips
    fs::create_directories(dir);
    const fs::path file = dir / "bitcache_metadata.json";
    if (!bitcache::MetadataIndex::load_file(file).empty()) { std::cerr << "missing file not empty\n"; return 1; }
    idx.save_file(file);
    if (bitcache::MetadataIndex::load_file(file) != idx) { std::cerr << "file round trip failed\n"; return 1; }

    std::cout << "metadata index OK\n";
  } catch (const std::exception& e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(dir);
    return 1;
  }
  std::error_code ec; fs::remove_all(dir, ec);
  return 0;
}
