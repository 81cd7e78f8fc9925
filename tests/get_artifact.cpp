#include "bitcache/consts.hpp"
#include "bitcache/errors.hpp"
#include "bitcache/workflow.hpp"
#include "support/memory_store.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <string>

namespace fs = std::filesystem;
using bitcache::testing::MemoryStore;
using bitcache::testing::Remote;

static std::string slurp(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

static std::size_t entries_in(const fs::path& dir) {
  return static_cast<std::size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator{}));
}

template <class F>
static bool fails_with(bitcache::ErrorKind kind, std::string_view needle, F&& f) {
  try {
    f();
  } catch (const bitcache::Error& e) {
    return e.kind() == kind && std::string(e.what()).find(needle) != std::string::npos;
  }
  return false;
}

int main() {
  const fs::path out = fs::temp_directory_path() / ("bitcache_get_" + std::to_string(std::random_device{}()));
  const std::string d1 = "0cc175b9c0f1b6a831c399e269772661";
  const std::string d2 = "92eb5ffee6ae2fec3ad71c777531578f";
  try {
    fs::create_directories(out);

    MemoryStore store;
    store.commit_direct([&](Remote& r) {
      bitcache::MetadataIndex index;
      index.upsert(d1, bitcache::ArtifactRecord{.digest = d1, .artifact_path = "builds/x/a.bit",
                                                .source_name = "a.vhd", .published_at = "2024-02-02T02:02:02Z"});
      index.upsert(d2, bitcache::ArtifactRecord{.digest = d2, .artifact_path = "builds/y/gone.bit",
                                                .source_name = "b.vhd", .published_at = "2024-02-02T02:02:02Z"});
      r.files[std::string(bitcache::consts::kMetadataFile)] = bitcache::testing::bytes_of(index.serialize());
      r.files["builds/x/a.bit"] = bitcache::testing::bytes_of(std::string("\x00\x01\xff bits", 8));
    });
    const int revision = store.remote.revision;

    // Unknown digest: NotFound naming it, destination untouched
    if (!fails_with(bitcache::ErrorKind::NotFound, "ffffffffffffffffffffffffffffffff", [&] {
          (void)bitcache::get_artifact(store, {.digest = "ffffffffffffffffffffffffffffffff", .dest_dir = out});
        })) {
      std::cerr << "unknown digest not NotFound\n";
      return 1;
    }
    if (entries_in(out) != 0) { std::cerr << "NotFound modified the destination\n"; return 1; }

    // Index points at a path absent from the tree
    if (!fails_with(bitcache::ErrorKind::ArtifactMissing, "builds/y/gone.bit", [&] {
          (void)bitcache::get_artifact(store, {.digest = d2, .dest_dir = out});
        })) {
      std::cerr << "missing artifact not ArtifactMissing\n";
      return 1;
    }
    if (entries_in(out) != 0) { std::cerr << "ArtifactMissing modified the destination\n"; return 1; }

    // Found: copied under its own filename, digest matched case-insensitively
    std::string upper = d1;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    const auto res = bitcache::get_artifact(store, {.digest = upper, .dest_dir = out});
    if (res.saved_to != out / "a.bit" || slurp(out / "a.bit") != std::string("\x00\x01\xff bits", 8) ||
        res.record.source_name != "a.vhd" || entries_in(out) != 1) {
      std::cerr << "get produced the wrong file\n";
      return 1;
    }

    // A digest pasted with surrounding whitespace still resolves
    fs::remove(out / "a.bit");
    if (bitcache::get_artifact(store, {.digest = "  " + d1 + "\n", .dest_dir = out}).saved_to != out / "a.bit") {
      std::cerr << "digest with trailing newline not found\n";
      return 1;
    }

    // Malformed digests are refused before the store is contacted
    const int acquires = store.acquires;
    if (!fails_with(bitcache::ErrorKind::InvalidArgument, "not an MD5 digest", [&] {
          (void)bitcache::get_artifact(store, {.digest = "0cc175", .dest_dir = out});
        }) ||
        !fails_with(bitcache::ErrorKind::InvalidArgument, "not an MD5 digest", [&] {
          (void)bitcache::get_artifact(store, {.digest = "zz" + d1.substr(2), .dest_dir = out});
        }) ||
        store.acquires != acquires) {
      std::cerr << "malformed digest not rejected up front\n";
      return 1;
    }

    // Corrupt index on the remote is a ParseError
    store.commit_direct([](Remote& r) {
      r.files[std::string(bitcache::consts::kMetadataFile)] = bitcache::testing::bytes_of("{\"entries\": ");
    });
    if (!fails_with(bitcache::ErrorKind::ParseError, "", [&] {
          (void)bitcache::get_artifact(store, {.digest = d1, .dest_dir = out});
        })) {
      std::cerr << "corrupt index not ParseError\n";
      return 1;
    }

    if (store.live_sessions != 0 || store.publishes != 0 || store.remote.revision != revision + 1) {
      std::cerr << "get leaked a session or wrote to the remote\n";
      return 1;
    }

    std::cout << "get artifact OK\n";
  } catch (const std::exception& e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(out);
    return 1;
  }
  std::error_code ec; fs::remove_all(out, ec);
  return 0;
}
