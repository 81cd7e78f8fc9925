#include "bitcache/errors.hpp"
#include "bitcache/git_session.hpp"
#include "bitcache/process.hpp"
#include "bitcache/time.hpp"
#include "bitcache/workflow.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path& p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string slurp(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

static std::size_t entries_in(const fs::path& dir) {
  return static_cast<std::size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator{}));
}

static std::vector<std::uint8_t> bytes_of(std::string_view s) { return {s.begin(), s.end()}; }

static bitcache::ArtifactRecord record_for(const std::string& d, const std::string& path) {
  return bitcache::ArtifactRecord{.digest = d, .artifact_path = path, .source_name = "race.vhd",
                                  .published_at = bitcache::timeutil::now_iso8601_utc()};
}

// Lands a commit from another "machine" right after each of the first `races` clones
class RacingStore final : public bitcache::Store {
public:
  RacingStore(bitcache::GitStore& inner, int races) : inner_(inner), races_(races) {}

  std::unique_ptr<bitcache::RepositorySession> acquire() override {
    auto mine = inner_.acquire();
    if (races_ > 0) {
      const std::string d = "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb" + std::to_string(races_);
      bitcache::SessionGuard other{inner_.acquire()};
      auto index = other->read_metadata();
      other->write_artifact("racer/" + d + ".bit", bytes_of("racer"));
      index.upsert(d, record_for(d, "racer/" + d + ".bit"));
      other->write_metadata(index);
      if (other->publish("racer") != bitcache::PublishStatus::Ok)
        throw std::runtime_error("racer could not publish");
      --races_;
    }
    return mine;
  }
  [[nodiscard]] std::string describe() const override { return inner_.describe(); }

private:
  bitcache::GitStore& inner_;
  int races_;
};

int main() {
  if (!bitcache::process::on_path("git")) {
    std::cout << "git not found on PATH; skipping\n";
    return 77;
  }

  const fs::path root = fs::temp_directory_path() / ("bitcache_git_" + std::to_string(std::random_device{}()));
  const fs::path bare = root / "store.git";
  const fs::path scratch = root / "scratch";
  const fs::path work = root / "work";
  const fs::path out = root / "out";
  try {
    fs::create_directories(scratch);
    fs::create_directories(out);
    const auto init = bitcache::process::run({"git", "init", "--bare", "--quiet", bare.string()});
    if (!init.ok()) { std::cerr << "git init --bare failed: " << init.err << "\n"; return 1; }

    const bitcache::GitOptions opts{.ssh_key = {},
                                    .identity = {.name = "bitcache test", .email = "test@example.com"},
                                    .timeout = std::chrono::seconds{60},
                                    .scratch_dir = scratch};
    bitcache::GitStore store{bare.string(), opts};
    const bitcache::PublishOptions popts{
        .retry = {.max_attempts = 3, .backoff = std::chrono::milliseconds{0},
                  .max_backoff = std::chrono::milliseconds{0}},
        .progress = nullptr};

    // Publish d1 as builds/x/a.bit into the empty store, then get it back
    write_file(work / "top.vhd", "entity top is end;\n");
    write_file(work / "a.bit", std::string("\x00\x10 first bitstream", 18));
    const bitcache::PublishRequest req{.source = work / "top.vhd", .binary = work / "a.bit",
                                       .target_dir = "builds/x"};
    const auto pub = bitcache::publish_artifact(store, req, popts);
    const std::string d1 = pub.record.digest;
    if (pub.attempts != 1 || pub.record.artifact_path != "builds/x/a.bit") {
      std::cerr << "first publish: unexpected result\n";
      return 1;
    }
    {
      bitcache::SessionGuard check{store.acquire()};
      const auto rec = check->read_metadata().lookup(d1);
      if (!rec || rec->artifact_path != "builds/x/a.bit") { std::cerr << "index not on the remote\n"; return 1; }
    }
    auto got = bitcache::get_artifact(store, {.digest = d1, .dest_dir = out});
    if (got.saved_to != out / "a.bit" || slurp(out / "a.bit") != slurp(work / "a.bit")) {
      std::cerr << "get returned different bytes\n";
      return 1;
    }

    // Same digest, new bytes: the second binary replaces the first
    write_file(work / "a.bit", "second bitstream");
    (void)bitcache::publish_artifact(store, req, popts);
    fs::remove(out / "a.bit");
    got = bitcache::get_artifact(store, {.digest = d1, .dest_dir = out});
    if (slurp(got.saved_to) != "second bitstream") { std::cerr << "re-publish not visible\n"; return 1; }

    // Two sessions from the same tip: the second push must be a Conflict, not an overwrite
    {
      bitcache::SessionGuard first{store.acquire()};
      bitcache::SessionGuard second{store.acquire()};
      const std::string d2 = "22222222222222222222222222222222";
      const std::string d3 = "33333333333333333333333333333333";

      auto idx2 = second->read_metadata();
      second->write_artifact("race/b.bit", bytes_of("b"));
      idx2.upsert(d2, record_for(d2, "race/b.bit"));
      second->write_metadata(idx2);
      if (second->publish("second") != bitcache::PublishStatus::Ok) { std::cerr << "second push failed\n"; return 1; }

      auto idx1 = first->read_metadata();
      first->write_artifact("race/c.bit", bytes_of("c"));
      idx1.upsert(d3, record_for(d3, "race/c.bit"));
      first->write_metadata(idx1);
      if (first->publish("first") != bitcache::PublishStatus::Conflict) {
        std::cerr << "stale push not reported as Conflict\n";
        return 1;
      }

      // Nothing changed -> nothing to push
      bitcache::SessionGuard idle{store.acquire()};
      if (idle->publish("idle") != bitcache::PublishStatus::Ok) { std::cerr << "no-op publish failed\n"; return 1; }

      const auto remote = idle->read_metadata();
      if (!remote.lookup(d2) || remote.lookup(d3) || !remote.lookup(d1) ||
          idle->read_artifact("race/c.bit") || !idle->read_artifact("race/b.bit")) {
        std::cerr << "remote does not hold exactly the winning push\n";
        return 1;
      }
    }

    // A racing writer lands between our clone and push: one retry, both entries kept
    {
      write_file(work / "other.vhd", "entity other is end;\n");
      write_file(work / "o.bit", "other bitstream");
      RacingStore racing{store, 1};
      const auto res = bitcache::publish_artifact(
          racing, {.source = work / "other.vhd", .binary = work / "o.bit", .target_dir = "builds/o"}, popts);
      bitcache::SessionGuard check{store.acquire()};
      const auto index = check->read_metadata();
      if (res.attempts != 2 || !index.lookup(res.record.digest) ||
          !index.lookup("bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb1") || !index.lookup(d1)) {
        std::cerr << "retry after race lost an entry (attempts " << res.attempts << ")\n";
        return 1;
      }
    }

    // Unreachable remote
    bool threw = false;
    try {
      bitcache::GitStore missing{(root / "missing.git").string(), opts};
      (void)missing.acquire();
    } catch (const bitcache::Error& e) {
      threw = e.kind() == bitcache::ErrorKind::RemoteError &&
              std::string(e.what()).find("missing.git") != std::string::npos;
    }
    if (!threw) { std::cerr << "missing remote not a RemoteError\n"; return 1; }

    // Every working copy is gone
    if (entries_in(scratch) != 0) {
      std::cerr << "scratch directory not cleaned: " << entries_in(scratch) << " left\n";
      return 1;
    }

    std::cout << "git session OK\n";
  } catch (const std::exception& e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec; fs::remove_all(root, ec);
  return 0;
}
