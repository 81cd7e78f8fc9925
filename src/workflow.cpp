#include "bitcache/workflow.hpp"

#include "bitcache/consts.hpp"
#include "bitcache/errors.hpp"
#include "bitcache/fs.hpp"
#include "bitcache/hash.hpp"
#include "bitcache/time.hpp"
#include "bitcache/util.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <random>
#include <thread>
#include <vector>

namespace stdfs = std::filesystem;

namespace {

void say(std::ostream *out, const std::string &line) {
  if (out != nullptr)
    *out << line << "\n";
}

std::vector<std::uint8_t> read_binary(const stdfs::path &binary) {
  std::error_code ec;
  if (!stdfs::is_regular_file(binary, ec)) {
    throw bitcache::Error(bitcache::ErrorKind::SourceUnreadable,
                          "binary file not found: " + binary.string());
  }
  try {
    return bitcache::fs::read_file(binary);
  } catch (const bitcache::Error &e) {
    throw bitcache::Error(bitcache::ErrorKind::SourceUnreadable,
                          "cannot read binary file " + binary.string() + ": " + e.what());
  }
}

} // namespace

namespace bitcache {

std::string source_digest(const stdfs::path &source) {
  std::error_code ec;
  if (stdfs::is_directory(source, ec)) {
    throw Error(ErrorKind::SourceUnreadable, "source is a directory: " + source.string());
  }
  try {
    return to_hex(md5_file(source));
  } catch (const Error &e) {
    throw Error(ErrorKind::SourceUnreadable,
                "cannot read source file " + source.string() + ": " + e.what());
  }
}

std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, int failed_attempts,
                                        double jitter) {
  if (failed_attempts < 1 || policy.backoff.count() <= 0)
    return std::chrono::milliseconds{0};
  auto delay = policy.backoff;
  for (int i = 1; i < failed_attempts && delay < policy.max_backoff; ++i)
    delay *= 2;
  delay = std::min(delay, std::max(policy.max_backoff, policy.backoff));
  jitter = std::clamp(jitter, 0.0, 1.0);
  const auto extra = static_cast<std::int64_t>(static_cast<double>(delay.count()) * 0.5 * jitter);
  return delay + std::chrono::milliseconds{extra};
}

PublishResult publish_artifact(Store &store, const PublishRequest &request,
                               const PublishOptions &options) {
  std::ostream *out = options.progress;
  const int max_attempts = std::max(1, options.retry.max_attempts);

  // Hashing: digest and bytes stay fixed across every retry below
  say(out, "Computing MD5 of source file: " + request.source.string());
  const std::string digest = source_digest(request.source);
  say(out, "MD5: " + digest);
  const auto bytes = read_binary(request.binary);

  const std::string binary_name = request.binary.filename().string();
  if (binary_name.empty()) {
    throw Error(ErrorKind::InvalidArgument, "invalid binary path: " + request.binary.string());
  }
  // names are recorded in the JSON index, which only holds UTF-8
  if (!is_utf8(binary_name)) {
    throw Error(ErrorKind::InvalidArgument,
                "binary filename is not valid UTF-8: " + request.binary.string());
  }
  if (!is_utf8(request.target_dir)) {
    throw Error(ErrorKind::InvalidArgument, "target path is not valid UTF-8: " + request.target_dir);
  }
  const std::string artifact_path =
      join_store_path(normalize_store_path(request.target_dir), binary_name);
  if (artifact_path == consts::kMetadataFile) {
    throw Error(ErrorKind::InvalidArgument,
                "artifact would overwrite the metadata file: " + artifact_path);
  }
  std::string source_name = request.source.filename().string();
  if (source_name.empty() || !is_utf8(source_name))
    source_name = "unknown";
  const std::string message = std::string(consts::kCommitPrefix) + digest;

  std::mt19937 rng{std::random_device{}()};
  std::uniform_real_distribution<double> jitter(0.0, 1.0);

  for (int attempt = 1;; ++attempt) {
    if (attempt == 1)
      say(out, "Cloning repository: " + store.describe());
    SessionGuard session{store.acquire()};

    // Writing
    MetadataIndex index = session->read_metadata();
    if (const auto owner = index.find_by_path(artifact_path); owner && *owner != digest) {
      throw Error(ErrorKind::PathInUse,
                  "artifact path " + artifact_path + " already holds the binary for MD5 " + *owner);
    }
    if (attempt == 1)
      say(out, "Copying bitstream to: " + artifact_path);
    session->write_artifact(artifact_path, bytes);
    index.upsert(digest, ArtifactRecord{
                             .digest = digest,
                             .artifact_path = artifact_path,
                             .source_name = source_name,
                             .published_at = timeutil::now_iso8601_utc(),
                         });

    // Committing
    if (attempt == 1)
      say(out, "Updating metadata...");
    session->write_metadata(index);

    // Publishing
    if (attempt == 1)
      say(out, "Committing and pushing changes...");
    if (session->publish(message) == PublishStatus::Ok) {
      say(out, "Successfully published bitstream with MD5: " + digest);
      return PublishResult{.record = *index.lookup(digest), .attempts = attempt};
    }

    session.release();
    if (attempt >= max_attempts) {
      throw Error(ErrorKind::PublishConflictExhausted,
                  "gave up publishing MD5 " + digest + " to " + store.describe() + " after " +
                      std::to_string(attempt) + " attempts: the remote kept moving");
    }
    std::this_thread::sleep_for(backoff_delay(options.retry, attempt, jitter(rng)));
  }
}

GetResult get_artifact(Store &store, const GetRequest &request, std::ostream *out) {
  const std::string digest = to_lower(strutil::trim(request.digest));
  if (!looks_hex32(digest))
    throw Error(ErrorKind::InvalidArgument, "not an MD5 digest: '" + digest + "'");
  say(out, "Retrieving bitstream for MD5: " + digest);

  say(out, "Cloning repository: " + store.describe());
  SessionGuard session{store.acquire()};

  const MetadataIndex index = session->read_metadata();
  const auto record = index.lookup(digest);
  if (!record) {
    throw Error(ErrorKind::NotFound, "no binary found for MD5: " + digest);
  }

  const auto bytes = session->read_artifact(record->artifact_path);
  if (!bytes) {
    throw Error(ErrorKind::ArtifactMissing, "binary file not found in repository: " +
                                                record->artifact_path + " (MD5 " + digest + ")");
  }

  const std::string filename = store_basename(record->artifact_path);
  const stdfs::path dest_dir =
      request.dest_dir.empty() ? stdfs::current_path() : request.dest_dir;
  const stdfs::path dest = dest_dir / filename;
  say(out, "Copying " + filename + " to " + dest.string());
  fs::write_file_atomic(dest, *bytes);

  session.release();
  return GetResult{.record = *record, .saved_to = dest};
}

} // namespace bitcache
