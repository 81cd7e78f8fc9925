#pragma once
#include "bitcache/config.hpp"
#include "bitcache/metadata.hpp"
#include "bitcache/session.hpp"

#include <chrono>
#include <filesystem>
#include <ostream>
#include <string>

namespace bitcache {

struct PublishRequest {
  std::filesystem::path source;   // file whose digest keys the artifact
  std::filesystem::path binary;   // artifact to store
  std::string target_dir;         // store-relative directory for the artifact
};

struct PublishOptions {
  RetryPolicy retry;
  std::ostream* progress = nullptr; // step-by-step messages, nullptr -> silent
};

struct PublishResult {
  ArtifactRecord record;
  int attempts = 0; // 1 + number of conflicts recovered from
};

// Hash, write, commit and push; retries from a fresh clone on Conflict.
// Throws Error (SourceUnreadable, RemoteError, ParseError, PathInUse,
// InvalidArgument, IoError, PublishConflictExhausted).
PublishResult publish_artifact(Store& store, const PublishRequest& request,
                               const PublishOptions& options = {});

struct GetRequest {
  std::string digest;
  std::filesystem::path dest_dir; // empty -> current directory
};

struct GetResult {
  ArtifactRecord record;
  std::filesystem::path saved_to;
};

// Resolve `digest` and copy the artifact out under its own filename.
// Throws Error (NotFound, ArtifactMissing, RemoteError, ParseError, IoError).
GetResult get_artifact(Store& store, const GetRequest& request,
                       std::ostream* progress = nullptr);

// Delay before the next attempt after `failed_attempts` conflicts.
// `jitter` in [0, 1) stretches the delay by up to 50%.
std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int failed_attempts,
                                        double jitter);

// Digest that publish_artifact would compute for `source`.
// Throws Error{SourceUnreadable}.
std::string source_digest(const std::filesystem::path& source);

} // namespace bitcache
