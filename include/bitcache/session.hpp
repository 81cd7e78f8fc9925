#pragma once
#include "bitcache/metadata.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bitcache {

enum class PublishStatus : std::uint8_t {
  Ok,       // remote advanced to our commit (or nothing to commit)
  Conflict, // remote moved since acquire; the push was rejected
};

// One working copy of the store, owned by a single operation.
class RepositorySession {
public:
  virtual ~RepositorySession() = default;

  // Metadata document of the working copy (absent -> empty index).
  [[nodiscard]] virtual MetadataIndex read_metadata() const = 0;
  virtual void write_metadata(const MetadataIndex& index) = 0;

  // Materialize `bytes` at the store-relative path, creating directories.
  virtual void write_artifact(std::string_view relative_path,
                              std::span<const std::uint8_t> bytes) = 0;

  // Contents at the store-relative path, std::nullopt if absent.
  [[nodiscard]] virtual std::optional<std::vector<std::uint8_t>>
  read_artifact(std::string_view relative_path) const = 0;

  // Stage, commit and fast-forward the remote default branch.
  // Throws Error{RemoteError} when the remote fails for any reason but a race.
  virtual PublishStatus publish(std::string_view commit_message) = 0;

  // Drop the working copy. Idempotent.
  virtual void release() noexcept = 0;
};

// The remote side: hands out fresh sessions.
class Store {
public:
  virtual ~Store() = default;

  // Throws Error{RemoteError} if the remote cannot be read.
  virtual std::unique_ptr<RepositorySession> acquire() = 0;

  // Human-readable location (URL) for messages
  [[nodiscard]] virtual std::string describe() const = 0;
};

// Releases the owned session on every exit path.
class SessionGuard {
public:
  explicit SessionGuard(std::unique_ptr<RepositorySession> session)
      : session_(std::move(session)) {}
  ~SessionGuard() { release(); }

  SessionGuard(const SessionGuard&) = delete;
  SessionGuard& operator=(const SessionGuard&) = delete;

  RepositorySession* operator->() const { return session_.get(); }
  RepositorySession& operator*() const { return *session_; }

  void release() noexcept {
    if (session_) {
      session_->release();
      session_.reset();
    }
  }

private:
  std::unique_ptr<RepositorySession> session_;
};

} // namespace bitcache
