#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bitcache {

enum class ErrorKind : std::uint8_t {
  SourceUnreadable,
  RemoteError,
  ParseError,
  PublishConflictExhausted,
  NotFound,
  ArtifactMissing,
  IoError,
  InvalidArgument,
  PathInUse,
};

// Short stable name, e.g. "RemoteError"
auto to_string(ErrorKind kind) -> std::string_view;

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace bitcache
