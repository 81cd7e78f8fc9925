#include "bitcache/errors.hpp"

namespace bitcache {

auto to_string(ErrorKind kind) -> std::string_view {
  switch (kind) {
  case ErrorKind::SourceUnreadable:
    return "SourceUnreadable";
  case ErrorKind::RemoteError:
    return "RemoteError";
  case ErrorKind::ParseError:
    return "ParseError";
  case ErrorKind::PublishConflictExhausted:
    return "PublishConflictExhausted";
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::ArtifactMissing:
    return "ArtifactMissing";
  case ErrorKind::IoError:
    return "IoError";
  case ErrorKind::InvalidArgument:
    return "InvalidArgument";
  case ErrorKind::PathInUse:
    return "PathInUse";
  }
  return "Unknown";
}

} // namespace bitcache
