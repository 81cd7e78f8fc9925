#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bitcache {

struct ArtifactRecord {
  std::string digest;        // 32-hex MD5 of the source, the key
  std::string artifact_path; // "dir/file" relative to the store root
  std::string source_name;   // original source filename, display only
  std::string published_at;  // ISO-8601 UTC

  bool operator==(const ArtifactRecord&) const = default;
};

class MetadataIndex {
public:
  MetadataIndex() = default;

  // Parse a metadata document. Empty/whitespace input -> empty index.
  // Throws Error{ParseError} on anything malformed.
  static MetadataIndex load(std::span<const std::uint8_t> bytes);
  static MetadataIndex load(std::string_view text);

  // Read `path`; a missing file is an empty index.
  static MetadataIndex load_file(const std::filesystem::path& path);

  // Canonical document: sorted keys, two-space indent, trailing newline
  [[nodiscard]] std::string serialize() const;

  void save_file(const std::filesystem::path& path) const;

  // Insert or replace the record for `digest`. The stored `published_at`
  // never moves backwards for an existing digest.
  void upsert(const std::string& digest, ArtifactRecord record);

  [[nodiscard]] std::optional<ArtifactRecord> lookup(std::string_view digest) const;

  // Digest currently owning `artifact_path`, if any
  [[nodiscard]] std::optional<std::string> find_by_path(std::string_view artifact_path) const;

  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] const std::map<std::string, ArtifactRecord, std::less<>>& entries() const {
    return entries_;
  }

  bool operator==(const MetadataIndex&) const = default;

private:
  std::map<std::string, ArtifactRecord, std::less<>> entries_;
};

} // namespace bitcache
