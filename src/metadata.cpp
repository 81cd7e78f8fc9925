#include "bitcache/metadata.hpp"

#include "bitcache/consts.hpp"
#include "bitcache/errors.hpp"
#include "bitcache/fs.hpp"
#include "bitcache/time.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

[[noreturn]] void corrupt(const std::string &what) {
  throw bitcache::Error(bitcache::ErrorKind::ParseError, "corrupt metadata: " + what);
}

std::string string_field(const json &obj, std::string_view key, const std::string &digest) {
  const auto it = obj.find(std::string(key));
  if (it == obj.end() || !it->is_string()) {
    corrupt("entry " + digest + " has no string field '" + std::string(key) + "'");
  }
  return it->get<std::string>();
}

} // namespace

namespace bitcache {

MetadataIndex MetadataIndex::load(std::span<const std::uint8_t> bytes) {
  return load(std::string_view(reinterpret_cast<const char *>(bytes.data()), bytes.size()));
}

MetadataIndex MetadataIndex::load(std::string_view text) {
  MetadataIndex out;
  if (std::ranges::all_of(text, [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }))
    return out;

  json doc;
  try {
    doc = json::parse(text.begin(), text.end());
  } catch (const json::parse_error &e) {
    corrupt(e.what());
  }
  if (!doc.is_object())
    corrupt("document is not an object");

  const auto entries = doc.find(std::string(consts::kKeyEntries));
  if (entries == doc.end() || !entries->is_object())
    corrupt("missing '" + std::string(consts::kKeyEntries) + "' object");

  for (auto it = entries->cbegin(); it != entries->cend(); ++it) {
    const std::string &key = it.key();
    const json &value = it.value();
    if (!value.is_object())
      corrupt("entry " + key + " is not an object");
    ArtifactRecord rec{
        .digest = string_field(value, consts::kKeyMd5, key),
        .artifact_path = string_field(value, consts::kKeyBinaryPath, key),
        .source_name = string_field(value, consts::kKeySourceFile, key),
        .published_at = string_field(value, consts::kKeyTimestamp, key),
    };
    if (rec.digest != key)
      corrupt("entry " + key + " records digest " + rec.digest);
    out.entries_.emplace(key, std::move(rec));
  }
  return out;
}

MetadataIndex MetadataIndex::load_file(const std::filesystem::path &path) {
  if (!fs::exists(path))
    return MetadataIndex{};
  const auto bytes = fs::read_file(path);
  try {
    return load(bytes);
  } catch (const Error &e) {
    throw Error(e.kind(), path.filename().string() + ": " + e.what());
  }
}

std::string MetadataIndex::serialize() const {
  json entries = json::object();
  for (const auto &[key, rec] : entries_) {
    entries[key] = json{
        {std::string(consts::kKeyMd5), rec.digest},
        {std::string(consts::kKeyBinaryPath), rec.artifact_path},
        {std::string(consts::kKeySourceFile), rec.source_name},
        {std::string(consts::kKeyTimestamp), rec.published_at},
    };
  }
  json doc = json::object();
  doc[std::string(consts::kKeyEntries)] = std::move(entries);
  // json objects keep keys sorted, which makes the output canonical
  try {
    return doc.dump(2, ' ', false, json::error_handler_t::strict) + "\n";
  } catch (const json::type_error &e) {
    throw Error(ErrorKind::InvalidArgument,
                std::string("metadata record is not valid UTF-8: ") + e.what());
  }
}

void MetadataIndex::save_file(const std::filesystem::path &path) const {
  fs::write_file_atomic(path, std::string_view(serialize()));
}

void MetadataIndex::upsert(const std::string &digest, ArtifactRecord record) {
  record.digest = digest;
  if (const auto it = entries_.find(digest); it != entries_.end()) {
    const auto before = timeutil::parse_iso8601(it->second.published_at);
    const auto after = timeutil::parse_iso8601(record.published_at);
    if (before && (!after || *after < *before)) {
      record.published_at = it->second.published_at;
    }
    it->second = std::move(record);
    return;
  }
  entries_.emplace(digest, std::move(record));
}

std::optional<ArtifactRecord> MetadataIndex::lookup(std::string_view digest) const {
  const auto it = entries_.find(digest);
  if (it == entries_.end())
    return std::nullopt;
  return it->second;
}

std::optional<std::string> MetadataIndex::find_by_path(std::string_view artifact_path) const {
  const auto it = std::ranges::find_if(
      entries_, [&](const auto &kv) { return kv.second.artifact_path == artifact_path; });
  if (it == entries_.end())
    return std::nullopt;
  return it->first;
}

} // namespace bitcache
