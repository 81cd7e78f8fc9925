#pragma once
#include <chrono>
#include <cstddef>
#include <string_view>

namespace bitcache::consts {

inline constexpr std::string_view kVersion = "0.1.0";

// Store layout
inline constexpr std::string_view kMetadataFile = "bitcache_metadata.json";
inline constexpr std::string_view kGitDir       = ".git";

// ——— Digest sizes (MD5) ———
inline constexpr std::size_t kDigestRawLen = 16; // 16 bytes
inline constexpr std::size_t kDigestHexLen = 32; // 32 hex chars

// ——— Metadata document keys ———
inline constexpr std::string_view kKeyEntries    = "entries";
inline constexpr std::string_view kKeyMd5        = "md5";
inline constexpr std::string_view kKeyBinaryPath = "binary_path";
inline constexpr std::string_view kKeySourceFile = "source_file";
inline constexpr std::string_view kKeyTimestamp  = "timestamp";

// ——— Publish retry defaults ———
inline constexpr int kDefaultMaxAttempts = 5;
inline constexpr std::chrono::milliseconds kDefaultBackoff{250};
inline constexpr std::chrono::milliseconds kDefaultMaxBackoff{4000};

// ——— Transport ———
inline constexpr std::chrono::seconds kDefaultGitTimeout{300};
inline constexpr std::string_view kGitExecutable = "git";
inline constexpr std::string_view kTempPrefix    = "bitcache-";

inline constexpr std::string_view kCommitPrefix = "Add bitstream for source MD5: ";

// Read chunk for hashing and copying
inline constexpr std::size_t kIoChunk = 64 * 1024;

} // namespace bitcache::consts
