#pragma once
#include "bitcache/config.hpp"
#include "bitcache/consts.hpp"
#include "bitcache/fs.hpp"
#include "bitcache/process.hpp"
#include "bitcache/session.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace bitcache {

struct GitOptions {
  std::string ssh_key;               // handed to ssh as-is via GIT_SSH_COMMAND
  Identity identity;                 // empty fields -> git's own user.name/user.email
  std::chrono::seconds timeout = consts::kDefaultGitTimeout;
  std::filesystem::path scratch_dir; // parent of working copies; empty -> temp dir
  std::string git = std::string(consts::kGitExecutable);
};

GitOptions git_options_from(const Settings& settings);

// Remote git repository reached through the `git` executable.
class GitStore final : public Store {
public:
  GitStore(std::string url, GitOptions opts);

  std::unique_ptr<RepositorySession> acquire() override;
  [[nodiscard]] std::string describe() const override { return url_; }

private:
  std::string url_;
  GitOptions opts_;
};

// Fresh clone inside a private temporary directory.
class GitSession final : public RepositorySession {
public:
  // Clones `url`; throws Error{RemoteError} (the directory is already gone then).
  GitSession(const std::string& url, const GitOptions& opts);
  ~GitSession() override;

  [[nodiscard]] MetadataIndex read_metadata() const override;
  void write_metadata(const MetadataIndex& index) override;
  void write_artifact(std::string_view relative_path,
                      std::span<const std::uint8_t> bytes) override;
  [[nodiscard]] std::optional<std::vector<std::uint8_t>>
  read_artifact(std::string_view relative_path) const override;
  PublishStatus publish(std::string_view commit_message) override;
  void release() noexcept override;

  [[nodiscard]] const std::filesystem::path& root() const { return root_; }
  [[nodiscard]] const std::string& branch() const { return branch_; }

private:
  process::Result git(const std::vector<std::string>& args) const;
  [[nodiscard]] std::filesystem::path metadata_path() const;

  std::string url_;
  GitOptions opts_;
  fs::TempDir scratch_;
  std::filesystem::path root_;
  std::string branch_;
};

} // namespace bitcache
