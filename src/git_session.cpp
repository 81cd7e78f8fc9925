#include "bitcache/git_session.hpp"

#include "bitcache/consts.hpp"
#include "bitcache/errors.hpp"
#include "bitcache/fs.hpp"
#include "bitcache/util.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace stdfs = std::filesystem;

namespace {

// Push output that means "the remote moved under us", as opposed to a hard failure.
constexpr std::array<std::string_view, 6> kRaceMarkers = {
    "[rejected]",          "non-fast-forward", "fetch first",
    "cannot lock ref",     "failed to update ref", "incorrect old value",
};

// Single-quote for the shell that git hands GIT_SSH_COMMAND to
std::string shell_quote(std::string_view s) {
  std::string out = "'";
  for (const char c : s) {
    if (c == '\'')
      out += "'\\''";
    else
      out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

// Last non-empty line(s) of git's diagnostics, for error messages
std::string summarize(const bitcache::process::Result &res) {
  std::string text = res.err.empty() ? res.out : res.err;
  bitcache::strutil::rstrip_newlines(text);
  return text.empty() ? "exit status " + std::to_string(res.exit_code) : text;
}

bool looks_like_race(const bitcache::process::Result &res) {
  const std::string all = res.out + res.err;
  for (const auto marker : kRaceMarkers) {
    if (all.find(marker) != std::string::npos)
      return true;
  }
  return false;
}

bitcache::process::Result run_git(const bitcache::GitOptions &opts, const stdfs::path &cwd,
                                  const std::vector<std::string> &args) {
  std::vector<std::string> argv{opts.git, "-c", "core.autocrlf=false"};
  if (!opts.identity.name.empty()) {
    argv.emplace_back("-c");
    argv.push_back("user.name=" + opts.identity.name);
  }
  if (!opts.identity.email.empty()) {
    argv.emplace_back("-c");
    argv.push_back("user.email=" + opts.identity.email);
  }
  argv.insert(argv.end(), args.begin(), args.end());

  bitcache::process::Options popts{.cwd = cwd, .env = {}, .timeout = opts.timeout};
  popts.env.emplace_back("GIT_TERMINAL_PROMPT", "0");
  popts.env.emplace_back("LC_ALL", "C");
  if (!opts.ssh_key.empty()) {
    popts.env.emplace_back("GIT_SSH_COMMAND",
                           "ssh -i " + shell_quote(opts.ssh_key) + " -o IdentitiesOnly=yes");
  }

  auto res = bitcache::process::run(argv, popts);
  if (res.timed_out) {
    throw bitcache::Error(bitcache::ErrorKind::RemoteError,
                          "git " + args.front() + " timed out after " +
                              std::to_string(opts.timeout.count()) + "s");
  }
  return res;
}

stdfs::path scratch_base(const bitcache::GitOptions &opts) {
  if (!opts.scratch_dir.empty())
    return opts.scratch_dir;
  std::error_code ec;
  auto tmp = stdfs::temp_directory_path(ec);
  if (ec)
    throw bitcache::Error(bitcache::ErrorKind::IoError,
                          "no temporary directory: " + ec.message());
  return tmp;
}

} // namespace

namespace bitcache {

GitOptions git_options_from(const Settings &settings) {
  return GitOptions{
      .ssh_key = settings.ssh_key,
      .identity = settings.identity,
      .timeout = settings.timeout,
      .scratch_dir = settings.scratch_dir,
  };
}

// ——— GitStore ———

GitStore::GitStore(std::string url, GitOptions opts) : url_(std::move(url)), opts_(std::move(opts)) {}

std::unique_ptr<RepositorySession> GitStore::acquire() {
  return std::make_unique<GitSession>(url_, opts_);
}

// ——— GitSession ———

GitSession::GitSession(const std::string &url, const GitOptions &opts)
    : url_(url), opts_(opts), scratch_(scratch_base(opts), consts::kTempPrefix),
      root_(scratch_.path() / "repo") {
  const auto clone =
      run_git(opts_, scratch_.path(), {"clone", "--quiet", "--no-tags", "--", url_, root_.string()});
  if (!clone.ok()) {
    throw Error(ErrorKind::RemoteError, "failed to clone " + url_ + ": " + summarize(clone));
  }

  // Works on an unborn branch too (empty remote)
  auto head = git({"symbolic-ref", "--quiet", "--short", "HEAD"});
  if (!head.ok()) {
    throw Error(ErrorKind::RemoteError, "remote " + url_ + " has no default branch");
  }
  strutil::rstrip_newlines(head.out);
  branch_ = std::move(head.out);
}

GitSession::~GitSession() { release(); }

process::Result GitSession::git(const std::vector<std::string> &args) const {
  return run_git(opts_, root_, args);
}

stdfs::path GitSession::metadata_path() const { return root_ / consts::kMetadataFile; }

MetadataIndex GitSession::read_metadata() const { return MetadataIndex::load_file(metadata_path()); }

void GitSession::write_metadata(const MetadataIndex &index) { index.save_file(metadata_path()); }

void GitSession::write_artifact(std::string_view relative_path,
                                std::span<const std::uint8_t> bytes) {
  const std::string rel = normalize_store_path(relative_path);
  if (rel.empty() || rel == consts::kMetadataFile) {
    throw Error(ErrorKind::InvalidArgument,
                "not a valid artifact path: '" + std::string(relative_path) + "'");
  }
  fs::write_file_atomic(root_ / rel, bytes);
}

std::optional<std::vector<std::uint8_t>>
GitSession::read_artifact(std::string_view relative_path) const {
  const std::string rel = normalize_store_path(relative_path);
  if (rel.empty())
    return std::nullopt;
  const auto path = root_ / rel;
  std::error_code ec;
  if (!stdfs::is_regular_file(path, ec))
    return std::nullopt;
  return fs::read_file(path);
}

PublishStatus GitSession::publish(std::string_view commit_message) {
  const auto add = git({"add", "--all"});
  if (!add.ok())
    throw Error(ErrorKind::IoError, "git add failed: " + summarize(add));

  const auto status = git({"status", "--porcelain"});
  if (!status.ok())
    throw Error(ErrorKind::IoError, "git status failed: " + summarize(status));
  if (strutil::trim(status.out).empty())
    return PublishStatus::Ok; // nothing to commit

  const auto commit = git({"commit", "--quiet", "-m", std::string(commit_message)});
  if (!commit.ok())
    throw Error(ErrorKind::IoError, "git commit failed: " + summarize(commit));

  // Plain fast-forward push; never forced
  const auto push = git({"push", "--porcelain", "origin", "HEAD:refs/heads/" + branch_});
  if (push.ok())
    return PublishStatus::Ok;
  if (looks_like_race(push))
    return PublishStatus::Conflict;
  throw Error(ErrorKind::RemoteError, "failed to push to " + url_ + ": " + summarize(push));
}

void GitSession::release() noexcept { scratch_.remove(); }

} // namespace bitcache
