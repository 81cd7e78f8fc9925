#include "bitcache/process.hpp"

#include "bitcache/errors.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace {

using clock_type = std::chrono::steady_clock;

[[noreturn]] void io_fail(const std::string &what) {
  throw bitcache::Error(bitcache::ErrorKind::IoError, what + ": " + std::strerror(errno));
}

// Owning pair of pipe ends
struct Pipe {
  int fd[2] = {-1, -1};
  Pipe() {
    if (::pipe(fd) != 0)
      io_fail("pipe failed");
  }
  ~Pipe() {
    close_read();
    close_write();
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;
  void close_read() {
    if (fd[0] >= 0)
      ::close(fd[0]);
    fd[0] = -1;
  }
  void close_write() {
    if (fd[1] >= 0)
      ::close(fd[1]);
    fd[1] = -1;
  }
};

// Runs in the forked child; never returns.
[[noreturn]] void exec_child(const std::vector<std::string> &argv,
                             const bitcache::process::Options &opts, Pipe &out, Pipe &err) {
  ::dup2(out.fd[1], STDOUT_FILENO);
  ::dup2(err.fd[1], STDERR_FILENO);
  out.close_read();
  err.close_read();
  out.close_write();
  err.close_write();

  const int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    ::close(devnull);
  }

  if (!opts.cwd.empty() && ::chdir(opts.cwd.c_str()) != 0) {
    const std::string msg = "chdir " + opts.cwd.string() + ": " + std::strerror(errno) + "\n";
    (void)!::write(STDERR_FILENO, msg.data(), msg.size());
    ::_exit(127);
  }
  for (const auto &[name, value] : opts.env) {
    ::setenv(name.c_str(), value.c_str(), 1);
  }

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv)
    args.push_back(const_cast<char *>(a.c_str()));
  args.push_back(nullptr);
  ::execvp(args[0], args.data());

  const std::string msg = "exec " + argv[0] + ": " + std::strerror(errno) + "\n";
  (void)!::write(STDERR_FILENO, msg.data(), msg.size());
  ::_exit(127);
}

// Drain whatever is readable on `fd` into `sink`; returns false at EOF.
bool drain(int fd, std::string &sink) {
  std::array<char, 4096> buf{};
  const ssize_t n = ::read(fd, buf.data(), buf.size());
  if (n > 0) {
    sink.append(buf.data(), static_cast<std::size_t>(n));
    return true;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN))
    return true;
  return false;
}

} // namespace

namespace bitcache::process {

Result run(const std::vector<std::string> &argv, const Options &opts) {
  if (argv.empty())
    throw Error(ErrorKind::IoError, "run: empty command line");

  Pipe out;
  Pipe err;
  const pid_t child = ::fork();
  if (child == -1)
    io_fail("fork failed");
  if (child == 0)
    exec_child(argv, opts, out, err);

  out.close_write();
  err.close_write();

  Result res;
  const bool limited = opts.timeout.count() > 0;
  const auto deadline = clock_type::now() + opts.timeout;
  bool out_open = true;
  bool err_open = true;
  while (out_open || err_open) {
    int wait_ms = -1;
    if (limited) {
      const auto left =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_type::now());
      if (left.count() <= 0) {
        res.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(left.count());
    }

    std::array<pollfd, 2> fds{};
    nfds_t nfds = 0;
    if (out_open)
      fds[nfds++] = pollfd{.fd = out.fd[0], .events = POLLIN, .revents = 0};
    if (err_open)
      fds[nfds++] = pollfd{.fd = err.fd[0], .events = POLLIN, .revents = 0};

    const int rc = ::poll(fds.data(), nfds, wait_ms);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      const int saved = errno;
      ::kill(child, SIGKILL);
      ::waitpid(child, nullptr, 0);
      errno = saved;
      io_fail("poll failed");
    }
    for (nfds_t i = 0; i < nfds; ++i) {
      if (fds[i].revents == 0)
        continue;
      if (fds[i].fd == out.fd[0] && !drain(out.fd[0], res.out))
        out_open = false;
      else if (fds[i].fd == err.fd[0] && !drain(err.fd[0], res.err))
        err_open = false;
    }
  }

  if (res.timed_out)
    ::kill(child, SIGKILL);

  int status = 0;
  while (::waitpid(child, &status, 0) == -1) {
    if (errno != EINTR)
      io_fail("waitpid failed");
  }
  res.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return res;
}

bool on_path(std::string_view name) {
  const char *path = std::getenv("PATH");
  if (path == nullptr)
    return false;
  std::string_view rest{path};
  while (true) {
    const auto colon = rest.find(':');
    const auto dir = rest.substr(0, colon);
    const std::string candidate = (dir.empty() ? std::string(".") : std::string(dir)) + "/" +
                                  std::string(name);
    if (::access(candidate.c_str(), X_OK) == 0)
      return true;
    if (colon == std::string_view::npos)
      return false;
    rest.remove_prefix(colon + 1);
  }
}

} // namespace bitcache::process
