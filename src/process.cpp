/**
 * @file process.cpp
 * @brief posix_spawn based command execution with output capture.
 */
#include "process.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

extern char **environ;

namespace iscan {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kPollSliceMs = 100;
constexpr auto kTermGrace = std::chrono::seconds(2);

std::shared_ptr<spdlog::logger> process_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("process");
  }();
  return logger;
}

/// Owns a file descriptor and closes it on destruction.
class Fd {
public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  Fd(const Fd &) = delete;
  Fd &operator=(const Fd &) = delete;
  Fd(Fd &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  Fd &operator=(Fd &&other) noexcept {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }
  ~Fd() { reset(); }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_{-1};
};

struct Pipe {
  Fd read;
  Fd write;
};

Pipe make_pipe() {
  // Close-on-exec must be set atomically: another worker may spawn a child
  // between pipe() and fcntl(), and that child would keep our write end open.
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe2");
  }
  return Pipe{Fd(fds[0]), Fd(fds[1])};
}

/// RAII wrapper for posix_spawn_file_actions_t.
class SpawnActions {
public:
  SpawnActions() {
    int rc = posix_spawn_file_actions_init(&actions_);
    if (rc != 0) {
      throw std::system_error(rc, std::generic_category(),
                              "posix_spawn_file_actions_init");
    }
  }
  SpawnActions(const SpawnActions &) = delete;
  SpawnActions &operator=(const SpawnActions &) = delete;
  ~SpawnActions() { posix_spawn_file_actions_destroy(&actions_); }

  void dup_to(int fd, int target) {
    check(posix_spawn_file_actions_adddup2(&actions_, fd, target));
  }
  void open_null(int target) {
    check(posix_spawn_file_actions_addopen(&actions_, target, "/dev/null",
                                           O_RDONLY, 0));
  }
  const posix_spawn_file_actions_t *get() const { return &actions_; }

private:
  static void check(int rc) {
    if (rc != 0) {
      throw std::system_error(rc, std::generic_category(),
                              "posix_spawn_file_actions");
    }
  }
  posix_spawn_file_actions_t actions_;
};

int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

/// Non-blocking reap. Returns true once the child has exited.
bool try_reap(pid_t pid, int &status) {
  for (;;) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid)
      return true;
    if (r == 0)
      return false;
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
  }
}

/// SIGTERM, short grace period, then SIGKILL. Always reaps the child.
int terminate(pid_t pid) {
  int status = 0;
  ::kill(pid, SIGTERM);
  auto deadline = Clock::now() + kTermGrace;
  while (Clock::now() < deadline) {
    if (try_reap(pid, status))
      return decode_status(status);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  ::kill(pid, SIGKILL);
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
  }
  return decode_status(status);
}

/// Read what is available on @p fd; resets it on EOF or error.
void drain(Fd &fd, std::string &out) {
  char buf[4096];
  ssize_t n = ::read(fd.get(), buf, sizeof(buf));
  if (n > 0) {
    out.append(buf, static_cast<std::size_t>(n));
  } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
    fd.reset();
  }
}

} // namespace

ProcessCommandRunner::ProcessCommandRunner(std::chrono::milliseconds timeout,
                                           CancelFlag cancel)
    : timeout_(timeout), cancel_(std::move(cancel)) {}

CommandResult ProcessCommandRunner::run(const std::vector<std::string> &argv) {
  if (argv.empty()) {
    throw std::system_error(EINVAL, std::generic_category(),
                            "empty command line");
  }
  Pipe out_pipe = make_pipe();
  Pipe err_pipe = make_pipe();
  SpawnActions actions;
  actions.open_null(STDIN_FILENO);
  actions.dup_to(out_pipe.write.get(), STDOUT_FILENO);
  actions.dup_to(err_pipe.write.get(), STDERR_FILENO);

  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &arg : argv)
    cargv.push_back(const_cast<char *>(arg.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = 0;
  int rc = posix_spawnp(&pid, cargv[0], actions.get(), nullptr, cargv.data(),
                        environ);
  if (rc != 0) {
    throw std::system_error(rc, std::generic_category(),
                            "failed to start '" + argv[0] + "'");
  }
  process_log()->debug("Started {} (pid {})", argv[0], pid);
  out_pipe.write.reset();
  err_pipe.write.reset();

  CommandResult result;
  const bool has_deadline = timeout_.count() > 0;
  const auto deadline = Clock::now() + timeout_;
  auto should_stop = [&]() {
    if (cancel_ && cancel_->load()) {
      result.cancelled = true;
      return true;
    }
    if (has_deadline && Clock::now() >= deadline) {
      result.timed_out = true;
      return true;
    }
    return false;
  };

  int status = 0;
  bool exited = false;
  while (out_pipe.read.valid() || err_pipe.read.valid()) {
    if (should_stop())
      break;
    pollfd fds[2];
    nfds_t count = 0;
    if (out_pipe.read.valid())
      fds[count++] = {out_pipe.read.get(), POLLIN, 0};
    if (err_pipe.read.valid())
      fds[count++] = {err_pipe.read.get(), POLLIN, 0};
    int ready = ::poll(fds, count, kPollSliceMs);
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      int err = errno;
      (void)terminate(pid);
      throw std::system_error(err, std::generic_category(), "poll");
    }
    for (nfds_t i = 0; i < count; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
        continue;
      if (fds[i].fd == out_pipe.read.get())
        drain(out_pipe.read, result.out);
      else
        drain(err_pipe.read, result.err);
    }
  }
  // The pipes are closed; the child may still be running.
  while (!result.timed_out && !result.cancelled) {
    if (try_reap(pid, status)) {
      exited = true;
      break;
    }
    if (should_stop())
      break;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (exited) {
    result.exit_code = decode_status(status);
  } else {
    process_log()->warn("Terminating {} (pid {}): {}", argv[0], pid,
                        result.timed_out ? "timed out" : "cancelled");
    result.exit_code = terminate(pid);
  }
  process_log()->debug("{} exited with {} ({} bytes stdout, {} bytes stderr)",
                       argv[0], result.exit_code, result.out.size(),
                       result.err.size());
  return result;
}

GhCli::GhCli(std::shared_ptr<CommandRunner> runner, std::string executable)
    : runner_(runner ? std::move(runner)
                     : std::make_shared<ProcessCommandRunner>()),
      executable_(std::move(executable)) {}

CommandResult GhCli::invoke(const std::vector<std::string> &args) {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(executable_);
  argv.insert(argv.end(), args.begin(), args.end());
  return runner_->run(argv);
}

std::string GhCli::run(const std::vector<std::string> &args) {
  CommandResult result;
  try {
    result = invoke(args);
  } catch (const std::system_error &e) {
    throw GhCommandError(e.what(), -1);
  }
  if (result.succeeded())
    return result.out;
  if (result.timed_out)
    throw GhCommandError(executable_ + " timed out", result.exit_code);
  if (result.cancelled)
    throw GhCommandError(executable_ + " was cancelled", result.exit_code);
  std::string message = result.err;
  if (message.empty()) {
    message = executable_ + " exited with status " +
              std::to_string(result.exit_code);
  }
  throw GhCommandError(message, result.exit_code);
}

} // namespace iscan
