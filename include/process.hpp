/**
 * @file process.hpp
 * @brief Running external commands such as the `gh` client.
 *
 * Declares the CommandRunner seam used by everything that talks to `gh`, the
 * posix_spawn based implementation, and the generic `gh` passthrough.
 */
#ifndef ISSUESCAN_PROCESS_HPP
#define ISSUESCAN_PROCESS_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace iscan {

/// Shared flag that asks running work to stop as soon as possible.
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

/// Outcome of one external command.
struct CommandResult {
  int exit_code{-1};      ///< Exit status, 128+N when killed by signal N
  std::string out;        ///< Captured standard output
  std::string err;        ///< Captured standard error
  bool timed_out{false};  ///< Killed because the timeout elapsed
  bool cancelled{false};  ///< Killed because cancellation was requested

  bool succeeded() const { return exit_code == 0 && !timed_out && !cancelled; }
};

/**
 * Interface for executing an argument vector and capturing its output.
 *
 * Implementations must be safe to call from several threads at once.
 */
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /**
   * Run @p argv to completion.
   *
   * @param argv Executable followed by its arguments. The executable is
   *        looked up in `PATH` when it contains no slash.
   * @return Exit status and captured output.
   * @throws std::system_error When the process cannot be started.
   */
  virtual CommandResult run(const std::vector<std::string> &argv) = 0;
};

/**
 * CommandRunner that spawns a child process with posix_spawnp and reads its
 * stdout and stderr through pipes. Standard input is `/dev/null`.
 */
class ProcessCommandRunner : public CommandRunner {
public:
  /**
   * @param timeout Maximum run time; zero waits forever.
   * @param cancel Optional flag polled while the child runs. When it becomes
   *        true the child is terminated.
   */
  explicit ProcessCommandRunner(
      std::chrono::milliseconds timeout = std::chrono::milliseconds{0},
      CancelFlag cancel = nullptr);

  CommandResult run(const std::vector<std::string> &argv) override;

private:
  std::chrono::milliseconds timeout_;
  CancelFlag cancel_;
};

/// Raised when a `gh` invocation exits unsuccessfully.
class GhCommandError : public std::runtime_error {
public:
  GhCommandError(const std::string &message, int exit_code)
      : std::runtime_error(message), exit_code_(exit_code) {}

  /// Exit status of `gh`, or -1 when it never ran.
  int exit_code() const noexcept { return exit_code_; }

private:
  int exit_code_;
};

/**
 * Thin wrapper around the `gh` executable.
 */
class GhCli {
public:
  /**
   * @param runner Runner used to start `gh`. A ProcessCommandRunner without
   *        timeout is created when `nullptr`.
   * @param executable Name or path of the `gh` binary.
   */
  explicit GhCli(std::shared_ptr<CommandRunner> runner = nullptr,
                 std::string executable = "gh");

  /**
   * Run `gh` with @p args and return its standard output.
   *
   * @throws GhCommandError With the stderr text when `gh` fails or cannot be
   *         started.
   */
  std::string run(const std::vector<std::string> &args);

  /**
   * Run `gh` with @p args and return the raw result.
   *
   * @throws std::system_error When `gh` cannot be started.
   */
  CommandResult invoke(const std::vector<std::string> &args);

  const std::string &executable() const { return executable_; }

private:
  std::shared_ptr<CommandRunner> runner_;
  std::string executable_;
};

} // namespace iscan

#endif // ISSUESCAN_PROCESS_HPP
