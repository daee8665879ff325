#ifndef __SB_SUBPROCESS_UTILS__
#define __SB_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Outcome of a child that ran to completion (or was killed).
 */
struct SubprocessResult {
  /** @brief Exit status, or 128 + signal when the child was signalled. */
  optional<int> exitCode;
  string output;
  string error;
  bool timedOut = false;
};

/**
 * @brief A forked child with its stdout and stderr connected to pipes.
 *
 * The child leads its own process group so that signals reach anything it
 * spawned (e.g. the commands run by `sh -c`).
 */
class ChildProcess {
 public:
  ChildProcess(pid_t _pid, int _stdoutFd, int _stderrFd);
  ~ChildProcess();

  pid_t getPid() const { return pid; }

  /**
   * @brief Reads both pipes until they close or the deadline passes.
   * @param onChunk Called for every read, with true for stderr data.
   * @return false if the deadline passed while a pipe was still open.
   */
  bool pump(const function<void(const string &, bool)> &onChunk,
            optional<chrono::steady_clock::time_point> deadline);

  /** @brief Signals the child's process group. No-op once reaped. */
  bool kill(int signal);

  /**
   * @brief Reaps the child if it exits before the deadline. The pipes may
   * already be closed while the child keeps running.
   * @return false if the deadline passed first.
   */
  bool waitUntil(optional<chrono::steady_clock::time_point> deadline);

  /**
   * @brief Reaps the child, blocking until it exits. Safe to call twice.
   */
  optional<int> wait();

 protected:
  pid_t pid;
  int stdoutFd;
  int stderrFd;
  // Guards reaped and exitCode so a signal never reaches a recycled pid
  mutable std::mutex reapMutex;
  bool reaped;
  optional<int> exitCode;

  bool tryReapLocked();
};

/**
 * @brief Starts programs without a shell and collects what they print.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command, returning stdout and stderr interleaved. Returns an
   * empty string when the program cannot be started.
   */
  virtual string SubprocessToStringInteractive(const string &command,
                                               const vector<string> &args);

  /**
   * @brief Runs a command to completion.
   * @param timeoutMs 0 waits forever; otherwise the child is killed once the
   * budget is spent and `timedOut` is set.
   */
  virtual SubprocessResult run(const string &command,
                               const vector<string> &args,
                               int64_t timeoutMs = 0);

  /**
   * @brief Forks and execs `command` (looked up on PATH) in `cwd`.
   * @param extraEnv Variables set in the child on top of our environment.
   * @throws BridgeException with SpawnFailure if the exec does not happen.
   */
  virtual shared_ptr<ChildProcess> spawn(
      const string &command, const vector<string> &args,
      const string &cwd = "", const map<string, string> &extraEnv = {});
};
}  // namespace sb

#endif  // __SB_SUBPROCESS_UTILS__
