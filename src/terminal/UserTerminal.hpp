#ifndef __SB_USER_TERMINAL_HPP__
#define __SB_USER_TERMINAL_HPP__

#include "Headers.hpp"

namespace sb {
/**
 * @brief A shell process whose output can be polled through a fd.
 *
 * Implementations own the child and its descriptors. `setup` is called once;
 * after the output fd reports EOF the owner calls `handleSessionEnd` and then
 * `cleanup`. Every other method may be called from any thread, before or
 * after `cleanup`.
 */
class UserTerminal {
 public:
  virtual ~UserTerminal() {}

  /**
   * @brief Starts the shell with the given window size.
   * @throws BridgeException with SpawnFailure if the shell cannot start.
   */
  virtual void setup(const winsize& initialSize) = 0;
  /** @brief Descriptor that becomes readable when the shell prints. */
  virtual int getFd() = 0;
  /** @brief Descriptor to poll for room before `write`, -1 once closed. */
  virtual int getInputFd() = 0;
  /**
   * @brief Sends as much of `data` as the shell takes without blocking.
   * @return Bytes consumed from the front of `data`.
   * @throws std::runtime_error if the shell input is gone.
   */
  virtual size_t write(const string& data) = 0;
  /** @brief Applies a new window geometry. */
  virtual void setInfo(const winsize& tmpwin) = 0;
  /** @brief Signals the shell. */
  virtual void kill(int signal) = 0;
  /** @brief Reaps the shell and returns its exit code. */
  virtual int handleSessionEnd() = 0;
  /** @brief Releases descriptors. */
  virtual void cleanup() = 0;
  /** @brief Short name of the strategy, e.g. "pty". */
  virtual string getKind() const = 0;

  /** @brief Hook to rewrite raw output before it is delivered. */
  virtual string filterOutput(const string& raw) { return raw; }

  /** @brief $SHELL if it is executable, otherwise /bin/bash or /bin/sh. */
  static string defaultShell();

 protected:
  /**
   * @brief Blocks until the shell exits but leaves it unreaped, so its pid
   * cannot be recycled before the caller reaps it under its own lock.
   */
  static void waitForExit(pid_t pid);
  /**
   * @brief Reaps an exited shell.
   * @return The exit status, 128 + signal for signal deaths, or -1.
   */
  static int reapExited(pid_t pid);
};

typedef function<shared_ptr<UserTerminal>(const winsize&)> UserTerminalFactory;
}  // namespace sb

#endif  // __SB_USER_TERMINAL_HPP__
