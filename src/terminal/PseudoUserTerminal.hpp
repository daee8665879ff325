#ifndef __SB_PSEUDO_USER_TERMINAL_HPP__
#define __SB_PSEUDO_USER_TERMINAL_HPP__

#include "UserTerminal.hpp"

namespace sb {
/**
 * @brief Runs the login shell on a pseudo-terminal allocated with forkpty.
 */
class PseudoUserTerminal : public UserTerminal {
 public:
  PseudoUserTerminal();
  virtual ~PseudoUserTerminal();

  virtual void setup(const winsize& initialSize);
  virtual int getFd() { return masterFd; }
  virtual int getInputFd();
  virtual size_t write(const string& data);
  virtual void setInfo(const winsize& tmpwin);
  virtual void kill(int signal);
  virtual int handleSessionEnd();
  virtual void cleanup();
  virtual string getKind() const { return "pty"; }

  pid_t getPid() const { return pid; }

 protected:
  /** @brief Child side: prepares the environment and execs the shell. */
  void runTerminal(const string& shell);

  // Guards masterFd and the reap state
  std::mutex terminalMutex;
  pid_t pid;
  int masterFd;
  bool reaped;
  int exitCode;
};
}  // namespace sb

#endif  // __SB_PSEUDO_USER_TERMINAL_HPP__
