#ifndef __SB_PIPE_USER_TERMINAL_HPP__
#define __SB_PIPE_USER_TERMINAL_HPP__

#include "UserTerminal.hpp"

namespace sb {
/**
 * @brief Shell over plain pipes, for hosts where no pty can be allocated.
 *
 * There is no line discipline, so a few of its jobs are done here: output
 * newlines become CRLF, ^C interrupts the shell and ^D closes its stdin.
 * Window size changes are accepted and ignored.
 */
class PipeUserTerminal : public UserTerminal {
 public:
  PipeUserTerminal();
  virtual ~PipeUserTerminal();

  virtual void setup(const winsize& initialSize);
  virtual int getFd() { return outputFd; }
  virtual int getInputFd();
  virtual size_t write(const string& data);
  virtual void setInfo(const winsize& tmpwin) {}
  virtual void kill(int signal);
  virtual int handleSessionEnd();
  virtual void cleanup();
  virtual string getKind() const { return "pipe"; }
  virtual string filterOutput(const string& raw);

 protected:
  // Guards the descriptors and the reap state
  std::mutex terminalMutex;
  pid_t pid;
  int inputFd;
  int outputFd;
  bool reaped;
  int exitCode;
};
}  // namespace sb

#endif  // __SB_PIPE_USER_TERMINAL_HPP__
