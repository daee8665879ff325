#include "PseudoUserTerminal.hpp"

#include "BridgeException.hpp"
#include "RawSocketUtils.hpp"

namespace sb {
PseudoUserTerminal::PseudoUserTerminal()
    : pid(-1), masterFd(-1), reaped(false), exitCode(-1) {}

PseudoUserTerminal::~PseudoUserTerminal() {
  if (pid > 0) {
    kill(SIGKILL);
    handleSessionEnd();
  }
  cleanup();
}

void PseudoUserTerminal::setup(const winsize& initialSize) {
  string shell = defaultShell();
  winsize win = initialSize;
  pid = forkpty(&masterFd, NULL, NULL, &win);
  if (pid < 0) {
    throw BridgeException(BridgeErrorCode::SpawnFailure,
                          string("forkpty failed: ") + strerror(GetErrno()));
  }
  if (pid == 0) {
    runTerminal(shell);
    // Only reached if exec failed
    _exit(127);
  }
  RawSocketUtils::setNonBlocking(masterFd);
  VLOG(1) << "pty opened " << masterFd << " for shell " << shell << " ("
          << pid << ")";
}

void PseudoUserTerminal::runTerminal(const string& shell) {
  string home = GetHomeDirectory();
  if (::chdir(home.c_str()) < 0) {
    (void)!::chdir("/");
  }
  setenv("TERM", "xterm-256color", 1);
  setenv("SHELLBRIDGE_VERSION", SB_VERSION, 1);
  // Job control in the shell expects the default SIGCHLD disposition, and
  // we may have inherited something else.
  signal(SIGCHLD, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);
  execl(shell.c_str(), shell.c_str(), "-l", NULL);
}

int PseudoUserTerminal::getInputFd() {
  lock_guard<std::mutex> guard(terminalMutex);
  return masterFd;
}

size_t PseudoUserTerminal::write(const string& data) {
  lock_guard<std::mutex> guard(terminalMutex);
  if (masterFd < 0) {
    throw std::runtime_error("Terminal is closed");
  }
  return RawSocketUtils::writeSome(masterFd, data.c_str(), data.length());
}

void PseudoUserTerminal::setInfo(const winsize& tmpwin) {
  lock_guard<std::mutex> guard(terminalMutex);
  if (masterFd < 0) {
    return;
  }
  if (ioctl(masterFd, TIOCSWINSZ, &tmpwin) < 0) {
    LOG(WARNING) << "TIOCSWINSZ failed: " << strerror(GetErrno());
  }
}

void PseudoUserTerminal::kill(int signal) {
  lock_guard<std::mutex> guard(terminalMutex);
  if (pid > 0 && !reaped) {
    ::kill(pid, signal);
  }
}

int PseudoUserTerminal::handleSessionEnd() {
  {
    lock_guard<std::mutex> guard(terminalMutex);
    if (reaped || pid <= 0) {
      return exitCode;
    }
  }
  waitForExit(pid);
  lock_guard<std::mutex> guard(terminalMutex);
  if (!reaped) {
    exitCode = reapExited(pid);
    reaped = true;
  }
  return exitCode;
}

void PseudoUserTerminal::cleanup() {
  lock_guard<std::mutex> guard(terminalMutex);
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
}
}  // namespace sb
