#include "PipeUserTerminal.hpp"

#include "BridgeException.hpp"
#include "RawSocketUtils.hpp"

namespace sb {
PipeUserTerminal::PipeUserTerminal()
    : pid(-1), inputFd(-1), outputFd(-1), reaped(false), exitCode(-1) {}

PipeUserTerminal::~PipeUserTerminal() {
  if (pid > 0) {
    kill(SIGKILL);
    handleSessionEnd();
  }
  cleanup();
}

void PipeUserTerminal::setup(const winsize& initialSize) {
  string shell = defaultShell();
  string home = GetHomeDirectory();
  int inPipe[2], outPipe[2];
  if (::pipe(inPipe) < 0) {
    throw BridgeException(BridgeErrorCode::SpawnFailure,
                          string("pipe failed: ") + strerror(GetErrno()));
  }
  if (::pipe(outPipe) < 0) {
    int savedErrno = GetErrno();
    ::close(inPipe[0]);
    ::close(inPipe[1]);
    throw BridgeException(BridgeErrorCode::SpawnFailure,
                          string("pipe failed: ") + strerror(savedErrno));
  }
  string columns = to_string(initialSize.ws_col);
  string lines = to_string(initialSize.ws_row);

  pid = fork();
  if (pid == 0) {
    dup2(inPipe[0], STDIN_FILENO);
    dup2(outPipe[1], STDOUT_FILENO);
    dup2(outPipe[1], STDERR_FILENO);
    for (int fd : {inPipe[0], inPipe[1], outPipe[0], outPipe[1]}) {
      ::close(fd);
    }
    if (::chdir(home.c_str()) < 0) {
      (void)!::chdir("/");
    }
    setenv("TERM", "xterm-256color", 1);
    setenv("COLUMNS", columns.c_str(), 1);
    setenv("LINES", lines.c_str(), 1);
    signal(SIGCHLD, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    execl(shell.c_str(), shell.c_str(), "-i", "-l", NULL);
    _exit(127);
  }

  ::close(inPipe[0]);
  ::close(outPipe[1]);
  if (pid < 0) {
    int savedErrno = GetErrno();
    ::close(inPipe[1]);
    ::close(outPipe[0]);
    throw BridgeException(BridgeErrorCode::SpawnFailure,
                          string("fork failed: ") + strerror(savedErrno));
  }
  inputFd = inPipe[1];
  outputFd = outPipe[0];
  RawSocketUtils::setNonBlocking(inputFd);
  RawSocketUtils::setNonBlocking(outputFd);
  LOG(INFO) << "Started " << shell << " over pipes (" << pid << ")";
}

int PipeUserTerminal::getInputFd() {
  lock_guard<std::mutex> guard(terminalMutex);
  return inputFd;
}

size_t PipeUserTerminal::write(const string& data) {
  lock_guard<std::mutex> guard(terminalMutex);
  size_t consumed = 0;
  while (consumed < data.size()) {
    char c = data[consumed];
    if (c == '\x03') {
      if (pid > 0 && !reaped) {
        ::kill(pid, SIGINT);
      }
      consumed++;
      continue;
    }
    if (c == '\x04') {
      if (inputFd >= 0) {
        ::close(inputFd);
        inputFd = -1;
      }
      consumed++;
      continue;
    }
    if (inputFd < 0) {
      throw std::runtime_error("Shell input is closed");
    }
    size_t end = data.find_first_of("\x03\x04", consumed);
    if (end == string::npos) {
      end = data.size();
    }
    size_t written = RawSocketUtils::writeSome(inputFd, data.c_str() + consumed,
                                               end - consumed);
    consumed += written;
    if (consumed < end) {
      // Pipe is full, the rest waits for POLLOUT
      break;
    }
  }
  return consumed;
}

void PipeUserTerminal::kill(int signal) {
  lock_guard<std::mutex> guard(terminalMutex);
  if (pid > 0 && !reaped) {
    ::kill(pid, signal);
  }
}

int PipeUserTerminal::handleSessionEnd() {
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

void PipeUserTerminal::cleanup() {
  lock_guard<std::mutex> guard(terminalMutex);
  for (int* fd : {&inputFd, &outputFd}) {
    if (*fd >= 0) {
      ::close(*fd);
      *fd = -1;
    }
  }
}

string PipeUserTerminal::filterOutput(const string& raw) {
  string converted;
  converted.reserve(raw.size() + raw.size() / 8);
  for (size_t a = 0; a < raw.size(); a++) {
    if (raw[a] == '\n' && (a == 0 || raw[a - 1] != '\r')) {
      converted += '\r';
    }
    converted += raw[a];
  }
  return converted;
}
}  // namespace sb
