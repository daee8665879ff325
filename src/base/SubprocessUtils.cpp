#include "SubprocessUtils.hpp"

#include "BridgeException.hpp"

namespace sb {
namespace {
void closeIfOpen(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

int decodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}
}  // namespace

ChildProcess::ChildProcess(pid_t _pid, int _stdoutFd, int _stderrFd)
    : pid(_pid), stdoutFd(_stdoutFd), stderrFd(_stderrFd), reaped(false) {}

ChildProcess::~ChildProcess() {
  closeIfOpen(stdoutFd);
  closeIfOpen(stderrFd);
  // Never leave a zombie behind. Both calls are no-ops once reaped.
  kill(SIGKILL);
  wait();
}

bool ChildProcess::pump(const function<void(const string &, bool)> &onChunk,
                        optional<chrono::steady_clock::time_point> deadline) {
#define PUMP_BUF_SIZE (16 * 1024)
  char buf[PUMP_BUF_SIZE];
  while (stdoutFd >= 0 || stderrFd >= 0) {
    int timeoutMs = 250;
    if (deadline) {
      auto remaining = chrono::duration_cast<chrono::milliseconds>(
                           *deadline - chrono::steady_clock::now())
                           .count();
      if (remaining <= 0) {
        return false;
      }
      timeoutMs = int(min<int64_t>(remaining, timeoutMs));
    }

    pollfd fds[2];
    int nfds = 0;
    for (int fd : {stdoutFd, stderrFd}) {
      if (fd >= 0) {
        fds[nfds].fd = fd;
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        nfds++;
      }
    }
    int rc = ::poll(fds, nfds, timeoutMs);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      STERROR << "poll failed on child pipes: " << strerror(GetErrno());
      closeIfOpen(stdoutFd);
      closeIfOpen(stderrFd);
      break;
    }
    for (int a = 0; a < nfds; a++) {
      if (!(fds[a].revents & (POLLIN | POLLHUP | POLLERR))) {
        continue;
      }
      bool isStderr = (fds[a].fd == stderrFd);
      ssize_t bytesRead = ::read(fds[a].fd, buf, PUMP_BUF_SIZE);
      if (bytesRead > 0) {
        onChunk(string(buf, bytesRead), isStderr);
      } else if (bytesRead == 0 ||
                 (GetErrno() != EAGAIN && GetErrno() != EINTR)) {
        closeIfOpen(isStderr ? stderrFd : stdoutFd);
      }
    }
  }
  return true;
}

bool ChildProcess::kill(int signal) {
  lock_guard<std::mutex> guard(reapMutex);
  if (reaped) {
    return false;
  }
  if (::kill(-pid, signal) == 0) {
    return true;
  }
  // The group may not exist yet if the child has not run setpgid
  return ::kill(pid, signal) == 0;
}

bool ChildProcess::tryReapLocked() {
  if (reaped) {
    return true;
  }
  int status = 0;
  pid_t rc;
  do {
    rc = ::waitpid(pid, &status, WNOHANG);
  } while (rc < 0 && GetErrno() == EINTR);
  if (rc == 0) {
    return false;
  }
  reaped = true;
  if (rc == pid) {
    exitCode = decodeWaitStatus(status);
  } else {
    LOG(WARNING) << "waitpid failed for " << pid << ": "
                 << strerror(GetErrno());
  }
  return true;
}

bool ChildProcess::waitUntil(
    optional<chrono::steady_clock::time_point> deadline) {
  while (true) {
    {
      lock_guard<std::mutex> guard(reapMutex);
      if (tryReapLocked()) {
        return true;
      }
    }
    if (deadline && chrono::steady_clock::now() >= *deadline) {
      return false;
    }
    std::this_thread::sleep_for(chrono::milliseconds(10));
  }
}

optional<int> ChildProcess::wait() {
  waitUntil(std::nullopt);
  lock_guard<std::mutex> guard(reapMutex);
  return exitCode;
}

string SubprocessUtils::SubprocessToStringInteractive(
    const string &command, const vector<string> &args) {
  try {
    auto child = spawn(command, args);
    string output;
    child->pump([&output](const string &chunk, bool) { output += chunk; },
                std::nullopt);
    child->wait();
    return output;
  } catch (const BridgeException &be) {
    VLOG(1) << "Could not run " << command << ": " << be.what();
    return "";
  }
}

SubprocessResult SubprocessUtils::run(const string &command,
                                      const vector<string> &args,
                                      int64_t timeoutMs) {
  SubprocessResult result;
  auto child = spawn(command, args);
  optional<chrono::steady_clock::time_point> deadline;
  if (timeoutMs > 0) {
    deadline = chrono::steady_clock::now() + chrono::milliseconds(timeoutMs);
  }
  bool finished = child->pump(
      [&result](const string &chunk, bool isStderr) {
        (isStderr ? result.error : result.output) += chunk;
      },
      deadline);
  if (finished) {
    finished = child->waitUntil(deadline);
  }
  if (!finished) {
    result.timedOut = true;
    child->kill(SIGKILL);
  }
  result.exitCode = child->wait();
  return result;
}

shared_ptr<ChildProcess> SubprocessUtils::spawn(
    const string &command, const vector<string> &args, const string &cwd,
    const map<string, string> &extraEnv) {
  int outPipe[2], errPipe[2], execPipe[2];
  if (::pipe(outPipe) < 0) {
    throw BridgeException(BridgeErrorCode::SpawnFailure,
                          string("pipe failed: ") + strerror(GetErrno()));
  }
  if (::pipe(errPipe) < 0) {
    int savedErrno = GetErrno();
    ::close(outPipe[0]);
    ::close(outPipe[1]);
    throw BridgeException(BridgeErrorCode::SpawnFailure,
                          string("pipe failed: ") + strerror(savedErrno));
  }
  // Closed by a successful exec, so a read of 0 bytes means the child started
  if (::pipe2(execPipe, O_CLOEXEC) < 0) {
    int savedErrno = GetErrno();
    for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) {
      ::close(fd);
    }
    throw BridgeException(BridgeErrorCode::SpawnFailure,
                          string("pipe failed: ") + strerror(savedErrno));
  }

  vector<char *> argv;
  argv.push_back(const_cast<char *>(command.c_str()));
  for (auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(NULL);

  pid_t pid = fork();
  if (pid == 0) {
    ::setpgid(0, 0);
    signal(SIGCHLD, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
      dup2(devNull, STDIN_FILENO);
      ::close(devNull);
    }
    dup2(outPipe[1], STDOUT_FILENO);
    dup2(errPipe[1], STDERR_FILENO);
    ::close(outPipe[0]);
    ::close(outPipe[1]);
    ::close(errPipe[0]);
    ::close(errPipe[1]);
    ::close(execPipe[0]);
    for (const auto &it : extraEnv) {
      setenv(it.first.c_str(), it.second.c_str(), 1);
    }
    if (!cwd.empty() && ::chdir(cwd.c_str()) < 0) {
      int childErrno = errno;
      (void)!::write(execPipe[1], &childErrno, sizeof(childErrno));
      _exit(127);
    }
    ::execvp(command.c_str(), argv.data());
    int childErrno = errno;
    (void)!::write(execPipe[1], &childErrno, sizeof(childErrno));
    _exit(127);
  }

  ::close(outPipe[1]);
  ::close(errPipe[1]);
  ::close(execPipe[1]);
  if (pid < 0) {
    int savedErrno = GetErrno();
    ::close(outPipe[0]);
    ::close(errPipe[0]);
    ::close(execPipe[0]);
    throw BridgeException(BridgeErrorCode::SpawnFailure,
                          string("fork failed: ") + strerror(savedErrno));
  }

  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(execPipe[0], &childErrno, sizeof(childErrno));
  } while (rc < 0 && GetErrno() == EINTR);
  ::close(execPipe[0]);

  auto child = make_shared<ChildProcess>(pid, outPipe[0], errPipe[0]);
  if (rc > 0) {
    child->wait();
    throw BridgeException(BridgeErrorCode::SpawnFailure,
                          "Cannot start " + command + ": " +
                              strerror(childErrno));
  }
  VLOG(1) << "Spawned " << command << " as " << pid;
  return child;
}
}  // namespace sb
