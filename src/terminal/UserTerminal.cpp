#include "UserTerminal.hpp"

namespace sb {
string UserTerminal::defaultShell() {
  const char* shellEnv = ::getenv("SHELL");
  if (shellEnv != NULL && shellEnv[0] != '\0' &&
      ::access(shellEnv, X_OK) == 0) {
    return string(shellEnv);
  }
  if (::access("/bin/bash", X_OK) == 0) {
    return "/bin/bash";
  }
  return "/bin/sh";
}

void UserTerminal::waitForExit(pid_t pid) {
  siginfo_t info;
  int rc;
  do {
    memset(&info, 0, sizeof(info));
    rc = ::waitid(P_PID, pid, &info, WEXITED | WNOWAIT);
  } while (rc < 0 && GetErrno() == EINTR);
  if (rc < 0) {
    LOG(WARNING) << "waitid failed for shell " << pid << ": "
                 << strerror(GetErrno());
  }
}

int UserTerminal::reapExited(pid_t pid) {
  int status = 0;
  pid_t rc;
  do {
    rc = ::waitpid(pid, &status, WNOHANG);
  } while (rc < 0 && GetErrno() == EINTR);
  if (rc != pid) {
    LOG(WARNING) << "waitpid failed for shell " << pid << ": "
                 << (rc < 0 ? strerror(GetErrno()) : "still running");
    return -1;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}
}  // namespace sb
