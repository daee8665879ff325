#ifndef __SB_HEADERS__
#define __SB_HEADERS__

// httplib pulls in its own socket headers and has to come first
#include "httplib.h"

#if __APPLE__
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#else
#include <pty.h>
#endif

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <paths.h>
#include <poll.h>
#include <pthread.h>
#include <pwd.h>
#include <signal.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/utsname.h>
#include <sys/wait.h>
#include <termios.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ThreadPool.h"
#include "easylogging++.h"
#include "sago/platform_folders.h"
#include "sole.hpp"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef SB_VERSION
#define SB_VERSION "unknown"
#endif

namespace sb {
// Default listening ports
const int DEFAULT_BRIDGE_PORT = 3002;
const int DEFAULT_ADMIN_PORT = 3001;

template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline int replaceAll(std::string &str, const std::string &from,
                      const std::string &to) {
  if (from.empty()) return 0;
  int retval = 0;
  size_t start_pos = 0;
  while ((start_pos = str.find(from, start_pos)) != std::string::npos) {
    retval++;
    str.replace(start_pos, from.length(), to);
    start_pos += to.length();  // 'to' may contain 'from'
  }
  return retval;
}

inline string trim(const string &s) {
  const char *ws = " \t\r\n";
  auto start = s.find_first_not_of(ws);
  if (start == string::npos) return "";
  auto end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

inline string genRandomAlphaNum(int len) {
  static const char alphanum[] =
      "0123456789"
      "abcdefghijklmnopqrstuvwxyz";
  string s(len, '\0');

  for (int i = 0; i < len; ++i) {
    s[i] = alphanum[randombytes_uniform(sizeof(alphanum) - 1)];
  }

  return s;
}

/** @brief Milliseconds since the unix epoch, the unit used on the wire. */
inline int64_t nowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline string GetHomeDirectory() {
  const char *home = ::getenv("HOME");
  if (home != NULL && home[0] != '\0') {
    return string(home);
  }
  passwd *pwd = getpwuid(getuid());
  if (pwd != NULL && pwd->pw_dir != NULL) {
    return string(pwd->pw_dir);
  }
  return "/";
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace sb

#endif  // __SB_HEADERS__
