#ifndef __SB_FAKE_USER_TERMINAL_HPP__
#define __SB_FAKE_USER_TERMINAL_HPP__

#include "RawSocketUtils.hpp"
#include "UserTerminal.hpp"

namespace sb {
/**
 * Session process backed by a pipe instead of a shell. Tests push output
 * with `emit` and end the session with `finish`. Input is recorded and,
 * when `echo` is set, written back as output. `holdWrites` makes `write`
 * block like a shell that stopped reading its input.
 */
class FakeUserTerminal : public UserTerminal {
 public:
  FakeUserTerminal()
      : echo(true),
        didCleanUp(false),
        didHandleSessionEnd(false),
        writesHeld(false),
        blockedWriters(0),
        inputClosed(false),
        readFd(-1),
        writeFd(-1),
        exitCode(0) {
    memset(&lastWinInfo, 0, sizeof(winsize));
  }

  virtual ~FakeUserTerminal() {
    closeWriteEnd();
    if (readFd >= 0) {
      ::close(readFd);
    }
  }

  virtual void setup(const winsize& initialSize) {
    int fds[2];
    FATAL_FAIL(::pipe(fds));
    readFd = fds[0];
    writeFd = fds[1];
    lastWinInfo = initialSize;
  }

  virtual int getFd() { return readFd; }

  virtual int getInputFd() {
    lock_guard<std::mutex> guard(fakeMutex);
    return inputClosed ? -1 : writeFd;
  }

  virtual size_t write(const string& data) {
    {
      std::unique_lock<std::mutex> gateLock(gateMutex);
      blockedWriters++;
      gateCv.notify_all();
      gateCv.wait(gateLock, [this]() { return !writesHeld; });
      blockedWriters--;
    }
    lock_guard<std::mutex> guard(fakeMutex);
    if (writeFd < 0 || inputClosed) {
      throw std::runtime_error("Fake terminal is closed");
    }
    input += data;
    inputCv.notify_all();
    if (echo) {
      RawSocketUtils::writeAll(writeFd, data.c_str(), data.length());
    }
    return data.size();
  }

  virtual void setInfo(const winsize& tmpwin) {
    lock_guard<std::mutex> guard(fakeMutex);
    lastWinInfo = tmpwin;
  }

  virtual void kill(int signal) {
    releaseWrites();
    lock_guard<std::mutex> guard(fakeMutex);
    signals.push_back(signal);
    if (writeFd >= 0) {
      exitCode = 128 + signal;
    }
    closeWriteEnd();
  }

  virtual int handleSessionEnd() {
    lock_guard<std::mutex> guard(fakeMutex);
    didHandleSessionEnd = true;
    return exitCode;
  }

  virtual void cleanup() {
    if (onCleanup) {
      onCleanup();
    }
    lock_guard<std::mutex> guard(fakeMutex);
    didCleanUp = true;
  }

  virtual string getKind() const { return "fake"; }

  void emit(const string& data) {
    lock_guard<std::mutex> guard(fakeMutex);
    RawSocketUtils::writeAll(writeFd, data.c_str(), data.length());
  }

  /** Closes the output so the session sees the shell exit with `code`. */
  void finish(int code) {
    lock_guard<std::mutex> guard(fakeMutex);
    exitCode = code;
    closeWriteEnd();
  }

  string getInput() {
    lock_guard<std::mutex> guard(fakeMutex);
    return input;
  }

  /** Waits until the recorded input contains `needle`. */
  bool waitForInput(const string& needle) {
    std::unique_lock<std::mutex> lock(fakeMutex);
    return inputCv.wait_for(lock, std::chrono::seconds(5), [&]() {
      return input.find(needle) != string::npos;
    });
  }

  /** Makes `write` block until `releaseWrites` or `kill`. */
  void holdWrites() {
    lock_guard<std::mutex> gateLock(gateMutex);
    writesHeld = true;
  }

  void releaseWrites() {
    lock_guard<std::mutex> gateLock(gateMutex);
    writesHeld = false;
    gateCv.notify_all();
  }

  /** Waits until a caller is stuck in `write`. */
  bool waitForBlockedWrite() {
    std::unique_lock<std::mutex> gateLock(gateMutex);
    return gateCv.wait_for(gateLock, std::chrono::seconds(5),
                           [this]() { return blockedWriters > 0; });
  }

  /** Stops accepting input while the shell keeps running. */
  void closeInput() {
    lock_guard<std::mutex> guard(fakeMutex);
    inputClosed = true;
  }

  winsize getLastWinInfo() {
    lock_guard<std::mutex> guard(fakeMutex);
    return lastWinInfo;
  }

  vector<int> getSignals() {
    lock_guard<std::mutex> guard(fakeMutex);
    return signals;
  }

  bool echo;
  /** Runs at the start of `cleanup`, on the session's thread. */
  function<void()> onCleanup;
  atomic<bool> didCleanUp;
  atomic<bool> didHandleSessionEnd;

 protected:
  std::mutex fakeMutex;
  std::condition_variable inputCv;
  std::mutex gateMutex;
  std::condition_variable gateCv;
  bool writesHeld;
  int blockedWriters;
  bool inputClosed;
  int readFd;
  int writeFd;
  int exitCode;
  string input;
  winsize lastWinInfo;
  vector<int> signals;

  void closeWriteEnd() {
    if (writeFd >= 0) {
      ::close(writeFd);
      writeFd = -1;
    }
  }
};

/**
 * Factory handing out FakeUserTerminals and remembering them, so tests can
 * drive the terminal behind a session.
 */
class FakeUserTerminalFactory {
 public:
  FakeUserTerminalFactory() : failSpawns(false) {}

  UserTerminalFactory factory() {
    return [this](const winsize& size) -> shared_ptr<UserTerminal> {
      if (failSpawns) {
        throw std::runtime_error("spawn disabled");
      }
      auto terminal = make_shared<FakeUserTerminal>();
      terminal->setup(size);
      lock_guard<std::mutex> guard(factoryMutex);
      created.push_back(terminal);
      return terminal;
    };
  }

  shared_ptr<FakeUserTerminal> last() {
    lock_guard<std::mutex> guard(factoryMutex);
    if (created.empty()) {
      return shared_ptr<FakeUserTerminal>();
    }
    return created.back();
  }

  size_t count() {
    lock_guard<std::mutex> guard(factoryMutex);
    return created.size();
  }

  atomic<bool> failSpawns;

 protected:
  std::mutex factoryMutex;
  vector<shared_ptr<FakeUserTerminal>> created;
};
}  // namespace sb

#endif  // __SB_FAKE_USER_TERMINAL_HPP__
