#ifndef __SB_TERMINAL_SESSION_MANAGER_HPP__
#define __SB_TERMINAL_SESSION_MANAGER_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "UserTerminal.hpp"

namespace sb {
/**
 * @brief Snapshot of one terminal session as reported to clients.
 */
struct TerminalSessionInfo {
  string id;
  string uuid;
  string terminalId;
  string name;
  string color;
  bool isActive = false;
  int64_t createdAt = 0;
  int64_t lastActivity = 0;
  int cols = 80;
  int rows = 24;
  optional<int> exitCode;
  string kind;

  json toJson() const;
};

/**
 * @brief Receives session events. Output and exit callbacks run on the
 * session's reader thread, one session never blocks another.
 */
class TerminalEventHandler {
 public:
  virtual ~TerminalEventHandler() {}

  virtual void onTerminalCreated(const TerminalSessionInfo& info) = 0;
  virtual void onTerminalOutput(const string& uuid, const string& terminalId,
                                const string& data) = 0;
  virtual void onTerminalExit(const string& uuid, const string& terminalId,
                              int exitCode) = 0;
};

struct TerminalLimits {
  size_t maxTerminalsPerUser = 8;
  size_t maxGlobalTerminals = 50;
  int64_t sessionMemoryBudgetBytes = 50LL * 1024 * 1024;
  int64_t idleTimeoutMs = 30LL * 60 * 1000;
  int64_t aggressiveTimeoutMs = 30LL * 60 * 1000;
  /** @brief How long an exited session stays visible before it is reaped. */
  int64_t exitGraceMs = 60LL * 1000;
  int64_t bannerDelayMs = 100;
  /** @brief Input queued for a shell that is not reading it yet. */
  size_t maxPendingInputBytes = 1024 * 1024;
};

/**
 * @brief Number of trailing bytes of `data` that start a UTF-8 sequence the
 * data does not finish.
 */
size_t utf8IncompleteSuffixLength(const string& data);

/**
 * @brief Owns every shell session, keyed by (token, slot).
 *
 * Capacity is checked and reserved under one lock before anything is
 * spawned. Each session gets a reader thread that relays its output, in
 * order, to the event handler. Input is queued and written by that same
 * thread, so a shell that stops reading never stalls the caller.
 */
class TerminalSessionManager {
 public:
  TerminalSessionManager(const TerminalLimits& _limits,
                         UserTerminalFactory _terminalFactory =
                             &TerminalSessionManager::spawnDefaultTerminal);
  virtual ~TerminalSessionManager();

  /** @brief Not owned; must outlive the manager or be reset to NULL. */
  void setEventHandler(TerminalEventHandler* handler);

  /**
   * @brief Starts a shell for the token.
   * @throws BridgeException with SlotAlreadyExists, CapacityExceeded or
   * SpawnFailure.
   */
  TerminalSessionInfo create(const string& uuid,
                             const optional<string>& terminalId = std::nullopt,
                             const optional<string>& name = std::nullopt,
                             const optional<string>& color = std::nullopt);

  /**
   * @brief Queues keystrokes for the shell.
   * @return false if no live session matches, its input is closed, or too
   * much input is already queued.
   */
  bool write(const string& uuid, const string& terminalId, const string& data);
  bool resize(const string& uuid, const string& terminalId, int cols, int rows);

  /**
   * @brief Kills one slot, or every slot of the token when none is given.
   * @return true if anything was removed.
   */
  bool terminate(const string& uuid,
                 const optional<string>& terminalId = std::nullopt);

  optional<TerminalSessionInfo> getSession(const string& uuid,
                                           const string& terminalId) const;
  vector<TerminalSessionInfo> listByToken(const string& uuid) const;
  vector<TerminalSessionInfo> listActive() const;
  size_t getSessionCount() const;

  /** @brief Removes active sessions idle for longer than `maxIdleMs`. */
  size_t reclaimIdleSessions(int64_t maxIdleMs);
  /** @brief Removes exited sessions whose grace period has passed. */
  size_t reapExitedSessions();
  /** @brief True once memory use is above 80% of the estimated ceiling. */
  bool isUnderMemoryPressure() const;
  /**
   * @brief Periodic maintenance: reap exited sessions, reclaim idle ones,
   * and run the aggressive pass when under memory pressure.
   */
  size_t runReclamation();

  /** @brief Totals, memory use and configured limits. */
  json getResourceUsage() const;

  /** @brief Terminates every session. */
  void shutdown();

  const TerminalLimits& getLimits() const { return limits; }
  /** @brief Overrides how resident memory is measured. */
  void setMemoryProbe(function<int64_t()> probe);

  static string generateTerminalId();
  static shared_ptr<UserTerminal> spawnDefaultTerminal(const winsize& size);
  /** @brief Resident set size of this process, from /proc/self/statm. */
  static int64_t residentMemoryBytes();

 protected:
  struct Session {
    std::mutex sessionMutex;
    TerminalSessionInfo info;
    shared_ptr<UserTerminal> term;
    std::thread reader;
    atomic<bool> shuttingDown;
    int64_t exitedAt;
    // Input not yet taken by the shell, only the reader consumes it
    string pendingInput;
    // Written to wake the reader when input is queued
    int wakeFds[2];

    Session() : shuttingDown(false), exitedAt(0) {
      wakeFds[0] = wakeFds[1] = -1;
    }
    ~Session() {
      for (int fd : wakeFds) {
        if (fd >= 0) {
          ::close(fd);
        }
      }
    }
  };

  TerminalLimits limits;
  UserTerminalFactory terminalFactory;
  function<int64_t()> memoryProbe;

  mutable std::mutex managerMutex;
  // token + ":" + slot -> session
  map<string, shared_ptr<Session>> sessions;
  TerminalEventHandler* eventHandler;

  static string sessionKey(const string& uuid, const string& terminalId);
  shared_ptr<Session> findSession(const string& uuid,
                                  const string& terminalId) const;
  size_t countForToken(const string& uuid) const;
  void runReader(shared_ptr<Session> session);
  void flushInput(const shared_ptr<Session>& session,
                  const shared_ptr<UserTerminal>& term);
  static void wakeReader(const shared_ptr<Session>& session);
  void stopSession(shared_ptr<Session> session);
  TerminalEventHandler* getEventHandler() const;
  string makeBanner(const TerminalSessionInfo& info) const;
};
}  // namespace sb

#endif  // __SB_TERMINAL_SESSION_MANAGER_HPP__
