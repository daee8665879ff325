#ifndef __SB_SESSION_STORE_HPP__
#define __SB_SESSION_STORE_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace sb {
enum class SessionStatus { Active, Inactive, Terminated };

const char* sessionStatusName(SessionStatus status);

/**
 * @brief Durable record of a client token, kept across reconnects.
 */
struct SessionRecord {
  string id;
  string uuid;
  SessionStatus status = SessionStatus::Active;
  int64_t createdAt = 0;
  int64_t lastActivity = 0;

  json toJson() const;
};

class SessionStore {
 public:
  virtual ~SessionStore() {}

  virtual SessionRecord createSession(const string& uuid) = 0;
  virtual optional<SessionRecord> getSessionByUuid(const string& uuid) = 0;
  virtual void updateSessionActivity(const string& uuid) = 0;
  virtual void updateSessionStatus(const string& uuid,
                                   SessionStatus status) = 0;
  virtual vector<SessionRecord> listSessions() = 0;
};

class MemorySessionStore : public SessionStore {
 public:
  virtual SessionRecord createSession(const string& uuid);
  virtual optional<SessionRecord> getSessionByUuid(const string& uuid);
  virtual void updateSessionActivity(const string& uuid);
  virtual void updateSessionStatus(const string& uuid, SessionStatus status);
  virtual vector<SessionRecord> listSessions();

 protected:
  std::mutex storeMutex;
  map<string, SessionRecord> records;
};
}  // namespace sb

#endif  // __SB_SESSION_STORE_HPP__
