#include "SessionStore.hpp"

namespace sb {
const char* sessionStatusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::Active:
      return "active";
    case SessionStatus::Inactive:
      return "inactive";
    case SessionStatus::Terminated:
      return "terminated";
  }
  return "unknown";
}

json SessionRecord::toJson() const {
  json j;
  j["id"] = id;
  j["uuid"] = uuid;
  j["status"] = sessionStatusName(status);
  j["createdAt"] = createdAt;
  j["lastActivity"] = lastActivity;
  return j;
}

SessionRecord MemorySessionStore::createSession(const string& uuid) {
  lock_guard<std::mutex> guard(storeMutex);
  auto it = records.find(uuid);
  if (it != records.end()) {
    // Reuse the record so the session id is stable for the token
    it->second.status = SessionStatus::Active;
    it->second.lastActivity = nowMillis();
    return it->second;
  }
  SessionRecord record;
  record.id = sole::uuid4().str();
  record.uuid = uuid;
  record.status = SessionStatus::Active;
  record.createdAt = record.lastActivity = nowMillis();
  records[uuid] = record;
  VLOG(1) << "Created session record " << record.id << " for " << uuid;
  return record;
}

optional<SessionRecord> MemorySessionStore::getSessionByUuid(
    const string& uuid) {
  lock_guard<std::mutex> guard(storeMutex);
  auto it = records.find(uuid);
  if (it == records.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemorySessionStore::updateSessionActivity(const string& uuid) {
  lock_guard<std::mutex> guard(storeMutex);
  auto it = records.find(uuid);
  if (it != records.end()) {
    it->second.lastActivity = nowMillis();
  }
}

void MemorySessionStore::updateSessionStatus(const string& uuid,
                                             SessionStatus status) {
  lock_guard<std::mutex> guard(storeMutex);
  auto it = records.find(uuid);
  if (it == records.end()) {
    LOG(WARNING) << "No session record for " << uuid;
    return;
  }
  it->second.status = status;
  it->second.lastActivity = nowMillis();
}

vector<SessionRecord> MemorySessionStore::listSessions() {
  lock_guard<std::mutex> guard(storeMutex);
  vector<SessionRecord> retval;
  for (const auto& it : records) {
    retval.push_back(it.second);
  }
  return retval;
}
}  // namespace sb
