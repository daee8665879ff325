#include "TerminalSessionManager.hpp"

#include "BridgeException.hpp"
#include "PipeUserTerminal.hpp"
#include "PseudoUserTerminal.hpp"
#include "RawSocketUtils.hpp"

#define READ_BUF_SIZE (16 * 1024)

namespace sb {

json TerminalSessionInfo::toJson() const {
  return {{"id", id},
          {"terminalId", terminalId},
          {"name", name},
          {"color", color},
          {"isActive", isActive},
          {"createdAt", createdAt},
          {"lastActivity", lastActivity},
          {"cols", cols},
          {"rows", rows}};
}

size_t utf8IncompleteSuffixLength(const string& data) {
  size_t maxLook = min<size_t>(3, data.size());
  for (size_t back = 1; back <= maxLook; back++) {
    unsigned char c = data[data.size() - back];
    if ((c & 0xC0) == 0x80) {
      // continuation byte, keep looking for the lead byte
      continue;
    }
    if ((c & 0x80) == 0) {
      return 0;
    }
    size_t needed = 1;
    if ((c & 0xE0) == 0xC0) {
      needed = 2;
    } else if ((c & 0xF0) == 0xE0) {
      needed = 3;
    } else if ((c & 0xF8) == 0xF0) {
      needed = 4;
    }
    return needed > back ? back : 0;
  }
  return 0;
}

TerminalSessionManager::TerminalSessionManager(
    const TerminalLimits& _limits, UserTerminalFactory _terminalFactory)
    : limits(_limits),
      terminalFactory(_terminalFactory),
      memoryProbe(&TerminalSessionManager::residentMemoryBytes),
      eventHandler(NULL) {}

TerminalSessionManager::~TerminalSessionManager() { shutdown(); }

void TerminalSessionManager::setEventHandler(TerminalEventHandler* handler) {
  lock_guard<std::mutex> guard(managerMutex);
  eventHandler = handler;
}

void TerminalSessionManager::setMemoryProbe(function<int64_t()> probe) {
  lock_guard<std::mutex> guard(managerMutex);
  memoryProbe = probe;
}

TerminalEventHandler* TerminalSessionManager::getEventHandler() const {
  lock_guard<std::mutex> guard(managerMutex);
  return eventHandler;
}

string TerminalSessionManager::sessionKey(const string& uuid,
                                          const string& terminalId) {
  return uuid + ":" + terminalId;
}

string TerminalSessionManager::generateTerminalId() {
  return "term_" + to_string(nowMillis()) + "_" + genRandomAlphaNum(5);
}

size_t TerminalSessionManager::countForToken(const string& uuid) const {
  size_t count = 0;
  for (const auto& it : sessions) {
    if (it.second->info.uuid == uuid) {
      count++;
    }
  }
  return count;
}

TerminalSessionInfo TerminalSessionManager::create(
    const string& uuid, const optional<string>& terminalId,
    const optional<string>& name, const optional<string>& color) {
  string slot = terminalId ? *terminalId : generateTerminalId();
  string key = sessionKey(uuid, slot);
  auto session = make_shared<Session>();
  FATAL_FAIL(::pipe(session->wakeFds));
  RawSocketUtils::setNonBlocking(session->wakeFds[0]);
  RawSocketUtils::setNonBlocking(session->wakeFds[1]);
  {
    lock_guard<std::mutex> guard(managerMutex);
    if (sessions.find(key) != sessions.end()) {
      throw BridgeException(BridgeErrorCode::SlotAlreadyExists,
                            "Terminal " + slot + " already exists");
    }
    size_t tokenCount = countForToken(uuid);
    if (tokenCount >= limits.maxTerminalsPerUser) {
      throw BridgeException(BridgeErrorCode::CapacityExceeded,
                            "Maximum terminals per user reached");
    }
    if (sessions.size() >= limits.maxGlobalTerminals) {
      throw BridgeException(BridgeErrorCode::CapacityExceeded,
                            "Maximum global terminals reached");
    }

    // Reserve the slot before spawning so concurrent creates see it
    auto& info = session->info;
    info.id = sole::uuid4().str();
    info.uuid = uuid;
    info.terminalId = slot;
    info.name = name ? *name : "Terminal " + to_string(tokenCount + 1);
    info.color = color ? *color : "blue";
    info.isActive = false;
    info.createdAt = info.lastActivity = nowMillis();
    sessions[key] = session;
  }

  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = session->info.cols;
  win.ws_row = session->info.rows;

  shared_ptr<UserTerminal> term;
  try {
    term = terminalFactory(win);
  } catch (const std::runtime_error& re) {
    {
      lock_guard<std::mutex> guard(managerMutex);
      sessions.erase(key);
    }
    LOG(ERROR) << "Could not start terminal " << slot << ": " << re.what();
    auto be = dynamic_cast<const BridgeException*>(&re);
    if (be) {
      throw;
    }
    throw BridgeException(BridgeErrorCode::SpawnFailure, re.what());
  }

  TerminalSessionInfo snapshot;
  {
    lock_guard<std::mutex> guard(managerMutex);
    auto it = sessions.find(key);
    if (it == sessions.end() || it->second != session) {
      // Closed while the shell was starting
      term->kill(SIGKILL);
      term->handleSessionEnd();
      term->cleanup();
      throw BridgeException(BridgeErrorCode::NotFound,
                            "Terminal " + slot + " was closed during creation");
    }
    {
      lock_guard<std::mutex> sessionGuard(session->sessionMutex);
      session->term = term;
      session->info.isActive = true;
      session->info.kind = term->getKind();
      snapshot = session->info;
    }
    session->reader =
        std::thread(&TerminalSessionManager::runReader, this, session);
  }

  LOG(INFO) << "Created terminal " << slot << " (" << snapshot.kind
            << ") for " << uuid;
  auto handler = getEventHandler();
  if (handler) {
    handler->onTerminalCreated(snapshot);
  }
  return snapshot;
}

string TerminalSessionManager::makeBanner(
    const TerminalSessionInfo& info) const {
  utsname name;
  string platform = "unknown";
  if (uname(&name) == 0) {
    platform = name.sysname;
    std::transform(platform.begin(), platform.end(), platform.begin(),
                   ::tolower);
  }
  return "\r\nShellBridge terminal connected\r\n"
         "Terminal ID: " +
         info.terminalId + "\r\nSession ID: " + info.uuid.substr(0, 8) +
         "...\r\nPlatform: " + platform + "\r\n\r\n";
}

void TerminalSessionManager::runReader(shared_ptr<Session> session) {
  string uuid = session->info.uuid;
  string slot = session->info.terminalId;
  el::Helpers::setThreadName("term-" + slot);

  shared_ptr<UserTerminal> term;
  TerminalSessionInfo bannerInfo;
  {
    lock_guard<std::mutex> guard(session->sessionMutex);
    term = session->term;
    bannerInfo = session->info;
  }
  int fd = term->getFd();
  auto started = chrono::steady_clock::now();
  bool bannerSent = false;
  string pending;
  char buf[READ_BUF_SIZE];

  while (!session->shuttingDown) {
    if (!bannerSent &&
        chrono::steady_clock::now() - started >=
            chrono::milliseconds(limits.bannerDelayMs)) {
      bannerSent = true;
      auto handler = getEventHandler();
      if (handler) {
        handler->onTerminalOutput(uuid, slot, makeBanner(bannerInfo));
      }
    }

    bool hasInput;
    {
      lock_guard<std::mutex> guard(session->sessionMutex);
      hasInput = !session->pendingInput.empty();
    }
    int inputFd = hasInput ? term->getInputFd() : -1;

    pollfd pfds[3];
    memset(pfds, 0, sizeof(pfds));
    pfds[0].fd = fd;
    pfds[0].events = POLLIN;
    pfds[1].fd = session->wakeFds[0];
    pfds[1].events = POLLIN;
    nfds_t pollCount = 2;
    if (inputFd >= 0) {
      pfds[2].fd = inputFd;
      pfds[2].events = POLLOUT;
      pollCount = 3;
    }
    int rc = ::poll(pfds, pollCount, 20);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      STERROR << "poll failed on terminal " << slot << ": "
              << strerror(GetErrno());
      break;
    }
    if (pfds[1].revents & POLLIN) {
      char drain[64];
      while (::read(session->wakeFds[0], drain, sizeof(drain)) > 0) {
      }
    }
    if (hasInput && (inputFd < 0 || pfds[2].revents != 0)) {
      flushInput(session, term);
    }
    if (pfds[0].revents == 0) {
      continue;
    }

    ssize_t bytesRead = ::read(fd, buf, READ_BUF_SIZE);
    int readErrno = GetErrno();
    if (bytesRead > 0) {
      pending += term->filterOutput(string(buf, bytesRead));
      size_t complete = pending.size() - utf8IncompleteSuffixLength(pending);
      if (complete == 0) {
        continue;
      }
      string data = pending.substr(0, complete);
      pending.erase(0, complete);
      {
        lock_guard<std::mutex> guard(session->sessionMutex);
        session->info.lastActivity =
            max(session->info.lastActivity, nowMillis());
      }
      VLOG(4) << "Read " << bytesRead << " bytes from " << slot;
      auto handler = getEventHandler();
      if (handler) {
        handler->onTerminalOutput(uuid, slot, data);
      }
    } else if (bytesRead == 0) {
      break;
    } else if (readErrno == EAGAIN || readErrno == EINTR) {
      continue;
    } else {
      // EIO is how a pty master reports that the shell side closed
      if (readErrno != EIO) {
        LOG(ERROR) << "Terminal read error on " << slot << ": "
                   << strerror(readErrno);
      }
      break;
    }
  }

  auto handler = getEventHandler();
  if (!pending.empty() && !session->shuttingDown && handler) {
    handler->onTerminalOutput(uuid, slot, pending);
  }

  // Writers check isActive, so no input is queued once the fds go away
  {
    lock_guard<std::mutex> guard(session->sessionMutex);
    session->info.isActive = false;
    session->pendingInput.clear();
  }
  int exitCode = term->handleSessionEnd();
  term->cleanup();
  if (session->shuttingDown) {
    VLOG(1) << "Reader for " << slot << " stopped";
    return;
  }

  {
    lock_guard<std::mutex> guard(session->sessionMutex);
    session->info.exitCode = exitCode;
    session->exitedAt = nowMillis();
  }
  LOG(INFO) << "Terminal " << slot << " for " << uuid << " exited with "
            << exitCode;
  if (handler) {
    handler->onTerminalExit(uuid, slot, exitCode);
  }
}

void TerminalSessionManager::flushInput(const shared_ptr<Session>& session,
                                        const shared_ptr<UserTerminal>& term) {
  string data;
  {
    lock_guard<std::mutex> guard(session->sessionMutex);
    data = session->pendingInput.substr(0, READ_BUF_SIZE);
  }
  size_t written;
  try {
    written = term->write(data);
  } catch (const std::runtime_error& re) {
    lock_guard<std::mutex> guard(session->sessionMutex);
    LOG(WARNING) << "Dropping " << session->pendingInput.size()
                 << " bytes of input for " << session->info.terminalId << ": "
                 << re.what();
    session->pendingInput.clear();
    return;
  }
  // Writers only append, so the prefix we copied is still at the front
  lock_guard<std::mutex> guard(session->sessionMutex);
  session->pendingInput.erase(0, written);
}

void TerminalSessionManager::wakeReader(const shared_ptr<Session>& session) {
  char c = 0;
  if (::write(session->wakeFds[1], &c, 1) < 0 && GetErrno() != EAGAIN) {
    LOG(WARNING) << "Could not wake terminal reader: "
                 << strerror(GetErrno());
  }
}

void TerminalSessionManager::stopSession(shared_ptr<Session> session) {
  session->shuttingDown = true;
  shared_ptr<UserTerminal> term;
  bool exited;
  {
    lock_guard<std::mutex> guard(session->sessionMutex);
    term = session->term;
    exited = session->exitedAt > 0;
    session->info.isActive = false;
  }
  if (term && !exited) {
    term->kill(SIGKILL);
  }
  wakeReader(session);
  if (session->reader.joinable()) {
    if (session->reader.get_id() == std::this_thread::get_id()) {
      session->reader.detach();
    } else {
      session->reader.join();
    }
  }
}

shared_ptr<TerminalSessionManager::Session> TerminalSessionManager::findSession(
    const string& uuid, const string& terminalId) const {
  lock_guard<std::mutex> guard(managerMutex);
  auto it = sessions.find(sessionKey(uuid, terminalId));
  if (it == sessions.end()) {
    return shared_ptr<Session>();
  }
  return it->second;
}

bool TerminalSessionManager::write(const string& uuid, const string& terminalId,
                                   const string& data) {
  auto session = findSession(uuid, terminalId);
  if (!session) {
    return false;
  }
  shared_ptr<UserTerminal> term;
  {
    lock_guard<std::mutex> guard(session->sessionMutex);
    if (!session->info.isActive || !session->term) {
      return false;
    }
    term = session->term;
  }
  if (term->getInputFd() < 0) {
    LOG(WARNING) << "Input of " << terminalId << " is closed";
    return false;
  }
  {
    lock_guard<std::mutex> guard(session->sessionMutex);
    if (!session->info.isActive) {
      return false;
    }
    if (session->pendingInput.size() + data.size() >
        limits.maxPendingInputBytes) {
      LOG(WARNING) << "Input for " << terminalId << " is backed up, dropping "
                   << data.size() << " bytes";
      return false;
    }
    session->pendingInput += data;
    session->info.lastActivity = max(session->info.lastActivity, nowMillis());
  }
  wakeReader(session);
  return true;
}

bool TerminalSessionManager::resize(const string& uuid,
                                    const string& terminalId, int cols,
                                    int rows) {
  if (cols <= 0 || rows <= 0 || cols > 0xFFFF || rows > 0xFFFF) {
    return false;
  }
  auto session = findSession(uuid, terminalId);
  if (!session) {
    return false;
  }
  shared_ptr<UserTerminal> term;
  {
    lock_guard<std::mutex> guard(session->sessionMutex);
    if (!session->info.isActive || !session->term) {
      return false;
    }
    term = session->term;
    session->info.cols = cols;
    session->info.rows = rows;
  }
  winsize tmpwin;
  memset(&tmpwin, 0, sizeof(tmpwin));
  tmpwin.ws_col = cols;
  tmpwin.ws_row = rows;
  term->setInfo(tmpwin);
  VLOG(1) << "Resized " << terminalId << " to " << cols << "x" << rows;
  return true;
}

bool TerminalSessionManager::terminate(const string& uuid,
                                       const optional<string>& terminalId) {
  vector<shared_ptr<Session>> removed;
  {
    lock_guard<std::mutex> guard(managerMutex);
    if (terminalId) {
      auto it = sessions.find(sessionKey(uuid, *terminalId));
      if (it != sessions.end()) {
        removed.push_back(it->second);
        sessions.erase(it);
      }
    } else {
      for (auto it = sessions.begin(); it != sessions.end();) {
        if (it->second->info.uuid == uuid) {
          removed.push_back(it->second);
          it = sessions.erase(it);
        } else {
          ++it;
        }
      }
    }
  }
  for (auto& session : removed) {
    stopSession(session);
  }
  if (!removed.empty()) {
    LOG(INFO) << "Terminated " << removed.size() << " terminal(s) for "
              << uuid;
  }
  return !removed.empty();
}

optional<TerminalSessionInfo> TerminalSessionManager::getSession(
    const string& uuid, const string& terminalId) const {
  auto session = findSession(uuid, terminalId);
  if (!session) {
    return std::nullopt;
  }
  lock_guard<std::mutex> guard(session->sessionMutex);
  return session->info;
}

vector<TerminalSessionInfo> TerminalSessionManager::listByToken(
    const string& uuid) const {
  vector<TerminalSessionInfo> result;
  lock_guard<std::mutex> guard(managerMutex);
  for (const auto& it : sessions) {
    if (it.second->info.uuid != uuid) {
      continue;
    }
    lock_guard<std::mutex> sessionGuard(it.second->sessionMutex);
    result.push_back(it.second->info);
  }
  std::sort(result.begin(), result.end(),
            [](const TerminalSessionInfo& a, const TerminalSessionInfo& b) {
              return a.createdAt < b.createdAt;
            });
  return result;
}

vector<TerminalSessionInfo> TerminalSessionManager::listActive() const {
  vector<TerminalSessionInfo> result;
  lock_guard<std::mutex> guard(managerMutex);
  for (const auto& it : sessions) {
    lock_guard<std::mutex> sessionGuard(it.second->sessionMutex);
    if (it.second->info.isActive) {
      result.push_back(it.second->info);
    }
  }
  return result;
}

size_t TerminalSessionManager::getSessionCount() const {
  lock_guard<std::mutex> guard(managerMutex);
  return sessions.size();
}

size_t TerminalSessionManager::reclaimIdleSessions(int64_t maxIdleMs) {
  vector<shared_ptr<Session>> removed;
  int64_t now = nowMillis();
  {
    lock_guard<std::mutex> guard(managerMutex);
    for (auto it = sessions.begin(); it != sessions.end();) {
      bool idle;
      {
        lock_guard<std::mutex> sessionGuard(it->second->sessionMutex);
        idle = it->second->info.isActive &&
               now - it->second->info.lastActivity > maxIdleMs;
      }
      if (idle) {
        LOG(INFO) << "Reclaiming idle terminal " << it->first;
        removed.push_back(it->second);
        it = sessions.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& session : removed) {
    stopSession(session);
  }
  return removed.size();
}

size_t TerminalSessionManager::reapExitedSessions() {
  vector<shared_ptr<Session>> removed;
  int64_t now = nowMillis();
  {
    lock_guard<std::mutex> guard(managerMutex);
    for (auto it = sessions.begin(); it != sessions.end();) {
      bool expired;
      {
        lock_guard<std::mutex> sessionGuard(it->second->sessionMutex);
        expired = it->second->exitedAt > 0 &&
                  now - it->second->exitedAt >= limits.exitGraceMs;
      }
      if (expired) {
        VLOG(1) << "Reaping exited terminal " << it->first;
        removed.push_back(it->second);
        it = sessions.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& session : removed) {
    stopSession(session);
  }
  return removed.size();
}

bool TerminalSessionManager::isUnderMemoryPressure() const {
  function<int64_t()> probe;
  {
    lock_guard<std::mutex> guard(managerMutex);
    probe = memoryProbe;
  }
  double ceiling = double(limits.maxGlobalTerminals) *
                   double(limits.sessionMemoryBudgetBytes);
  return double(probe()) > ceiling * 0.8;
}

size_t TerminalSessionManager::runReclamation() {
  size_t reclaimed = reapExitedSessions();
  reclaimed += reclaimIdleSessions(limits.idleTimeoutMs);
  if (isUnderMemoryPressure()) {
    LOG(WARNING) << "Memory usage is high, reclaiming sessions idle for more "
                    "than "
                 << limits.aggressiveTimeoutMs << "ms";
    reclaimed += reclaimIdleSessions(limits.aggressiveTimeoutMs);
  }
  if (reclaimed) {
    LOG(INFO) << "Reclaimed " << reclaimed << " terminal(s)";
  }
  return reclaimed;
}

json TerminalSessionManager::getResourceUsage() const {
  size_t total = 0;
  size_t active = 0;
  set<string> users;
  function<int64_t()> probe;
  {
    lock_guard<std::mutex> guard(managerMutex);
    probe = memoryProbe;
    total = sessions.size();
    for (const auto& it : sessions) {
      lock_guard<std::mutex> sessionGuard(it.second->sessionMutex);
      users.insert(it.second->info.uuid);
      if (it.second->info.isActive) {
        active++;
      }
    }
  }
  return {{"totalTerminals", total},
          {"activeTerminals", active},
          {"usersWithTerminals", users.size()},
          {"memoryUsageBytes", probe()},
          {"limits",
           {{"maxTerminalsPerUser", limits.maxTerminalsPerUser},
            {"maxGlobalTerminals", limits.maxGlobalTerminals},
            {"sessionMemoryBudgetBytes", limits.sessionMemoryBudgetBytes}}}};
}

void TerminalSessionManager::shutdown() {
  map<string, shared_ptr<Session>> removed;
  {
    lock_guard<std::mutex> guard(managerMutex);
    removed.swap(sessions);
  }
  for (auto& it : removed) {
    stopSession(it.second);
  }
}

shared_ptr<UserTerminal> TerminalSessionManager::spawnDefaultTerminal(
    const winsize& size) {
  try {
    auto pty = make_shared<PseudoUserTerminal>();
    pty->setup(size);
    return pty;
  } catch (const BridgeException& be) {
    LOG(WARNING) << "No pty available (" << be.what()
                 << "), falling back to pipes";
  }
  auto pipeTerminal = make_shared<PipeUserTerminal>();
  pipeTerminal->setup(size);
  return pipeTerminal;
}

int64_t TerminalSessionManager::residentMemoryBytes() {
  std::ifstream statm("/proc/self/statm");
  int64_t totalPages = 0, residentPages = 0;
  if (!(statm >> totalPages >> residentPages)) {
    return 0;
  }
  return residentPages * int64_t(sysconf(_SC_PAGESIZE));
}
}  // namespace sb
