#include "BridgeServer.hpp"

#include <regex>

namespace sb {
namespace {
const set<string> AUTHENTICATED_KINDS = {
    "terminal_input",  "terminal_resize",    "terminal_create",
    "terminal_close",  "terminal_list",      "terminal_broadcast",
    "command_route",   "command_parse",      "command_history",
    "tool_history",    "command_kill",
};

string stringField(const json& frame, const char* key) {
  auto it = frame.find(key);
  if (it == frame.end() || !it->is_string()) {
    return "";
  }
  return it->get<string>();
}

optional<string> optionalStringField(const json& frame, const char* key) {
  auto it = frame.find(key);
  if (it == frame.end() || !it->is_string() || it->get<string>().empty()) {
    return std::nullopt;
  }
  return it->get<string>();
}

json terminalListJson(const vector<TerminalSessionInfo>& sessions) {
  json terminals = json::array();
  for (const auto& session : sessions) {
    terminals.push_back(session.toJson());
  }
  return terminals;
}
}  // namespace

BridgeServer::BridgeServer(shared_ptr<TerminalSessionManager> _terminalManager,
                           shared_ptr<CommandRoutingEngine> _routingEngine,
                           shared_ptr<SessionStore> _sessionStore,
                           const BridgeServerOptions& _options)
    : terminalManager(_terminalManager),
      routingEngine(_routingEngine),
      sessionStore(_sessionStore),
      options(_options),
      routingThreadPool(new ThreadPool(max(1, _options.routingThreads))) {
  terminalManager->setEventHandler(this);
  routingEngine->setEventHandler(this);
}

BridgeServer::~BridgeServer() {
  shutdown();
  terminalManager->setEventHandler(NULL);
  routingEngine->setEventHandler(NULL);
}

bool BridgeServer::isValidUuid(const string& uuid) {
  static const std::regex UUID_REGEX(
      "^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$",
      std::regex::icase);
  return std::regex_match(uuid, UUID_REGEX);
}

void BridgeServer::onConnect(shared_ptr<ClientChannel> channel) {
  auto client = make_shared<ConnectedClient>();
  client->channel = channel;
  client->connectedAt = client->lastHeartbeat = nowMillis();
  {
    lock_guard<recursive_mutex> guard(classMutex);
    clients[channel->getId()] = client;
  }
  LOG(INFO) << "New connection " << channel->getId() << " from "
            << channel->getRemoteAddress();

  sendFrame(channel, {{"type", "ping"}});

  if (options.autoAuth) {
    string uuid = sole::uuid4().str();
    VLOG(1) << "Auto-authenticating connection " << channel->getId()
            << " as " << uuid;
    bindToken(client, uuid);
  }
}

void BridgeServer::onFrame(uint64_t channelId, const string& text) {
  auto client = getClient(channelId);
  if (!client) {
    LOG(WARNING) << "Frame for unknown connection " << channelId;
    return;
  }

  json frame;
  try {
    frame = json::parse(text);
  } catch (const json::exception& e) {
    LOG(WARNING) << "Invalid frame from " << channelId << ": " << e.what();
    sendError(client->channel, "Invalid message format");
    return;
  }
  if (!frame.is_object()) {
    sendError(client->channel, "Invalid message format");
    return;
  }

  try {
    dispatch(client, frame);
  } catch (const json::exception& e) {
    LOG(WARNING) << "Malformed " << stringField(frame, "type")
                 << " frame from " << channelId << ": " << e.what();
    sendError(client->channel, "Invalid message format");
  }
}

void BridgeServer::dispatch(const shared_ptr<ConnectedClient>& client,
                            const json& frame) {
  const auto& channel = client->channel;
  string type = stringField(frame, "type");

  if (type == "auth") {
    handleAuth(client, frame);
    return;
  }
  if (type == "ping") {
    sendFrame(channel, {{"type", "pong"}});
    return;
  }
  if (type == "pong") {
    lock_guard<recursive_mutex> guard(classMutex);
    client->lastHeartbeat = nowMillis();
    return;
  }
  if (AUTHENTICATED_KINDS.find(type) == AUTHENTICATED_KINDS.end()) {
    LOG(WARNING) << "Unknown message type: " << type;
    return;
  }

  auto uuid = tokenFor(client);
  if (!uuid) {
    sendError(channel, "Not authenticated");
    return;
  }

  if (type == "terminal_input") {
    handleTerminalInput(channel, *uuid, frame);
  } else if (type == "terminal_resize") {
    handleTerminalResize(channel, *uuid, frame);
  } else if (type == "terminal_create") {
    handleTerminalCreate(channel, *uuid, frame);
  } else if (type == "terminal_close") {
    handleTerminalClose(channel, *uuid, frame);
  } else if (type == "terminal_list") {
    handleTerminalList(channel, *uuid);
  } else if (type == "terminal_broadcast") {
    handleTerminalBroadcast(channel, *uuid, frame);
  } else if (type == "command_route") {
    handleCommandRoute(channel, *uuid, frame);
  } else if (type == "command_parse") {
    handleCommandParse(channel, frame);
  } else if (type == "command_history") {
    handleCommandHistory(channel, *uuid, frame);
  } else if (type == "tool_history") {
    handleToolHistory(channel, *uuid, frame);
  } else if (type == "command_kill") {
    handleCommandKill(channel, *uuid, frame);
  }
}

void BridgeServer::onDisconnect(uint64_t channelId) {
  string uuid;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    auto it = clients.find(channelId);
    if (it == clients.end()) {
      return;
    }
    if (it->second->authenticated) {
      uuid = it->second->uuid;
      auto tokenIt = tokenToChannel.find(uuid);
      if (tokenIt != tokenToChannel.end() && tokenIt->second == channelId) {
        tokenToChannel.erase(tokenIt);
      }
    }
    clients.erase(it);
  }
  LOG(INFO) << "Connection " << channelId << " closed"
            << (uuid.empty() ? string() : " (token " + uuid + ")");
  if (!uuid.empty()) {
    sessionStore->updateSessionStatus(uuid, SessionStatus::Inactive);
  }
}

void BridgeServer::handleAuth(const shared_ptr<ConnectedClient>& client,
                              const json& frame) {
  string uuid = stringField(frame, "uuid");
  if (uuid.empty()) {
    sendFrame(client->channel, {{"type", "auth_error"}, {"data", "Invalid UUID"}});
    return;
  }
  if (!isValidUuid(uuid)) {
    sendFrame(client->channel,
              {{"type", "auth_error"}, {"data", "Invalid UUID format"}});
    return;
  }
  bindToken(client, uuid);
}

void BridgeServer::bindToken(const shared_ptr<ConnectedClient>& client,
                             const string& uuid) {
  const auto& channel = client->channel;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (client->authenticated) {
      sendFrame(channel,
                {{"type", "auth_error"}, {"data", "Already authenticated"}});
      return;
    }
    if (tokenToChannel.find(uuid) != tokenToChannel.end()) {
      sendFrame(channel,
                {{"type", "auth_error"}, {"data", "UUID already in use"}});
      return;
    }
    tokenToChannel[uuid] = channel->getId();
    client->uuid = uuid;
    client->authenticated = true;
    client->lastHeartbeat = nowMillis();
  }

  auto record = sessionStore->getSessionByUuid(uuid);
  if (!record) {
    record = sessionStore->createSession(uuid);
  } else {
    sessionStore->updateSessionStatus(uuid, SessionStatus::Active);
  }

  if (terminalManager->listByToken(uuid).empty()) {
    try {
      terminalManager->create(uuid, std::nullopt, string("Terminal 1"),
                              string("blue"));
    } catch (const BridgeException& e) {
      LOG(WARNING) << "Could not create the first terminal for " << uuid
                   << ": " << e.what();
      sendFrame(channel, {{"type", "terminal_create_error"},
                          {"data",
                           {{"message", e.what()},
                            {"type", bridgeErrorCodeName(e.getCode())}}}});
    }
  }

  LOG(INFO) << "Client authenticated with UUID: " << uuid;
  sendFrame(channel, {{"type", "auth_success"},
                      {"uuid", uuid},
                      {"data",
                       {{"uuid", uuid},
                        {"sessionId", record->id},
                        {"timestamp", nowMillis()}}}});
  handleTerminalList(channel, uuid);
}

void BridgeServer::handleTerminalInput(const shared_ptr<ClientChannel>& channel,
                                       const string& uuid, const json& frame) {
  string terminalId = stringField(frame, "terminalId");
  if (terminalId.empty()) {
    sendError(channel, "Terminal ID required for input");
    return;
  }
  auto data = frame.find("data");
  if (data == frame.end() || !data->is_string()) {
    sendError(channel, "Terminal input must be a string");
    return;
  }
  if (terminalManager->write(uuid, terminalId, data->get<string>())) {
    sessionStore->updateSessionActivity(uuid);
  } else if (!terminalManager->getSession(uuid, terminalId)) {
    sendError(channel, "Terminal not found: " + terminalId);
  } else {
    sendError(channel, "Failed to write to terminal: " + terminalId);
  }
}

void BridgeServer::handleTerminalResize(
    const shared_ptr<ClientChannel>& channel, const string& uuid,
    const json& frame) {
  string terminalId = stringField(frame, "terminalId");
  if (terminalId.empty()) {
    sendError(channel, "Terminal ID required for resize");
    return;
  }
  auto data = frame.find("data");
  if (data == frame.end() || !data->is_object() ||
      !data->contains("cols") || !data->contains("rows") ||
      !(*data)["cols"].is_number_integer() ||
      !(*data)["rows"].is_number_integer()) {
    sendError(channel, "Terminal resize requires integer cols and rows");
    return;
  }
  // get<int> on an out of range value is undefined, so bound it as int64
  int64_t cols = (*data)["cols"].get<int64_t>();
  int64_t rows = (*data)["rows"].get<int64_t>();
  if (cols <= 0 || rows <= 0 || cols > 0xFFFF || rows > 0xFFFF) {
    sendError(channel, "Terminal size out of range: " + to_string(cols) + "x" +
                           to_string(rows));
    return;
  }
  if (!terminalManager->resize(uuid, terminalId, int(cols), int(rows))) {
    sendError(channel, "Failed to resize terminal: " + terminalId);
  }
}

void BridgeServer::handleTerminalCreate(
    const shared_ptr<ClientChannel>& channel, const string& uuid,
    const json& frame) {
  optional<string> name;
  optional<string> color;
  auto data = frame.find("data");
  if (data != frame.end() && data->is_object()) {
    name = optionalStringField(*data, "name");
    color = optionalStringField(*data, "color");
  }

  try {
    auto session = terminalManager->create(
        uuid, optionalStringField(frame, "terminalId"), name, color);
    sendFrame(channel, {{"type", "terminal_created"},
                        {"terminalId", session.terminalId},
                        {"data",
                         {{"id", session.id},
                          {"terminalId", session.terminalId},
                          {"name", session.name},
                          {"color", session.color},
                          {"createdAt", session.createdAt}}}});
  } catch (const BridgeException& e) {
    LOG(WARNING) << "Terminal creation failed for " << uuid << ": "
                 << e.what();
    sendFrame(channel, {{"type", "terminal_create_error"},
                        {"data",
                         {{"message", e.what()},
                          {"type", bridgeErrorCodeName(e.getCode())}}}});
  }
}

void BridgeServer::handleTerminalClose(const shared_ptr<ClientChannel>& channel,
                                       const string& uuid, const json& frame) {
  string terminalId = stringField(frame, "terminalId");
  if (terminalId.empty()) {
    sendError(channel, "Terminal ID required for close");
    return;
  }
  routingEngine->killProcess(uuid, terminalId);
  bool success = terminalManager->terminate(uuid, terminalId);
  sendFrame(channel,
            {{"type", "terminal_closed"},
             {"terminalId", terminalId},
             {"data", {{"success", success}, {"terminalId", terminalId}}}});
}

void BridgeServer::handleTerminalList(const shared_ptr<ClientChannel>& channel,
                                      const string& uuid) {
  sendFrame(channel,
            {{"type", "terminal_list"},
             {"data",
              {{"terminals",
                terminalListJson(terminalManager->listByToken(uuid))}}}});
}

void BridgeServer::handleTerminalBroadcast(
    const shared_ptr<ClientChannel>& channel, const string& uuid,
    const json& frame) {
  string terminalId = stringField(frame, "terminalId");
  if (terminalId.empty()) {
    sendError(channel, "Source terminal ID required for broadcast");
    return;
  }
  if (!terminalManager->getSession(uuid, terminalId)) {
    sendError(channel, "Source terminal not found");
    return;
  }
  json data = frame.contains("data") ? frame["data"] : json(nullptr);

  string targetTerminalId = stringField(frame, "targetTerminalId");
  if (!targetTerminalId.empty()) {
    if (!terminalManager->getSession(uuid, targetTerminalId)) {
      sendError(channel, "Target terminal not found");
      return;
    }
    sendFrame(channel, {{"type", "terminal_message"},
                        {"terminalId", targetTerminalId},
                        {"sourceTerminalId", terminalId},
                        {"data", data}});
    return;
  }

  for (const auto& session : terminalManager->listByToken(uuid)) {
    if (session.terminalId == terminalId) {
      continue;
    }
    sendFrame(channel, {{"type", "terminal_message"},
                        {"terminalId", session.terminalId},
                        {"sourceTerminalId", terminalId},
                        {"data", data}});
  }
}

void BridgeServer::handleCommandRoute(const shared_ptr<ClientChannel>& channel,
                                      const string& uuid, const json& frame) {
  string terminalId = stringField(frame, "terminalId");
  string command = stringField(frame, "command");
  if (terminalId.empty() || command.empty()) {
    sendError(channel, "Terminal ID and command are required for routing");
    return;
  }
  optional<string> workingDirectory =
      optionalStringField(frame, "workingDirectory");

  lock_guard<recursive_mutex> guard(classMutex);
  if (!routingThreadPool) {
    sendError(channel, "Server is shutting down");
    return;
  }
  routingThreadPool->enqueue([this, channel, uuid, terminalId, command,
                              workingDirectory]() {
    el::Helpers::setThreadName("command-router");
    try {
      auto result =
          routingEngine->route(uuid, terminalId, command, workingDirectory);
      sendFrame(channel, {{"type", "command_result"},
                          {"terminalId", terminalId},
                          {"data", result.toJson()}});
    } catch (const std::exception& e) {
      STERROR << "Command routing failed for " << terminalId << ": "
              << e.what();
      sendFrame(channel, {{"type", "command_error"},
                          {"terminalId", terminalId},
                          {"data", {{"error", e.what()}}}});
    }
  });
}

void BridgeServer::handleCommandParse(const shared_ptr<ClientChannel>& channel,
                                      const json& frame) {
  string command = stringField(frame, "command");
  if (command.empty()) {
    sendError(channel, "Command is required for parsing");
    return;
  }
  auto commandInfo = routingEngine->parse(command);
  sendFrame(channel, {{"type", "command_parsed"},
                      {"data", {{"commandInfo", commandInfo.toJson()}}}});
}

void BridgeServer::handleCommandHistory(
    const shared_ptr<ClientChannel>& channel, const string& uuid,
    const json& frame) {
  string terminalId = stringField(frame, "terminalId");
  if (terminalId.empty()) {
    sendError(channel, "Terminal ID is required for command history");
    return;
  }
  auto ledger = routingEngine->getHistory().getTerminalHistory(uuid, terminalId);
  sendFrame(channel,
            {{"type", "command_history_result"},
             {"terminalId", terminalId},
             {"data",
              {{"history", ledger ? ledger->toJson() : json(nullptr)}}}});
}

void BridgeServer::handleToolHistory(const shared_ptr<ClientChannel>& channel,
                                     const string& uuid, const json& frame) {
  auto& history = routingEngine->getHistory();
  string tool = stringField(frame, "tool");
  if (tool.empty()) {
    json histories = json::array();
    for (const auto& ledger : history.getUserToolHistories(uuid)) {
      histories.push_back(ledger.toJson());
    }
    sendFrame(channel, {{"type", "tool_histories_result"},
                        {"data", {{"histories", histories}}}});
    return;
  }

  auto ledger = history.getToolHistory(uuid, tool);
  auto limit = frame.find("limit");
  if (ledger && limit != frame.end() && limit->is_number_unsigned()) {
    auto recent =
        history.getRecentCommands(uuid, tool, limit->get<size_t>());
    ledger->commands.assign(recent.begin(), recent.end());
  }
  sendFrame(channel,
            {{"type", "tool_history_result"},
             {"data",
              {{"tool", tool},
               {"history", ledger ? ledger->toJson() : json(nullptr)}}}});
}

void BridgeServer::handleCommandKill(const shared_ptr<ClientChannel>& channel,
                                     const string& uuid, const json& frame) {
  string terminalId = stringField(frame, "terminalId");
  if (terminalId.empty()) {
    sendError(channel, "Terminal ID is required to kill a command");
    return;
  }
  bool success = routingEngine->killProcess(uuid, terminalId);
  sendFrame(channel, {{"type", "command_killed"},
                      {"terminalId", terminalId},
                      {"data", {{"success", success}}}});
}

size_t BridgeServer::heartbeatSweep() {
  int64_t now = nowMillis();
  vector<shared_ptr<ClientChannel>> toPing;
  vector<pair<shared_ptr<ClientChannel>, string>> evicted;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    for (auto it = clients.begin(); it != clients.end();) {
      auto client = it->second;
      if (!client->authenticated) {
        ++it;
        continue;
      }
      if (now - client->lastHeartbeat > options.heartbeatTimeoutMs) {
        evicted.push_back(make_pair(client->channel, client->uuid));
        tokenToChannel.erase(client->uuid);
        it = clients.erase(it);
        continue;
      }
      toPing.push_back(client->channel);
      ++it;
    }
  }

  for (auto& it : evicted) {
    LOG(INFO) << "Disconnecting unresponsive client: " << it.second;
    it.first->close();
    sessionStore->updateSessionStatus(it.second, SessionStatus::Inactive);
  }
  for (auto& channel : toPing) {
    sendFrame(channel, {{"type", "ping"}});
  }
  return evicted.size();
}

size_t BridgeServer::reclaimSweep() {
  vector<string> closedTokens;
  size_t removed = 0;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    for (auto it = clients.begin(); it != clients.end();) {
      auto client = it->second;
      if (client->channel->isOpen()) {
        ++it;
        continue;
      }
      if (client->authenticated) {
        closedTokens.push_back(client->uuid);
        auto tokenIt = tokenToChannel.find(client->uuid);
        if (tokenIt != tokenToChannel.end() && tokenIt->second == it->first) {
          tokenToChannel.erase(tokenIt);
        }
      }
      it = clients.erase(it);
      removed++;
    }
  }

  for (const auto& uuid : closedTokens) {
    LOG(INFO) << "Cleaning up closed connection: " << uuid;
    terminalManager->terminate(uuid);
    routingEngine->cleanup(uuid);
    sessionStore->updateSessionStatus(uuid, SessionStatus::Inactive);
  }
  size_t reclaimed = terminalManager->runReclamation();
  if (removed || reclaimed) {
    LOG(INFO) << "Reclamation removed " << removed << " connections and "
              << reclaimed << " sessions";
  }
  return removed;
}

size_t BridgeServer::getClientCount() const {
  lock_guard<recursive_mutex> guard(classMutex);
  return clients.size();
}

size_t BridgeServer::getAuthenticatedCount() const {
  lock_guard<recursive_mutex> guard(classMutex);
  return tokenToChannel.size();
}

bool BridgeServer::isTokenBound(const string& uuid) const {
  lock_guard<recursive_mutex> guard(classMutex);
  return tokenToChannel.find(uuid) != tokenToChannel.end();
}

json BridgeServer::listClients() const {
  lock_guard<recursive_mutex> guard(classMutex);
  json retval = json::array();
  for (const auto& it : clients) {
    const auto& client = it.second;
    retval.push_back({{"id", it.first},
                      {"uuid", client->authenticated ? json(client->uuid)
                                                     : json(nullptr)},
                      {"authenticated", client->authenticated},
                      {"remoteAddress", client->channel->getRemoteAddress()},
                      {"connectedAt", client->connectedAt}});
  }
  return retval;
}

void BridgeServer::shutdown() {
  vector<shared_ptr<ClientChannel>> channels;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    for (const auto& it : clients) {
      channels.push_back(it.second->channel);
    }
  }
  // Unblock routed commands so the workers can drain.
  for (const auto& process : routingEngine->getActiveProcesses()) {
    routingEngine->killProcess(process["uuid"].get<string>(),
                               process["terminalId"].get<string>());
  }
  std::unique_ptr<ThreadPool> pool;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    pool = std::move(routingThreadPool);
  }
  // Joins the workers.
  pool.reset();
  for (auto& channel : channels) {
    channel->close();
  }
  lock_guard<recursive_mutex> guard(classMutex);
  clients.clear();
  tokenToChannel.clear();
}

void BridgeServer::onTerminalCreated(const TerminalSessionInfo& info) {
  VLOG(1) << "Terminal " << info.terminalId << " (" << info.kind
          << ") created for " << info.uuid;
  sessionStore->updateSessionActivity(info.uuid);
}

void BridgeServer::onTerminalOutput(const string& uuid,
                                    const string& terminalId,
                                    const string& data) {
  sendToToken(uuid, {{"type", "terminal_output"},
                     {"terminalId", terminalId},
                     {"data", data}});
}

void BridgeServer::onTerminalExit(const string& uuid, const string& terminalId,
                                  int exitCode) {
  LOG(INFO) << "Terminal " << terminalId << " exited with code " << exitCode;
  sendToToken(uuid,
              {{"type", "terminal_exit"},
               {"terminalId", terminalId},
               {"data", {{"exitCode", exitCode}, {"terminalId", terminalId}}}});
}

void BridgeServer::onAgentOutput(const string& uuid, const string& terminalId,
                                 const string& tool, const string& chunk,
                                 bool isStderr) {
  sendToToken(uuid, {{"type", "agent_output"},
                     {"terminalId", terminalId},
                     {"data",
                      {{"tool", tool},
                       {"chunk", chunk},
                       {"type", isStderr ? "stderr" : "stdout"}}}});
}

void BridgeServer::onCommandRouted(const string& uuid, const string& terminalId,
                                   const RouteResult& result,
                                   int64_t duration) {
  sendToToken(uuid, {{"type", "command_routed"},
                     {"terminalId", terminalId},
                     {"data",
                      {{"commandInfo", result.commandInfo.toJson()},
                       {"result", result.toJson()},
                       {"duration", duration}}}});
}

shared_ptr<BridgeServer::ConnectedClient> BridgeServer::getClient(
    uint64_t channelId) const {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = clients.find(channelId);
  if (it == clients.end()) {
    return NULL;
  }
  return it->second;
}

shared_ptr<ClientChannel> BridgeServer::channelForToken(
    const string& uuid) const {
  lock_guard<recursive_mutex> guard(classMutex);
  auto tokenIt = tokenToChannel.find(uuid);
  if (tokenIt == tokenToChannel.end()) {
    return NULL;
  }
  auto it = clients.find(tokenIt->second);
  if (it == clients.end()) {
    return NULL;
  }
  return it->second->channel;
}

optional<string> BridgeServer::tokenFor(
    const shared_ptr<ConnectedClient>& client) const {
  lock_guard<recursive_mutex> guard(classMutex);
  if (!client->authenticated) {
    return std::nullopt;
  }
  return client->uuid;
}

void BridgeServer::sendFrame(const shared_ptr<ClientChannel>& channel,
                             json frame) const {
  if (!channel || !channel->isOpen()) {
    return;
  }
  if (!frame.contains("timestamp")) {
    frame["timestamp"] = nowMillis();
  }
  channel->send(frame);
}

void BridgeServer::sendError(const shared_ptr<ClientChannel>& channel,
                             const string& message) const {
  sendFrame(channel, {{"type", "error"}, {"data", message}});
}

void BridgeServer::sendToToken(const string& uuid, const json& frame) const {
  auto channel = channelForToken(uuid);
  if (!channel) {
    VLOG(2) << "No connection for " << uuid << ", dropping "
            << frame["type"].get<string>();
    return;
  }
  sendFrame(channel, frame);
}
}  // namespace sb
