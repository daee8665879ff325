#include "CommandHistory.hpp"

namespace sb {
json HistoryEntry::toJson() const {
  json j = {{"command", command},     {"args", args},
            {"timestamp", timestamp}, {"output", output},
            {"error", error},         {"duration", duration}};
  j["exitCode"] = exitCode ? json(*exitCode) : json(nullptr);
  return j;
}

json CommandLedger::toJson() const {
  json entries = json::array();
  for (const auto& entry : commands) {
    entries.push_back(entry.toJson());
  }
  return {{"uuid", uuid},
          {"terminalId", terminalId},
          {"tool", tool},
          {"commands", entries}};
}

CommandHistory::CommandHistory(size_t _maxHistorySize)
    : maxHistorySize(_maxHistorySize) {}

void CommandHistory::addCommand(const string& uuid, const string& terminalId,
                                const CommandInfo& commandInfo,
                                const string& output, const string& error,
                                optional<int> exitCode, int64_t duration) {
  HistoryEntry entry;
  entry.command = commandInfo.command;
  entry.args = commandInfo.args;
  entry.timestamp = commandInfo.timestamp;
  entry.exitCode = exitCode;
  entry.output = output;
  entry.error = error;
  entry.duration = duration;

  lock_guard<std::mutex> guard(historyMutex);
  auto& terminalLedger = terminalHistories[uuid][terminalId];
  if (terminalLedger.uuid.empty()) {
    terminalLedger.uuid = uuid;
    terminalLedger.terminalId = terminalId;
    terminalLedger.tool = "terminal";
  }
  append(terminalLedger, entry);

  if (commandInfo.tool) {
    auto& toolLedger = toolHistories[uuid][*commandInfo.tool];
    if (toolLedger.uuid.empty()) {
      toolLedger.uuid = uuid;
      toolLedger.terminalId = "all";
      toolLedger.tool = *commandInfo.tool;
    }
    append(toolLedger, entry);
  }
}

void CommandHistory::append(CommandLedger& ledger, const HistoryEntry& entry) {
  ledger.commands.push_back(entry);
  while (ledger.commands.size() > maxHistorySize) {
    ledger.commands.pop_front();
  }
}

optional<CommandLedger> CommandHistory::getTerminalHistory(
    const string& uuid, const string& terminalId) const {
  lock_guard<std::mutex> guard(historyMutex);
  auto user = terminalHistories.find(uuid);
  if (user == terminalHistories.end()) {
    return std::nullopt;
  }
  auto it = user->second.find(terminalId);
  if (it == user->second.end()) {
    return std::nullopt;
  }
  return it->second;
}

optional<CommandLedger> CommandHistory::getToolHistory(
    const string& uuid, const string& tool) const {
  lock_guard<std::mutex> guard(historyMutex);
  auto user = toolHistories.find(uuid);
  if (user == toolHistories.end()) {
    return std::nullopt;
  }
  auto it = user->second.find(tool);
  if (it == user->second.end()) {
    return std::nullopt;
  }
  return it->second;
}

vector<CommandLedger> CommandHistory::getUserToolHistories(
    const string& uuid) const {
  lock_guard<std::mutex> guard(historyMutex);
  vector<CommandLedger> ledgers;
  auto user = toolHistories.find(uuid);
  if (user != toolHistories.end()) {
    for (const auto& it : user->second) {
      ledgers.push_back(it.second);
    }
  }
  return ledgers;
}

vector<HistoryEntry> CommandHistory::getRecentCommands(const string& uuid,
                                                       const string& tool,
                                                       size_t limit) const {
  auto ledger = getToolHistory(uuid, tool);
  if (!ledger) {
    return {};
  }
  size_t start =
      ledger->commands.size() > limit ? ledger->commands.size() - limit : 0;
  return vector<HistoryEntry>(ledger->commands.begin() + start,
                              ledger->commands.end());
}

void CommandHistory::clearUserHistory(const string& uuid) {
  lock_guard<std::mutex> guard(historyMutex);
  terminalHistories.erase(uuid);
  toolHistories.erase(uuid);
}

void CommandHistory::clearToolHistory(const string& uuid, const string& tool) {
  lock_guard<std::mutex> guard(historyMutex);
  auto user = toolHistories.find(uuid);
  if (user != toolHistories.end()) {
    user->second.erase(tool);
  }
}

json CommandHistory::getHistoryStats(const string& uuid) const {
  struct Activity {
    string tool;
    size_t count;
    int64_t lastUsed;
  };
  vector<Activity> activity;
  size_t totalCommands = 0;
  json toolUsage = json::object();

  for (const auto& ledger : getUserToolHistories(uuid)) {
    size_t count = ledger.commands.size();
    totalCommands += count;
    toolUsage[ledger.tool] = count;
    if (count > 0) {
      activity.push_back({ledger.tool, count, ledger.commands.back().timestamp});
    }
  }
  std::stable_sort(activity.begin(), activity.end(),
                   [](const Activity& a, const Activity& b) {
                     return a.lastUsed > b.lastUsed;
                   });

  json recentActivity = json::array();
  for (const auto& it : activity) {
    recentActivity.push_back(
        {{"tool", it.tool}, {"count", it.count}, {"lastUsed", it.lastUsed}});
  }
  return {{"totalCommands", totalCommands},
          {"toolUsage", toolUsage},
          {"recentActivity", recentActivity}};
}
}  // namespace sb
