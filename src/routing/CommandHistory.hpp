#ifndef __SB_COMMAND_HISTORY_HPP__
#define __SB_COMMAND_HISTORY_HPP__

#include "CommandParser.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace sb {
struct HistoryEntry {
  string command;
  vector<string> args;
  int64_t timestamp = 0;
  optional<int> exitCode;
  string output;
  string error;
  int64_t duration = 0;

  json toJson() const;
};

/**
 * @brief Ordered, bounded log of commands for one terminal or one tool.
 */
struct CommandLedger {
  string uuid;
  /** @brief Slot id, or "all" for per-tool ledgers. */
  string terminalId;
  /** @brief Tool name, or "terminal" for per-slot ledgers. */
  string tool;
  deque<HistoryEntry> commands;

  json toJson() const;
};

/**
 * @brief Per-token command history, indexed by slot and by detected tool.
 * When a ledger grows past the maximum the oldest entries are dropped.
 */
class CommandHistory {
 public:
  explicit CommandHistory(size_t _maxHistorySize = 1000);

  void addCommand(const string& uuid, const string& terminalId,
                  const CommandInfo& commandInfo, const string& output,
                  const string& error, optional<int> exitCode,
                  int64_t duration);

  optional<CommandLedger> getTerminalHistory(const string& uuid,
                                             const string& terminalId) const;
  optional<CommandLedger> getToolHistory(const string& uuid,
                                         const string& tool) const;
  vector<CommandLedger> getUserToolHistories(const string& uuid) const;

  /** @brief Last `limit` entries of a tool ledger, oldest first. */
  vector<HistoryEntry> getRecentCommands(const string& uuid, const string& tool,
                                         size_t limit = 10) const;

  void clearUserHistory(const string& uuid);
  void clearToolHistory(const string& uuid, const string& tool);

  /** @brief {totalCommands, toolUsage, recentActivity} over tool ledgers. */
  json getHistoryStats(const string& uuid) const;

  size_t getMaxHistorySize() const { return maxHistorySize; }

 protected:
  mutable std::mutex historyMutex;
  size_t maxHistorySize;
  // uuid -> terminalId -> ledger
  map<string, map<string, CommandLedger>> terminalHistories;
  // uuid -> tool -> ledger
  map<string, map<string, CommandLedger>> toolHistories;

  void append(CommandLedger& ledger, const HistoryEntry& entry);
};
}  // namespace sb

#endif  // __SB_COMMAND_HISTORY_HPP__
