#ifndef __SB_COMMAND_ROUTING_ENGINE_HPP__
#define __SB_COMMAND_ROUTING_ENGINE_HPP__

#include "BridgeException.hpp"
#include "CommandHistory.hpp"
#include "CommandParser.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "OutputFormatter.hpp"
#include "SubprocessUtils.hpp"
#include "ToolRegistry.hpp"

namespace sb {
enum class ResponseFormat { Streaming, Batch, Json };
enum class InterceptMode { Full, Commands, None };

/**
 * @brief How an interactive agent tool is launched and supervised.
 */
struct AgentToolConfig {
  string name;
  string executable;
  /** @brief Prepended to the arguments typed by the user. */
  vector<string> args;
  InterceptMode interceptMode = InterceptMode::Full;
  ResponseFormat responseFormat = ResponseFormat::Streaming;
  optional<int> maxTokens;
  /** @brief Budget in milliseconds before the child is killed. */
  int64_t timeout = 300000;

  json toJson() const;
  /**
   * @brief Reads a config posted by a client.
   * @throws BridgeException (MalformedFrame) on missing or invalid fields.
   */
  static AgentToolConfig fromJson(const string& toolName, const json& j);
};

/**
 * @brief Outcome of one routed command line.
 */
struct RouteResult {
  bool success = false;
  /** @brief False when the line fell through to the plain shell. */
  bool handled = false;
  string output;
  string error;
  optional<int> exitCode;
  optional<BridgeErrorCode> errorCode;
  CommandInfo commandInfo;

  json toJson() const;
};

/**
 * @brief Receives live notifications from routed commands. Called from the
 * thread that runs `route()`.
 */
class RoutingEventHandler {
 public:
  virtual ~RoutingEventHandler() {}

  virtual void onAgentOutput(const string& uuid, const string& terminalId,
                             const string& tool, const string& chunk,
                             bool isStderr) = 0;
  virtual void onCommandRouted(const string& uuid, const string& terminalId,
                               const RouteResult& result,
                               int64_t duration) = 0;
};

/**
 * @brief Turns command lines into supervised child processes.
 *
 * Agent tools run with a timeout and optional live output, installed tools
 * run directly without a shell and everything else goes through `sh -c`.
 * Every execution is recorded in the command history.
 */
class CommandRoutingEngine {
 public:
  CommandRoutingEngine(shared_ptr<ToolRegistry> _registry,
                       shared_ptr<SubprocessUtils> _subprocessUtils,
                       size_t maxHistorySize = 1000);

  /** @brief Not owned; pass NULL to detach. */
  void setEventHandler(RoutingEventHandler* handler);

  CommandInfo parse(const string& commandLine) const;

  /**
   * @brief Classifies and runs a command line, blocking until it finishes.
   * Never throws; failures come back in the result.
   */
  RouteResult route(const string& uuid, const string& terminalId,
                    const string& commandLine,
                    const optional<string>& workingDirectory = std::nullopt);

  /** @brief Sends SIGTERM to every routed process running for the slot. */
  bool killProcess(const string& terminalId);
  bool killProcess(const string& uuid, const string& terminalId);
  /** @brief Kills the processes of a token and forgets its history. */
  void cleanup(const string& uuid);

  /** @brief [{uuid, terminalId, tool, pid, startedAt}] */
  json getActiveProcesses() const;
  size_t getActiveProcessCount() const;

  void addAgentTool(const string& name, const AgentToolConfig& config);
  bool removeAgentTool(const string& name);
  optional<AgentToolConfig> getAgentConfig(const string& name) const;

  CommandHistory& getHistory() { return history; }
  shared_ptr<CommandParser> getParser() { return parser; }
  shared_ptr<ToolRegistry> getRegistry() { return registry; }
  const OutputFormatter& getOutputFormatter() const { return formatter; }

  /** @brief Time between SIGTERM and SIGKILL when a command times out. */
  void setKillGraceMs(int64_t grace) { killGraceMs = grace; }

 protected:
  struct ActiveProcess {
    string uuid;
    string terminalId;
    string tool;
    int64_t startedAt;
    shared_ptr<ChildProcess> child;
    bool killed;
  };

  struct ExecutionPlan {
    string executable;
    vector<string> args;
    map<string, string> env;
    optional<int64_t> timeoutMs;
    bool streaming = false;
    bool handled = false;
    string failurePrefix;
  };

  shared_ptr<ToolRegistry> registry;
  shared_ptr<SubprocessUtils> subprocessUtils;
  shared_ptr<CommandParser> parser;
  CommandHistory history;
  OutputFormatter formatter;

  mutable std::mutex engineMutex;
  map<string, AgentToolConfig> agentConfigs;
  map<uint64_t, ActiveProcess> activeProcesses;
  uint64_t nextProcessId;
  RoutingEventHandler* eventHandler;
  int64_t killGraceMs;

  RouteResult routeToAgentTool(const string& uuid, const string& terminalId,
                               const CommandInfo& commandInfo,
                               const optional<string>& workingDirectory);
  RouteResult routeToStandardTool(const string& uuid, const string& terminalId,
                                  const CommandInfo& commandInfo,
                                  const optional<string>& workingDirectory);
  RouteResult routeToSystemShell(const string& uuid, const string& terminalId,
                                 const CommandInfo& commandInfo,
                                 const string& commandLine,
                                 const optional<string>& workingDirectory);

  /**
   * @brief Spawns, registers and pumps one child. Output is returned raw in
   * the result; callers apply formatting.
   */
  RouteResult execute(const string& uuid, const string& terminalId,
                      const CommandInfo& commandInfo, const ExecutionPlan& plan,
                      const optional<string>& workingDirectory);

  void emitAgentOutput(const string& uuid, const string& terminalId,
                       const string& tool, const string& chunk, bool isStderr);
};
}  // namespace sb

#endif  // __SB_COMMAND_ROUTING_ENGINE_HPP__
