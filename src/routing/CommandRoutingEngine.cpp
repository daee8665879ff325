#include "CommandRoutingEngine.hpp"

namespace sb {
namespace {
const char* responseFormatName(ResponseFormat format) {
  switch (format) {
    case ResponseFormat::Streaming:
      return "streaming";
    case ResponseFormat::Batch:
      return "batch";
    case ResponseFormat::Json:
      return "json";
  }
  return "streaming";
}

const char* interceptModeName(InterceptMode mode) {
  switch (mode) {
    case InterceptMode::Full:
      return "full";
    case InterceptMode::Commands:
      return "commands";
    case InterceptMode::None:
      return "none";
  }
  return "full";
}

int64_t elapsedMs(chrono::steady_clock::time_point start) {
  return chrono::duration_cast<chrono::milliseconds>(
             chrono::steady_clock::now() - start)
      .count();
}
}  // namespace

json AgentToolConfig::toJson() const {
  json j = {{"name", name},
            {"executable", executable},
            {"args", args},
            {"interceptMode", interceptModeName(interceptMode)},
            {"responseFormat", responseFormatName(responseFormat)},
            {"timeout", timeout}};
  if (maxTokens) {
    j["maxTokens"] = *maxTokens;
  }
  return j;
}

AgentToolConfig AgentToolConfig::fromJson(const string& toolName,
                                          const json& j) {
  if (!j.is_object()) {
    throw BridgeException(BridgeErrorCode::MalformedFrame,
                          "Agent configuration must be an object");
  }
  AgentToolConfig config;
  try {
    config.name = j.value("name", toolName);
    config.executable = j.value("executable", toolName);
    config.args = j.value("args", vector<string>());
    config.timeout = j.value("timeout", int64_t(300000));
    if (j.contains("maxTokens")) {
      config.maxTokens = j["maxTokens"].get<int>();
    }

    string format = j.value("responseFormat", string("streaming"));
    if (format == "streaming") {
      config.responseFormat = ResponseFormat::Streaming;
    } else if (format == "batch") {
      config.responseFormat = ResponseFormat::Batch;
    } else if (format == "json") {
      config.responseFormat = ResponseFormat::Json;
    } else {
      throw BridgeException(BridgeErrorCode::MalformedFrame,
                            "Unknown responseFormat: " + format);
    }

    string mode = j.value("interceptMode", string("full"));
    if (mode == "full") {
      config.interceptMode = InterceptMode::Full;
    } else if (mode == "commands") {
      config.interceptMode = InterceptMode::Commands;
    } else if (mode == "none") {
      config.interceptMode = InterceptMode::None;
    } else {
      throw BridgeException(BridgeErrorCode::MalformedFrame,
                            "Unknown interceptMode: " + mode);
    }
  } catch (const json::exception& je) {
    throw BridgeException(BridgeErrorCode::MalformedFrame,
                          string("Invalid agent configuration: ") + je.what());
  }
  if (config.timeout <= 0) {
    throw BridgeException(BridgeErrorCode::MalformedFrame,
                          "Agent timeout must be positive");
  }
  return config;
}

json RouteResult::toJson() const {
  json j = {{"success", success},
            {"handled", handled},
            {"output", output},
            {"commandInfo", commandInfo.toJson()}};
  j["error"] = error.empty() ? json(nullptr) : json(error);
  j["exitCode"] = exitCode ? json(*exitCode) : json(nullptr);
  if (errorCode) {
    j["errorCode"] = bridgeErrorCodeName(*errorCode);
  }
  return j;
}

CommandRoutingEngine::CommandRoutingEngine(
    shared_ptr<ToolRegistry> _registry,
    shared_ptr<SubprocessUtils> _subprocessUtils, size_t maxHistorySize)
    : registry(_registry),
      subprocessUtils(_subprocessUtils),
      parser(new CommandParser(_registry)),
      history(maxHistorySize),
      nextProcessId(1),
      eventHandler(NULL),
      killGraceMs(2000) {
  AgentToolConfig claude;
  claude.name = "Claude Code";
  claude.executable = "claude-code";
  claude.interceptMode = InterceptMode::Full;
  claude.responseFormat = ResponseFormat::Streaming;
  claude.timeout = 300000;
  agentConfigs["claude-code"] = claude;

  AgentToolConfig gemini;
  gemini.name = "Gemini CLI";
  gemini.executable = "gemini";
  gemini.interceptMode = InterceptMode::Commands;
  gemini.responseFormat = ResponseFormat::Batch;
  gemini.timeout = 180000;
  agentConfigs["gemini"] = gemini;
}

void CommandRoutingEngine::setEventHandler(RoutingEventHandler* handler) {
  lock_guard<std::mutex> guard(engineMutex);
  eventHandler = handler;
}

CommandInfo CommandRoutingEngine::parse(const string& commandLine) const {
  return parser->parseCommand(commandLine);
}

RouteResult CommandRoutingEngine::route(
    const string& uuid, const string& terminalId, const string& commandLine,
    const optional<string>& workingDirectory) {
  auto start = chrono::steady_clock::now();
  CommandInfo commandInfo = parser->parseCommand(commandLine);
  RouteResult result;
  result.commandInfo = commandInfo;

  if (commandInfo.command.empty()) {
    result.error = "Empty command";
    result.errorCode = BridgeErrorCode::NotFound;
    return result;
  }

  try {
    if (commandInfo.isAgentTool && commandInfo.tool) {
      result =
          routeToAgentTool(uuid, terminalId, commandInfo, workingDirectory);
    } else {
      bool installed = false;
      if (commandInfo.tool) {
        auto info = registry->detectTool(*commandInfo.tool);
        commandInfo.toolInfo = info;
        installed = info.isInstalled;
      }
      if (installed) {
        result = routeToStandardTool(uuid, terminalId, commandInfo,
                                     workingDirectory);
      } else {
        result = routeToSystemShell(uuid, terminalId, commandInfo,
                                    trim(commandLine), workingDirectory);
      }
    }
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Routing " << commandInfo.command
                 << " failed: " << ex.what();
    result = RouteResult();
    result.commandInfo = commandInfo;
    result.error = ex.what();
    result.exitCode = 1;
    auto be = dynamic_cast<const BridgeException*>(&ex);
    if (be) {
      result.errorCode = be->getCode();
    }
  }

  int64_t duration = elapsedMs(start);
  history.addCommand(uuid, terminalId, result.commandInfo, result.output,
                     result.error, result.exitCode, duration);
  LOG(INFO) << "Routed '" << commandInfo.command << "' for " << terminalId
            << " handled=" << result.handled << " success=" << result.success
            << " in " << duration << "ms";

  RoutingEventHandler* handler;
  {
    lock_guard<std::mutex> guard(engineMutex);
    handler = eventHandler;
  }
  if (handler) {
    handler->onCommandRouted(uuid, terminalId, result, duration);
  }
  return result;
}

RouteResult CommandRoutingEngine::routeToAgentTool(
    const string& uuid, const string& terminalId,
    const CommandInfo& commandInfo, const optional<string>& workingDirectory) {
  auto config = getAgentConfig(*commandInfo.tool);
  if (!config) {
    RouteResult result;
    result.commandInfo = commandInfo;
    result.error = "No configuration found for agent tool: " +
                   *commandInfo.tool;
    result.errorCode = BridgeErrorCode::NotFound;
    return result;
  }

  ExecutionPlan plan;
  plan.executable = config->executable;
  plan.args = config->args;
  plan.args.insert(plan.args.end(), commandInfo.args.begin(),
                   commandInfo.args.end());
  plan.env = {{"TERM", "xterm-256color"}, {"COLUMNS", "80"}, {"LINES", "24"}};
  plan.timeoutMs = config->timeout;
  plan.streaming = (config->responseFormat == ResponseFormat::Streaming);
  plan.handled = true;
  plan.failurePrefix = "Failed to execute agent tool: ";

  RouteResult result =
      execute(uuid, terminalId, commandInfo, plan, workingDirectory);
  string raw = result.output;

  if (!plan.streaming && !result.errorCode) {
    // Batched tools deliver everything at once
    if (!raw.empty()) {
      emitAgentOutput(uuid, terminalId, *commandInfo.tool, raw, false);
    }
    if (!result.error.empty()) {
      emitAgentOutput(uuid, terminalId, *commandInfo.tool, result.error, true);
    }
  }

  if (config->responseFormat == ResponseFormat::Json) {
    json parsed = json::parse(raw, nullptr, false);
    if (!parsed.is_discarded()) {
      result.output = OutputFormatter::escapeHtml(parsed.dump(2));
      return result;
    }
  }
  result.output = formatter.formatOutput(commandInfo, raw).html;
  return result;
}

RouteResult CommandRoutingEngine::routeToStandardTool(
    const string& uuid, const string& terminalId,
    const CommandInfo& commandInfo, const optional<string>& workingDirectory) {
  ExecutionPlan plan;
  plan.executable = commandInfo.command;
  plan.args = commandInfo.args;
  plan.handled = true;
  plan.failurePrefix = "Failed to execute tool: ";

  RouteResult result =
      execute(uuid, terminalId, commandInfo, plan, workingDirectory);
  result.output = formatter.formatOutput(commandInfo, result.output).html;
  return result;
}

RouteResult CommandRoutingEngine::routeToSystemShell(
    const string& uuid, const string& terminalId,
    const CommandInfo& commandInfo, const string& commandLine,
    const optional<string>& workingDirectory) {
  ExecutionPlan plan;
  plan.executable = "sh";
  plan.args = {"-c", commandLine};
  plan.handled = false;
  plan.failurePrefix = "Failed to execute command: ";
  return execute(uuid, terminalId, commandInfo, plan, workingDirectory);
}

RouteResult CommandRoutingEngine::execute(
    const string& uuid, const string& terminalId,
    const CommandInfo& commandInfo, const ExecutionPlan& plan,
    const optional<string>& workingDirectory) {
  RouteResult result;
  result.commandInfo = commandInfo;
  result.handled = plan.handled;
  string tool = commandInfo.tool ? *commandInfo.tool : string("shell");

  shared_ptr<ChildProcess> child;
  try {
    child = subprocessUtils->spawn(plan.executable, plan.args,
                                   workingDirectory ? *workingDirectory : "",
                                   plan.env);
  } catch (const BridgeException& be) {
    result.error = plan.failurePrefix + be.what();
    result.errorCode = be.getCode();
    result.exitCode = 127;
    return result;
  }

  uint64_t processId;
  {
    lock_guard<std::mutex> guard(engineMutex);
    processId = nextProcessId++;
    activeProcesses[processId] =
        ActiveProcess{uuid, terminalId, tool, nowMillis(), child, false};
  }

  optional<chrono::steady_clock::time_point> deadline;
  if (plan.timeoutMs) {
    deadline = chrono::steady_clock::now() + chrono::milliseconds(*plan.timeoutMs);
  }
  bool finished = child->pump(
      [&](const string& chunk, bool isStderr) {
        (isStderr ? result.error : result.output) += chunk;
        if (plan.streaming) {
          emitAgentOutput(uuid, terminalId, tool, chunk, isStderr);
        }
      },
      deadline);
  // Closed pipes do not mean the child is gone
  if (finished) {
    finished = child->waitUntil(deadline);
  }

  if (!finished) {
    LOG(WARNING) << tool << " for " << terminalId << " exceeded "
                 << *plan.timeoutMs << "ms, terminating";
    child->kill(SIGTERM);
    auto graceDeadline =
        chrono::steady_clock::now() + chrono::milliseconds(killGraceMs);
    if (!child->pump([](const string&, bool) {}, graceDeadline) ||
        !child->waitUntil(graceDeadline)) {
      child->kill(SIGKILL);
    }
  }
  result.exitCode = child->wait();

  bool killed;
  {
    lock_guard<std::mutex> guard(engineMutex);
    killed = activeProcesses[processId].killed;
    activeProcesses.erase(processId);
  }

  if (!finished) {
    result.success = false;
    result.error = "Agent tool timeout after " + to_string(*plan.timeoutMs) +
                   "ms";
    result.errorCode = BridgeErrorCode::Timeout;
  } else {
    result.success = (result.exitCode && *result.exitCode == 0);
    if (killed && result.error.empty()) {
      result.error = "Process was killed";
    }
  }
  return result;
}

void CommandRoutingEngine::emitAgentOutput(const string& uuid,
                                           const string& terminalId,
                                           const string& tool,
                                           const string& chunk, bool isStderr) {
  RoutingEventHandler* handler;
  {
    lock_guard<std::mutex> guard(engineMutex);
    handler = eventHandler;
  }
  if (handler) {
    handler->onAgentOutput(uuid, terminalId, tool, chunk, isStderr);
  }
}

bool CommandRoutingEngine::killProcess(const string& terminalId) {
  lock_guard<std::mutex> guard(engineMutex);
  bool found = false;
  for (auto& it : activeProcesses) {
    if (it.second.terminalId == terminalId && !it.second.killed) {
      it.second.child->kill(SIGTERM);
      it.second.killed = true;
      found = true;
    }
  }
  return found;
}

bool CommandRoutingEngine::killProcess(const string& uuid,
                                       const string& terminalId) {
  lock_guard<std::mutex> guard(engineMutex);
  bool found = false;
  for (auto& it : activeProcesses) {
    if (it.second.uuid == uuid && it.second.terminalId == terminalId &&
        !it.second.killed) {
      it.second.child->kill(SIGTERM);
      it.second.killed = true;
      found = true;
    }
  }
  return found;
}

void CommandRoutingEngine::cleanup(const string& uuid) {
  {
    lock_guard<std::mutex> guard(engineMutex);
    for (auto& it : activeProcesses) {
      if (it.second.uuid == uuid && !it.second.killed) {
        it.second.child->kill(SIGTERM);
        it.second.killed = true;
      }
    }
  }
  history.clearUserHistory(uuid);
}

json CommandRoutingEngine::getActiveProcesses() const {
  lock_guard<std::mutex> guard(engineMutex);
  json processes = json::array();
  for (const auto& it : activeProcesses) {
    processes.push_back({{"uuid", it.second.uuid},
                         {"terminalId", it.second.terminalId},
                         {"tool", it.second.tool},
                         {"pid", it.second.child->getPid()},
                         {"startedAt", it.second.startedAt}});
  }
  return processes;
}

size_t CommandRoutingEngine::getActiveProcessCount() const {
  lock_guard<std::mutex> guard(engineMutex);
  return activeProcesses.size();
}

void CommandRoutingEngine::addAgentTool(const string& name,
                                        const AgentToolConfig& config) {
  {
    lock_guard<std::mutex> guard(engineMutex);
    agentConfigs[name] = config;
  }
  if (!registry->hasTool(name)) {
    // The parser only resolves names the registry knows about
    ToolInfo info;
    info.name = name;
    info.displayName = config.name.empty() ? name : config.name;
    info.category = ToolCategory::Ai;
    info.description = "Agent tool registered at runtime";
    registry->registerTool(info);
  }
  parser->addAgentTool(name);
  LOG(INFO) << "Registered agent tool " << name << " -> " << config.executable;
}

bool CommandRoutingEngine::removeAgentTool(const string& name) {
  bool removed;
  {
    lock_guard<std::mutex> guard(engineMutex);
    removed = agentConfigs.erase(name) > 0;
  }
  parser->removeAgentTool(name);
  return removed;
}

optional<AgentToolConfig> CommandRoutingEngine::getAgentConfig(
    const string& name) const {
  lock_guard<std::mutex> guard(engineMutex);
  auto it = agentConfigs.find(name);
  if (it == agentConfigs.end()) {
    return std::nullopt;
  }
  return it->second;
}
}  // namespace sb
