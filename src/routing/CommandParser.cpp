#include "CommandParser.hpp"

namespace sb {
json CommandInfo::toJson() const {
  json j = {{"command", command},
            {"args", args},
            {"isAgentTool", isAgentTool},
            {"category", toolCategoryName(category)},
            {"timestamp", timestamp}};
  j["tool"] = tool ? json(*tool) : json(nullptr);
  j["toolInfo"] = toolInfo ? toolInfo->toJson() : json(nullptr);
  return j;
}

CommandParser::CommandParser(shared_ptr<ToolRegistry> _registry)
    : registry(_registry),
      agentTools({"claude-code", "gemini", "cursor", "codeium", "copilot"}) {}

CommandInfo CommandParser::parseCommand(const string& commandLine) const {
  CommandInfo info;
  info.timestamp = nowMillis();

  auto parts = tokenize(trim(commandLine));
  if (parts.empty()) {
    return info;
  }
  info.command = parts[0];
  info.args.assign(parts.begin() + 1, parts.end());

  auto tool = resolveTool(info.command, info.args);
  if (!tool) {
    return info;
  }
  info.tool = tool;
  info.toolInfo = registry->getTool(*tool);
  if (info.toolInfo) {
    info.category = info.toolInfo->category;
  }
  info.isAgentTool = isAgentTool(*tool);
  VLOG(2) << "Parsed " << info.command << " as " << *tool << " ("
          << toolCategoryName(info.category) << ")";
  return info;
}

vector<string> CommandParser::tokenize(const string& commandLine) {
  vector<string> parts;
  string current;
  bool escaped = false;
  char quoteChar = 0;

  for (char c : commandLine) {
    if (escaped) {
      current += c;
      escaped = false;
      continue;
    }
    if (c == '\\') {
      escaped = true;
      continue;
    }
    if (quoteChar) {
      if (c == quoteChar) {
        quoteChar = 0;
      } else {
        current += c;
      }
    } else if (c == '"' || c == '\'') {
      quoteChar = c;
    } else if (c == ' ' || c == '\t') {
      if (!current.empty()) {
        parts.push_back(current);
        current.clear();
      }
    } else {
      current += c;
    }
  }
  if (!current.empty()) {
    parts.push_back(current);
  }
  return parts;
}

optional<string> CommandParser::resolveTool(const string& command,
                                            const vector<string>& args) const {
  if (registry->hasTool(command)) {
    return command;
  }
  for (auto candidate : {checkAliases(command),
                         checkCompoundCommands(command, args),
                         checkSystemCommands(command)}) {
    if (candidate && registry->hasTool(*candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

optional<string> CommandParser::checkAliases(const string& command) {
  static const map<string, string> aliases = {
      {"g", "git"},
      {"gitk", "git"},
      {"npm", "node"},
      {"npx", "node"},
      {"yarn", "node"},
      {"pnpm", "node"},
      {"pip", "python"},
      {"pip3", "python"},
      {"python3", "python"},
      {"py", "python"},
      {"docker-compose", "docker"},
      {"docker-machine", "docker"},
      {"mysql-client", "mysql"},
      {"postgresql", "psql"},
      {"pg", "psql"},
      {"redis", "redis-cli"},
  };
  auto it = aliases.find(command);
  if (it == aliases.end()) {
    return std::nullopt;
  }
  return it->second;
}

optional<string> CommandParser::checkCompoundCommands(
    const string& command, const vector<string>& args) {
  if (args.empty()) {
    return std::nullopt;
  }
  if (command == "docker" && args[0] == "compose") {
    return string("docker");
  }
  if (command == "git") {
    return string("git");
  }
  if (command == "npm" || command == "yarn" || command == "pnpm") {
    return string("node");
  }
  if (command == "pip" || command == "pip3") {
    return string("python");
  }
  return std::nullopt;
}

optional<string> CommandParser::checkSystemCommands(const string& command) {
  static const map<string, string> systemCommands = {
      {"code", "code"},   {"vim", "vim"},     {"nvim", "vim"},
      {"emacs", "emacs"}, {"nano", "nano"},   {"ssh", "ssh"},
      {"scp", "ssh"},     {"rsync", "rsync"}, {"grep", "grep"},
      {"sed", "sed"},     {"awk", "awk"},     {"find", "find"},
      {"ls", "ls"},       {"cat", "cat"},     {"less", "less"},
      {"more", "less"},   {"tail", "tail"},   {"head", "head"},
  };
  auto it = systemCommands.find(command);
  if (it == systemCommands.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool CommandParser::isAgentTool(const string& name) const {
  lock_guard<std::mutex> guard(agentMutex);
  return agentTools.find(name) != agentTools.end();
}

void CommandParser::addAgentTool(const string& name) {
  lock_guard<std::mutex> guard(agentMutex);
  agentTools.insert(name);
}

void CommandParser::removeAgentTool(const string& name) {
  lock_guard<std::mutex> guard(agentMutex);
  agentTools.erase(name);
}

vector<string> CommandParser::getAgentTools() const {
  lock_guard<std::mutex> guard(agentMutex);
  return vector<string>(agentTools.begin(), agentTools.end());
}
}  // namespace sb
