#ifndef __SB_COMMAND_PARSER_HPP__
#define __SB_COMMAND_PARSER_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "ToolRegistry.hpp"

namespace sb {
/**
 * @brief Classification of one command line. Built fresh for every parse.
 */
struct CommandInfo {
  string command;
  vector<string> args;
  /** @brief Registry name of the matched tool, unset when unresolved. */
  optional<string> tool;
  optional<ToolInfo> toolInfo;
  bool isAgentTool = false;
  ToolCategory category = ToolCategory::Unknown;
  int64_t timestamp = 0;

  json toJson() const;
};

/**
 * @brief Splits command lines and maps the program onto a registry tool.
 *
 * Resolution order is: exact registry name, alias table, compound command
 * (program plus first argument), system utility table. A candidate only
 * counts if the registry knows it.
 */
class CommandParser {
 public:
  explicit CommandParser(shared_ptr<ToolRegistry> _registry);

  CommandInfo parseCommand(const string& commandLine) const;

  /**
   * @brief Shell-like word splitting. Single and double quotes group, a
   * backslash takes the next character literally, blanks separate.
   */
  static vector<string> tokenize(const string& commandLine);

  bool isAgentTool(const string& name) const;
  void addAgentTool(const string& name);
  void removeAgentTool(const string& name);
  vector<string> getAgentTools() const;

 protected:
  shared_ptr<ToolRegistry> registry;
  mutable std::mutex agentMutex;
  set<string> agentTools;

  optional<string> resolveTool(const string& command,
                               const vector<string>& args) const;
  static optional<string> checkAliases(const string& command);
  static optional<string> checkCompoundCommands(const string& command,
                                                const vector<string>& args);
  static optional<string> checkSystemCommands(const string& command);
};
}  // namespace sb

#endif  // __SB_COMMAND_PARSER_HPP__
