#include "CommandParser.hpp"
#include "TestHeaders.hpp"

using namespace sb;

namespace {
shared_ptr<CommandParser> makeParser() {
  shared_ptr<SubprocessUtils> subprocessUtils(new SubprocessUtils());
  shared_ptr<ToolRegistry> registry(new ToolRegistry(subprocessUtils));
  return shared_ptr<CommandParser>(new CommandParser(registry));
}
}  // namespace

TEST_CASE("Registry names resolve to themselves", "[CommandParser]") {
  auto parser = makeParser();
  auto info = parser->parseCommand("git status");

  REQUIRE(info.command == "git");
  REQUIRE(info.args == vector<string>{"status"});
  REQUIRE(info.tool);
  REQUIRE(*info.tool == "git");
  REQUIRE(info.category == ToolCategory::Development);
  REQUIRE_FALSE(info.isAgentTool);
  REQUIRE(info.toolInfo);
  REQUIRE(info.toolInfo->displayName == "Git");
  REQUIRE(info.timestamp > 0);
}

TEST_CASE("Blank input has no command and no tool", "[CommandParser]") {
  auto parser = makeParser();
  for (auto line : {"", "   ", "\t\r\n"}) {
    auto info = parser->parseCommand(line);
    REQUIRE(info.command.empty());
    REQUIRE(info.args.empty());
    REQUIRE_FALSE(info.tool);
    REQUIRE(info.category == ToolCategory::Unknown);
  }
}

TEST_CASE("Aliases map onto registry tools", "[CommandParser]") {
  auto parser = makeParser();

  auto npm = parser->parseCommand("npm install express");
  REQUIRE(npm.tool);
  REQUIRE(*npm.tool == "node");
  REQUIRE(npm.command == "npm");

  auto pip = parser->parseCommand("pip3 install requests");
  REQUIRE(pip.tool);
  REQUIRE(*pip.tool == "python");

  auto pg = parser->parseCommand("pg -h localhost");
  REQUIRE(pg.tool);
  REQUIRE(*pg.tool == "psql");
  REQUIRE(pg.category == ToolCategory::Database);
}

TEST_CASE("Compound commands resolve on the first argument",
          "[CommandParser]") {
  auto parser = makeParser();
  auto info = parser->parseCommand("docker compose up -d");

  REQUIRE(info.tool);
  REQUIRE(*info.tool == "docker");
  REQUIRE(info.category == ToolCategory::Devops);
  REQUIRE(info.args.size() == 3);
}

TEST_CASE("Utilities outside the registry stay unresolved",
          "[CommandParser]") {
  auto parser = makeParser();

  // The utility table maps these, but the registry does not know them
  auto ls = parser->parseCommand("ls -la");
  REQUIRE(ls.command == "ls");
  REQUIRE_FALSE(ls.tool);
  REQUIRE(ls.category == ToolCategory::Unknown);

  auto unknown = parser->parseCommand("frobnicate --now");
  REQUIRE_FALSE(unknown.tool);
  REQUIRE_FALSE(unknown.isAgentTool);
}

TEST_CASE("Agent tools are flagged", "[CommandParser]") {
  auto parser = makeParser();
  auto info = parser->parseCommand("gemini \"explain this\"");

  REQUIRE(info.tool);
  REQUIRE(*info.tool == "gemini");
  REQUIRE(info.isAgentTool);
  REQUIRE(info.category == ToolCategory::Ai);
  REQUIRE(info.args == vector<string>{"explain this"});

  parser->removeAgentTool("gemini");
  REQUIRE_FALSE(parser->parseCommand("gemini hi").isAgentTool);
  parser->addAgentTool("gemini");
  REQUIRE(parser->isAgentTool("gemini"));
}

TEST_CASE("Tokenize groups quotes and honours escapes", "[CommandParser]") {
  REQUIRE(CommandParser::tokenize("git commit -m \"fix the bug\"") ==
          vector<string>{"git", "commit", "-m", "fix the bug"});
  REQUIRE(CommandParser::tokenize("echo 'a \"b\" c'") ==
          vector<string>{"echo", "a \"b\" c"});
  REQUIRE(CommandParser::tokenize("echo a\\ b") ==
          vector<string>{"echo", "a b"});
  REQUIRE(CommandParser::tokenize("  ls\t -l  ") ==
          vector<string>{"ls", "-l"});
  REQUIRE(CommandParser::tokenize("").empty());
}

TEST_CASE("CommandInfo serializes unresolved tools as null",
          "[CommandParser]") {
  auto parser = makeParser();
  auto j = parser->parseCommand("frobnicate").toJson();

  REQUIRE(j["command"] == "frobnicate");
  REQUIRE(j["tool"].is_null());
  REQUIRE(j["toolInfo"].is_null());
  REQUIRE(j["category"] == "unknown");
  REQUIRE(j["isAgentTool"] == false);
}
