#include "CommandRoutingEngine.hpp"
#include "FakeRoutingEventHandler.hpp"
#include "TestHeaders.hpp"

using namespace sb;

namespace {
const string USER = "0b7a4bd2-8f1e-4c3a-9d52-6a1f0e2c7b11";

shared_ptr<CommandRoutingEngine> makeEngine(size_t maxHistory = 1000) {
  shared_ptr<SubprocessUtils> subprocessUtils(new SubprocessUtils());
  shared_ptr<ToolRegistry> registry(new ToolRegistry(subprocessUtils));
  return shared_ptr<CommandRoutingEngine>(
      new CommandRoutingEngine(registry, subprocessUtils, maxHistory));
}

AgentToolConfig agentConfig(const string& executable,
                            const vector<string>& args,
                            ResponseFormat format, int64_t timeout) {
  AgentToolConfig config;
  config.name = executable;
  config.executable = executable;
  config.args = args;
  config.responseFormat = format;
  config.timeout = timeout;
  return config;
}

void waitForActiveProcess(const shared_ptr<CommandRoutingEngine>& engine) {
  for (int a = 0; a < 500 && engine->getActiveProcessCount() == 0; a++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}
}  // namespace

TEST_CASE("Unknown commands fall back to the shell", "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  auto result = engine->route(USER, "t1", "echo hello | tr a-z A-Z");

  REQUIRE(result.success);
  REQUIRE_FALSE(result.handled);
  REQUIRE(result.output == "HELLO\n");
  REQUIRE(*result.exitCode == 0);
  REQUIRE_FALSE(result.commandInfo.tool);

  auto ledger = engine->getHistory().getTerminalHistory(USER, "t1");
  REQUIRE(ledger);
  REQUIRE(ledger->commands.size() == 1);
  REQUIRE(ledger->commands[0].command == "echo");
  REQUIRE(ledger->commands[0].output == "HELLO\n");
}

TEST_CASE("Shell failures keep the exit code", "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  auto result = engine->route(USER, "t1", "echo broken 1>&2; exit 4");

  REQUIRE_FALSE(result.success);
  REQUIRE(*result.exitCode == 4);
  REQUIRE(result.error == "broken\n");
  REQUIRE(*engine->getHistory()
               .getTerminalHistory(USER, "t1")
               ->commands[0]
               .exitCode == 4);
}

TEST_CASE("Commands run in the requested directory",
          "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  auto result = engine->route(USER, "t1", "pwd", string("/"));

  REQUIRE(result.output == "/\n");
}

TEST_CASE("Blank command lines are rejected without history",
          "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  auto result = engine->route(USER, "t1", "   ");

  REQUIRE_FALSE(result.success);
  REQUIRE(result.error == "Empty command");
  REQUIRE_FALSE(engine->getHistory().getTerminalHistory(USER, "t1"));
}

TEST_CASE("Streaming agents report output while running",
          "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  FakeRoutingEventHandler handler;
  engine->setEventHandler(&handler);
  engine->addAgentTool(
      "echo-agent",
      agentConfig("sh", {"-c", "echo streamed; echo oops 1>&2"},
                  ResponseFormat::Streaming, 10000));

  auto result = engine->route(USER, "t2", "echo-agent");
  engine->setEventHandler(NULL);

  REQUIRE(result.handled);
  REQUIRE(result.success);
  REQUIRE(result.commandInfo.isAgentTool);
  REQUIRE(result.commandInfo.category == ToolCategory::Ai);
  REQUIRE(handler.stdoutText() == "streamed\n");
  bool sawStderr = false;
  for (const auto& chunk : handler.getChunks()) {
    REQUIRE(chunk.tool == "echo-agent");
    REQUIRE(chunk.terminalId == "t2");
    sawStderr |= chunk.isStderr;
  }
  REQUIRE(sawStderr);
  REQUIRE(handler.getRouted().size() == 1);
  REQUIRE(engine->getHistory().getToolHistory(USER, "echo-agent"));
}

TEST_CASE("Batch agents report output once finished",
          "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  FakeRoutingEventHandler handler;
  engine->setEventHandler(&handler);
  engine->addAgentTool("batch-agent",
                       agentConfig("sh", {"-c", "echo one; echo two"},
                                   ResponseFormat::Batch, 10000));

  auto result = engine->route(USER, "t1", "batch-agent");
  engine->setEventHandler(NULL);

  auto chunks = handler.getChunks();
  REQUIRE(chunks.size() == 1);
  REQUIRE(chunks[0].chunk == "one\ntwo\n");
  REQUIRE(result.output == "one\ntwo\n");
}

TEST_CASE("Json agents are pretty printed", "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  engine->addAgentTool("json-agent",
                       agentConfig("sh", {"-c", "echo '{\"answer\":42}'"},
                                   ResponseFormat::Json, 10000));

  auto result = engine->route(USER, "t1", "json-agent");

  REQUIRE(result.success);
  REQUIRE(result.output == "{\n  &quot;answer&quot;: 42\n}");
}

TEST_CASE("Agents past their budget are killed", "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  engine->setKillGraceMs(200);
  engine->addAgentTool(
      "slow-agent", agentConfig("sleep", {}, ResponseFormat::Streaming, 200));

  auto start = chrono::steady_clock::now();
  auto result = engine->route(USER, "t1", "slow-agent 30");

  REQUIRE(chrono::steady_clock::now() - start < chrono::seconds(10));
  REQUIRE_FALSE(result.success);
  REQUIRE(result.errorCode);
  REQUIRE(*result.errorCode == BridgeErrorCode::Timeout);
  REQUIRE(result.error == "Agent tool timeout after 200ms");
  REQUIRE(engine->getActiveProcessCount() == 0);
}

TEST_CASE("Agents that close their output still time out",
          "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  engine->setKillGraceMs(200);
  engine->addAgentTool(
      "quiet-agent",
      agentConfig("sh", {"-c", "exec >/dev/null 2>&1; sleep 30"},
                  ResponseFormat::Streaming, 200));

  auto start = chrono::steady_clock::now();
  auto result = engine->route(USER, "t1", "quiet-agent");

  REQUIRE(chrono::steady_clock::now() - start < chrono::seconds(10));
  REQUIRE_FALSE(result.success);
  REQUIRE(*result.errorCode == BridgeErrorCode::Timeout);
  REQUIRE(result.error == "Agent tool timeout after 200ms");
  REQUIRE(engine->getActiveProcessCount() == 0);
}

TEST_CASE("Silent commands stay killable until they exit",
          "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  RouteResult result;
  std::thread runner([&]() {
    result = engine->route(USER, "t1", "exec >/dev/null 2>&1; sleep 30");
  });
  waitForActiveProcess(engine);
  // Give the shell time to close its pipes
  std::this_thread::sleep_for(std::chrono::milliseconds(300));

  REQUIRE(engine->getActiveProcessCount() == 1);
  REQUIRE(engine->killProcess("t1"));
  runner.join();

  REQUIRE(result.error == "Process was killed");
  REQUIRE(*result.exitCode == 128 + SIGTERM);
  REQUIRE(engine->getActiveProcessCount() == 0);
}

TEST_CASE("Installed tools run directly with escaped output",
          "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  ToolInfo cat;
  cat.name = "cat";
  cat.displayName = "cat";
  cat.category = ToolCategory::System;
  engine->getRegistry()->registerTool(cat);
  REQUIRE(engine->getRegistry()->detectTool("cat").isInstalled);

  string path = "/tmp/sb_route_" + genRandomAlphaNum(8);
  {
    std::ofstream out(path);
    out << "<b>bold</b> & done\n";
  }
  auto result = engine->route(USER, "t1", "cat " + path);
  ::unlink(path.c_str());

  REQUIRE(result.handled);
  REQUIRE(result.success);
  REQUIRE(*result.exitCode == 0);
  REQUIRE(result.commandInfo.tool);
  REQUIRE(*result.commandInfo.tool == "cat");
  REQUIRE(result.commandInfo.toolInfo);
  REQUIRE(result.commandInfo.toolInfo->isInstalled);
  REQUIRE(result.output == "&lt;b&gt;bold&lt;/b&gt; &amp; done\n");

  auto ledger = engine->getHistory().getToolHistory(USER, "cat");
  REQUIRE(ledger);
  REQUIRE(ledger->commands.size() == 1);
  REQUIRE(ledger->commands[0].command == "cat");
}

TEST_CASE("Agents that cannot start fail cleanly", "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  engine->addAgentTool("ghost-agent",
                       agentConfig("sb-no-such-program-xyz", {},
                                   ResponseFormat::Streaming, 1000));

  auto result = engine->route(USER, "t1", "ghost-agent");

  REQUIRE_FALSE(result.success);
  REQUIRE(*result.errorCode == BridgeErrorCode::SpawnFailure);
  REQUIRE(*result.exitCode == 127);
  REQUIRE(result.error.find("Failed to execute agent tool: ") == 0);
}

TEST_CASE("Running commands can be killed", "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  REQUIRE_FALSE(engine->killProcess(USER, "t1"));

  RouteResult result;
  std::thread runner(
      [&]() { result = engine->route(USER, "t1", "sleep 30"); });
  waitForActiveProcess(engine);

  auto processes = engine->getActiveProcesses();
  REQUIRE(processes.size() == 1);
  REQUIRE(processes[0]["terminalId"] == "t1");
  REQUIRE(processes[0]["tool"] == "shell");
  REQUIRE(processes[0]["pid"].get<int>() > 0);

  // Another token cannot reach this slot
  REQUIRE_FALSE(engine->killProcess("someone-else", "t1"));
  REQUIRE(engine->killProcess(USER, "t1"));
  runner.join();

  REQUIRE_FALSE(result.success);
  REQUIRE(result.error == "Process was killed");
  REQUIRE(engine->getActiveProcessCount() == 0);
}

TEST_CASE("Cleanup forgets a token", "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  engine->route(USER, "t1", "true");
  REQUIRE(engine->getHistory().getTerminalHistory(USER, "t1"));

  engine->cleanup(USER);
  REQUIRE_FALSE(engine->getHistory().getTerminalHistory(USER, "t1"));
}

TEST_CASE("Agent tools can be added and removed", "[CommandRoutingEngine]") {
  auto engine = makeEngine();
  REQUIRE(engine->getAgentConfig("claude-code"));
  REQUIRE(engine->getAgentConfig("gemini")->responseFormat ==
          ResponseFormat::Batch);

  engine->addAgentTool("my-agent", agentConfig("true", {},
                                               ResponseFormat::Batch, 1000));
  REQUIRE(engine->parse("my-agent go").isAgentTool);
  REQUIRE(engine->getRegistry()->hasTool("my-agent"));

  REQUIRE(engine->removeAgentTool("my-agent"));
  REQUIRE_FALSE(engine->removeAgentTool("my-agent"));
  REQUIRE_FALSE(engine->parse("my-agent go").isAgentTool);
}

TEST_CASE("Agent configs are read from json", "[CommandRoutingEngine]") {
  auto config = AgentToolConfig::fromJson(
      "helper", {{"executable", "/usr/bin/helper"},
                 {"args", {"--quiet"}},
                 {"responseFormat", "json"},
                 {"interceptMode", "none"},
                 {"timeout", 5000}});
  REQUIRE(config.name == "helper");
  REQUIRE(config.executable == "/usr/bin/helper");
  REQUIRE(config.args == vector<string>{"--quiet"});
  REQUIRE(config.responseFormat == ResponseFormat::Json);
  REQUIRE(config.interceptMode == InterceptMode::None);
  REQUIRE(config.timeout == 5000);
  REQUIRE(config.toJson()["responseFormat"] == "json");

  auto defaults = AgentToolConfig::fromJson("helper", json::object());
  REQUIRE(defaults.executable == "helper");
  REQUIRE(defaults.responseFormat == ResponseFormat::Streaming);

  REQUIRE_THROWS_AS(
      AgentToolConfig::fromJson("helper", {{"responseFormat", "fancy"}}),
      BridgeException);
  REQUIRE_THROWS_AS(AgentToolConfig::fromJson("helper", {{"timeout", 0}}),
                    BridgeException);
  REQUIRE_THROWS_AS(AgentToolConfig::fromJson("helper", {{"args", 12}}),
                    BridgeException);
  REQUIRE_THROWS_AS(AgentToolConfig::fromJson("helper", json::array()),
                    BridgeException);
}
