#include "BridgeException.hpp"
#include "FakeUserTerminal.hpp"
#include "PipeUserTerminal.hpp"
#include "TerminalSessionManager.hpp"
#include "TestHeaders.hpp"

using namespace sb;

namespace {
const string USER = "6f9619ff-8b86-d011-b42d-00c04fc964ff";
const string OTHER = "7c9e6679-7425-40de-944b-e07fc1f90ae7";

class RecordingTerminalHandler : public TerminalEventHandler {
 public:
  virtual void onTerminalCreated(const TerminalSessionInfo& info) {
    lock_guard<std::mutex> guard(handlerMutex);
    created.push_back(info.terminalId);
  }

  virtual void onTerminalOutput(const string& uuid, const string& terminalId,
                                const string& data) {
    lock_guard<std::mutex> guard(handlerMutex);
    chunks.push_back(data);
    output[terminalId] += data;
    handlerCv.notify_all();
  }

  virtual void onTerminalExit(const string& uuid, const string& terminalId,
                              int exitCode) {
    lock_guard<std::mutex> guard(handlerMutex);
    exits[terminalId] = exitCode;
    handlerCv.notify_all();
  }

  bool waitForOutput(const string& terminalId, const string& needle) {
    std::unique_lock<std::mutex> lock(handlerMutex);
    return handlerCv.wait_for(lock, std::chrono::seconds(5), [&]() {
      return output[terminalId].find(needle) != string::npos;
    });
  }

  optional<int> waitForExit(const string& terminalId) {
    std::unique_lock<std::mutex> lock(handlerMutex);
    handlerCv.wait_for(lock, std::chrono::seconds(5), [&]() {
      return exits.find(terminalId) != exits.end();
    });
    auto it = exits.find(terminalId);
    if (it == exits.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool sawExit(const string& terminalId) {
    lock_guard<std::mutex> guard(handlerMutex);
    return exits.find(terminalId) != exits.end();
  }

  vector<string> getChunks() {
    lock_guard<std::mutex> guard(handlerMutex);
    return chunks;
  }

  vector<string> getCreated() {
    lock_guard<std::mutex> guard(handlerMutex);
    return created;
  }

 protected:
  std::mutex handlerMutex;
  std::condition_variable handlerCv;
  vector<string> created;
  vector<string> chunks;
  map<string, string> output;
  map<string, int> exits;
};

TerminalLimits testLimits() {
  TerminalLimits limits;
  limits.maxTerminalsPerUser = 3;
  limits.maxGlobalTerminals = 5;
  limits.bannerDelayMs = 0;
  return limits;
}

BridgeErrorCode createErrorCode(TerminalSessionManager* manager,
                                const string& uuid,
                                const optional<string>& terminalId) {
  try {
    manager->create(uuid, terminalId);
  } catch (const BridgeException& be) {
    return be.getCode();
  }
  FAIL("create should have thrown");
  return BridgeErrorCode::NotFound;
}
}  // namespace

TEST_CASE("utf8IncompleteSuffixLength", "[TerminalSessionManager]") {
  REQUIRE(utf8IncompleteSuffixLength("") == 0);
  REQUIRE(utf8IncompleteSuffixLength("abc") == 0);
  // Complete euro sign
  REQUIRE(utf8IncompleteSuffixLength("a\xE2\x82\xAC") == 0);
  REQUIRE(utf8IncompleteSuffixLength("a\xE2\x82") == 2);
  REQUIRE(utf8IncompleteSuffixLength("a\xE2") == 1);
  // Four byte sequence missing its last byte
  REQUIRE(utf8IncompleteSuffixLength("\xF0\x9F\x98") == 3);
  REQUIRE(utf8IncompleteSuffixLength("\xF0\x9F\x98\x80") == 0);
}

TEST_CASE("Create starts a session", "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  RecordingTerminalHandler handler;
  TerminalSessionManager manager(testLimits(), factory.factory());
  manager.setEventHandler(&handler);

  auto info = manager.create(USER);
  REQUIRE(info.terminalId.find("term_") == 0);
  REQUIRE(info.uuid == USER);
  REQUIRE(info.name == "Terminal 1");
  REQUIRE(info.color == "blue");
  REQUIRE(info.isActive);
  REQUIRE(info.kind == "fake");
  REQUIRE(info.cols == 80);
  REQUIRE(info.rows == 24);
  REQUIRE(factory.last()->getLastWinInfo().ws_col == 80);
  REQUIRE(handler.getCreated() == vector<string>{info.terminalId});

  auto second =
      manager.create(USER, string("mine"), string("Build"), string("green"));
  REQUIRE(second.terminalId == "mine");
  REQUIRE(second.name == "Build");
  REQUIRE(second.color == "green");

  auto listed = manager.listByToken(USER);
  REQUIRE(listed.size() == 2);
  REQUIRE(listed[0].terminalId == info.terminalId);
  REQUIRE(manager.listByToken(OTHER).empty());
  manager.setEventHandler(NULL);
}

TEST_CASE("Slots are unique per token", "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  TerminalSessionManager manager(testLimits(), factory.factory());

  manager.create(USER, string("t1"));
  REQUIRE(createErrorCode(&manager, USER, string("t1")) ==
          BridgeErrorCode::SlotAlreadyExists);
  // The same slot name is fine for another token
  manager.create(OTHER, string("t1"));
  REQUIRE(manager.getSessionCount() == 2);
}

TEST_CASE("Capacity limits are enforced", "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  TerminalSessionManager manager(testLimits(), factory.factory());

  for (int a = 0; a < 3; a++) {
    manager.create(USER);
  }
  REQUIRE(createErrorCode(&manager, USER, std::nullopt) ==
          BridgeErrorCode::CapacityExceeded);

  manager.create(OTHER);
  manager.create(OTHER);
  REQUIRE(manager.getSessionCount() == 5);
  REQUIRE(createErrorCode(&manager, "third-user", std::nullopt) ==
          BridgeErrorCode::CapacityExceeded);

  // Closing one frees a slot
  auto sessions = manager.listByToken(OTHER);
  REQUIRE(manager.terminate(OTHER, sessions[0].terminalId));
  manager.create("third-user");
}

TEST_CASE("Spawn failures release the reservation",
          "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  factory.failSpawns = true;
  TerminalSessionManager manager(testLimits(), factory.factory());

  REQUIRE(createErrorCode(&manager, USER, string("t1")) ==
          BridgeErrorCode::SpawnFailure);
  REQUIRE(manager.getSessionCount() == 0);

  factory.failSpawns = false;
  manager.create(USER, string("t1"));
  REQUIRE(manager.getSessionCount() == 1);
}

TEST_CASE("Output is relayed after the banner", "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  RecordingTerminalHandler handler;
  TerminalSessionManager manager(testLimits(), factory.factory());
  manager.setEventHandler(&handler);

  manager.create(USER, string("t1"));
  REQUIRE(handler.waitForOutput("t1", "Terminal ID: t1"));
  factory.last()->emit("hello from the shell");
  REQUIRE(handler.waitForOutput("t1", "hello from the shell"));

  auto chunks = handler.getChunks();
  REQUIRE(chunks[0].find("ShellBridge terminal connected") != string::npos);
  REQUIRE(chunks[0].find("Session ID: " + USER.substr(0, 8) + "...") !=
          string::npos);
  manager.shutdown();
  manager.setEventHandler(NULL);
}

TEST_CASE("Split UTF-8 sequences are held back", "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  RecordingTerminalHandler handler;
  TerminalSessionManager manager(testLimits(), factory.factory());
  manager.setEventHandler(&handler);

  manager.create(USER, string("t1"));
  REQUIRE(handler.waitForOutput("t1", "Platform"));
  factory.last()->emit("price: \xE2\x82");
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  factory.last()->emit("\xAC!");
  REQUIRE(handler.waitForOutput("t1", "price: \xE2\x82\xAC!"));

  for (const auto& chunk : handler.getChunks()) {
    REQUIRE(utf8IncompleteSuffixLength(chunk) == 0);
  }
  manager.shutdown();
  manager.setEventHandler(NULL);
}

TEST_CASE("Input and resize reach the terminal", "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  TerminalSessionManager manager(testLimits(), factory.factory());
  manager.create(USER, string("t1"));
  auto terminal = factory.last();

  REQUIRE(manager.write(USER, "t1", "ls -la\n"));
  REQUIRE(terminal->waitForInput("ls -la\n"));
  REQUIRE(terminal->getInput() == "ls -la\n");
  REQUIRE_FALSE(manager.write(USER, "t2", "ls\n"));
  REQUIRE_FALSE(manager.write(OTHER, "t1", "ls\n"));

  REQUIRE(manager.resize(USER, "t1", 132, 43));
  REQUIRE(terminal->getLastWinInfo().ws_col == 132);
  REQUIRE(terminal->getLastWinInfo().ws_row == 43);
  REQUIRE(manager.getSession(USER, "t1")->cols == 132);

  REQUIRE_FALSE(manager.resize(USER, "t1", 0, 24));
  REQUIRE_FALSE(manager.resize(USER, "t1", 80, -1));
  REQUIRE_FALSE(manager.resize(USER, "t1", 70000, 24));
  REQUIRE_FALSE(manager.resize(USER, "nope", 80, 24));
  REQUIRE(manager.getSession(USER, "t1")->cols == 132);
}

TEST_CASE("Shell exit is reported and the session stays visible",
          "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  RecordingTerminalHandler handler;
  TerminalSessionManager manager(testLimits(), factory.factory());
  manager.setEventHandler(&handler);
  manager.create(USER, string("t1"));
  auto terminal = factory.last();

  terminal->finish(3);
  auto exitCode = handler.waitForExit("t1");
  REQUIRE(exitCode);
  REQUIRE(*exitCode == 3);
  REQUIRE(terminal->didHandleSessionEnd);
  REQUIRE(terminal->didCleanUp);

  auto info = manager.getSession(USER, "t1");
  REQUIRE(info);
  REQUIRE_FALSE(info->isActive);
  REQUIRE(*info->exitCode == 3);
  REQUIRE_FALSE(manager.write(USER, "t1", "ls\n"));
  REQUIRE(manager.listActive().empty());
  manager.setEventHandler(NULL);
}

TEST_CASE("A shell that stops reading input stalls no one else",
          "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  RecordingTerminalHandler handler;
  auto limits = testLimits();
  limits.maxPendingInputBytes = 16;
  TerminalSessionManager manager(limits, factory.factory());
  manager.setEventHandler(&handler);
  manager.create(USER, string("stuck"));
  auto stuck = factory.last();
  manager.create(USER, string("live"));
  auto live = factory.last();

  stuck->holdWrites();
  auto before = std::chrono::steady_clock::now();
  REQUIRE(manager.write(USER, "stuck", "first "));
  REQUIRE(stuck->waitForBlockedWrite());
  REQUIRE(manager.write(USER, "stuck", "second"));
  REQUIRE(std::chrono::steady_clock::now() - before <
          std::chrono::seconds(2));

  // The other session keeps flowing both ways
  REQUIRE(manager.write(USER, "live", "echo ok\r"));
  REQUIRE(handler.waitForOutput("live", "echo ok\r"));
  live->emit("still here");
  REQUIRE(handler.waitForOutput("live", "still here"));
  REQUIRE(manager.resize(USER, "stuck", 100, 40));

  // Queued input is bounded
  REQUIRE_FALSE(manager.write(USER, "stuck", "overflowing input"));

  stuck->releaseWrites();
  REQUIRE(stuck->waitForInput("first second"));
  REQUIRE(stuck->getInput() == "first second");
  REQUIRE(handler.waitForOutput("stuck", "first second"));
  manager.shutdown();
  manager.setEventHandler(NULL);
}

TEST_CASE("Sessions are inactive before their descriptors close",
          "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  RecordingTerminalHandler handler;
  TerminalSessionManager manager(testLimits(), factory.factory());
  manager.setEventHandler(&handler);
  manager.create(USER, string("t1"));
  auto terminal = factory.last();

  atomic<bool> activeAtCleanup(true);
  terminal->onCleanup = [&]() {
    auto info = manager.getSession(USER, "t1");
    activeAtCleanup = info && info->isActive;
  };
  terminal->finish(0);
  REQUIRE(handler.waitForExit("t1"));
  REQUIRE(terminal->didCleanUp);
  REQUIRE_FALSE(activeAtCleanup);
  REQUIRE_FALSE(manager.resize(USER, "t1", 100, 40));
  REQUIRE(terminal->getLastWinInfo().ws_col == 80);
  manager.setEventHandler(NULL);
}

TEST_CASE("Writes, resizes and kills race a real shell exit safely",
          "[TerminalSessionManager]") {
  RecordingTerminalHandler handler;
  TerminalSessionManager manager(
      testLimits(), [](const winsize& size) -> shared_ptr<UserTerminal> {
        auto terminal = make_shared<PipeUserTerminal>();
        terminal->setup(size);
        return terminal;
      });
  manager.setEventHandler(&handler);
  manager.create(USER, string("t1"));

  REQUIRE(manager.write(USER, "t1", "exit 4\n"));
  atomic<bool> done(false);
  std::thread hammer([&]() {
    int cols = 80;
    while (!done) {
      manager.write(USER, "t1", ":\n");
      manager.resize(USER, "t1", cols++ % 200 + 20, 24);
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  });
  auto exitCode = handler.waitForExit("t1");
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  done = true;
  hammer.join();

  REQUIRE(exitCode);
  REQUIRE(*exitCode == 4);
  REQUIRE_FALSE(manager.write(USER, "t1", "ls\n"));
  REQUIRE_FALSE(manager.resize(USER, "t1", 80, 24));
  REQUIRE(manager.terminate(USER, string("t1")));
  manager.setEventHandler(NULL);
}

TEST_CASE("Exited sessions are reaped after the grace period",
          "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  RecordingTerminalHandler handler;
  auto limits = testLimits();
  limits.exitGraceMs = 0;
  TerminalSessionManager manager(limits, factory.factory());
  manager.setEventHandler(&handler);
  manager.create(USER, string("t1"));
  manager.create(USER, string("t2"));

  factory.last()->finish(0);
  REQUIRE(handler.waitForExit("t2"));
  REQUIRE(manager.reapExitedSessions() == 1);
  REQUIRE(manager.getSessionCount() == 1);
  REQUIRE(manager.getSession(USER, "t1"));
  manager.setEventHandler(NULL);
}

TEST_CASE("Terminate kills without an exit event", "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  RecordingTerminalHandler handler;
  TerminalSessionManager manager(testLimits(), factory.factory());
  manager.setEventHandler(&handler);
  manager.create(USER, string("t1"));
  auto first = factory.last();
  manager.create(USER, string("t2"));
  manager.create(OTHER, string("t1"));

  REQUIRE(manager.terminate(USER, string("t1")));
  REQUIRE(first->getSignals() == vector<int>{SIGKILL});
  REQUIRE(first->didCleanUp);
  REQUIRE_FALSE(manager.getSession(USER, "t1"));
  REQUIRE_FALSE(manager.terminate(USER, string("t1")));
  REQUIRE_FALSE(handler.sawExit("t1"));

  // Without a slot every session of the token goes
  REQUIRE(manager.terminate(USER));
  REQUIRE(manager.listByToken(USER).empty());
  REQUIRE(manager.getSessionCount() == 1);
  manager.setEventHandler(NULL);
}

TEST_CASE("Idle sessions are reclaimed", "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  TerminalSessionManager manager(testLimits(), factory.factory());
  manager.create(USER, string("t1"));
  manager.create(USER, string("t2"));

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  REQUIRE(manager.write(USER, "t2", "x"));
  REQUIRE(manager.reclaimIdleSessions(100) == 1);
  REQUIRE_FALSE(manager.getSession(USER, "t1"));
  REQUIRE(manager.getSession(USER, "t2"));
}

TEST_CASE("Memory pressure triggers the aggressive pass",
          "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  auto limits = testLimits();
  limits.sessionMemoryBudgetBytes = 1000;
  limits.idleTimeoutMs = 60 * 60 * 1000;
  limits.aggressiveTimeoutMs = 50;
  TerminalSessionManager manager(limits, factory.factory());
  manager.create(USER, string("t1"));

  // Ceiling is 5 * 1000 bytes, pressure starts above 4000
  manager.setMemoryProbe([]() { return int64_t(1000); });
  REQUIRE_FALSE(manager.isUnderMemoryPressure());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(manager.runReclamation() == 0);

  manager.setMemoryProbe([]() { return int64_t(4500); });
  REQUIRE(manager.isUnderMemoryPressure());
  REQUIRE(manager.runReclamation() == 1);
  REQUIRE(manager.getSessionCount() == 0);
}

TEST_CASE("Resource usage summarizes sessions", "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  TerminalSessionManager manager(testLimits(), factory.factory());
  manager.setMemoryProbe([]() { return int64_t(12345); });
  manager.create(USER);
  manager.create(OTHER);

  auto usage = manager.getResourceUsage();
  REQUIRE(usage["totalTerminals"] == 2);
  REQUIRE(usage["activeTerminals"] == 2);
  REQUIRE(usage["usersWithTerminals"] == 2);
  REQUIRE(usage["memoryUsageBytes"] == 12345);
  REQUIRE(usage["limits"]["maxTerminalsPerUser"] == 3);
}

TEST_CASE("Shutdown stops every session", "[TerminalSessionManager]") {
  FakeUserTerminalFactory factory;
  TerminalSessionManager manager(testLimits(), factory.factory());
  manager.create(USER);
  manager.create(OTHER);

  manager.shutdown();
  REQUIRE(manager.getSessionCount() == 0);
  REQUIRE(factory.last()->didCleanUp);
}
