#include "PipeUserTerminal.hpp"
#include "TestHeaders.hpp"

using namespace sb;

namespace {
/** Reads until `needle` shows up, EOF, or the timeout. */
string readUntil(PipeUserTerminal* terminal, const string& needle,
                 int timeoutMs = 10000) {
  string output;
  auto deadline =
      chrono::steady_clock::now() + chrono::milliseconds(timeoutMs);
  char buf[4096];
  while (chrono::steady_clock::now() < deadline) {
    pollfd pfd;
    pfd.fd = terminal->getFd();
    pfd.events = POLLIN;
    pfd.revents = 0;
    if (::poll(&pfd, 1, 50) <= 0) {
      continue;
    }
    ssize_t bytesRead = ::read(terminal->getFd(), buf, sizeof(buf));
    if (bytesRead <= 0) {
      break;
    }
    output += terminal->filterOutput(string(buf, bytesRead));
    if (!needle.empty() && output.find(needle) != string::npos) {
      break;
    }
  }
  return output;
}

winsize defaultSize() {
  winsize size;
  memset(&size, 0, sizeof(size));
  size.ws_col = 80;
  size.ws_row = 24;
  return size;
}
}  // namespace

TEST_CASE("Output newlines become CRLF", "[PipeUserTerminal]") {
  PipeUserTerminal terminal;
  REQUIRE(terminal.filterOutput("a\nb\r\nc") == "a\r\nb\r\nc");
  REQUIRE(terminal.filterOutput("\n") == "\r\n");
  REQUIRE(terminal.filterOutput("") == "");
}

TEST_CASE("Commands round trip through the shell", "[PipeUserTerminal]") {
  PipeUserTerminal terminal;
  terminal.setup(defaultSize());
  REQUIRE(terminal.getKind() == "pipe");

  string command = "echo sb-pipe-$((40+2))\n";
  REQUIRE(terminal.write(command) == command.size());
  string output = readUntil(&terminal, "sb-pipe-42\r\n");
  REQUIRE(output.find("sb-pipe-42\r\n") != string::npos);

  terminal.write("exit 7\n");
  readUntil(&terminal, "");
  REQUIRE(terminal.handleSessionEnd() == 7);
  // Reaping is idempotent
  REQUIRE(terminal.handleSessionEnd() == 7);
  terminal.cleanup();
}

TEST_CASE("Control-D closes the shell input", "[PipeUserTerminal]") {
  PipeUserTerminal terminal;
  terminal.setup(defaultSize());

  REQUIRE(terminal.write("true\n\x04") == 6);
  REQUIRE(terminal.getInputFd() == -1);
  REQUIRE_THROWS_AS(terminal.write("more"), std::runtime_error);
  readUntil(&terminal, "");
  REQUIRE(terminal.handleSessionEnd() == 0);
}

TEST_CASE("Killed shells report the signal", "[PipeUserTerminal]") {
  PipeUserTerminal terminal;
  terminal.setup(defaultSize());

  terminal.kill(SIGKILL);
  readUntil(&terminal, "");
  REQUIRE(terminal.handleSessionEnd() == 128 + SIGKILL);
}

TEST_CASE("Writes to a busy shell return instead of blocking",
          "[PipeUserTerminal]") {
  PipeUserTerminal terminal;
  terminal.setup(defaultSize());
  REQUIRE(terminal.getInputFd() >= 0);

  terminal.write("exec sleep 30\n");
  // Far more than a pipe holds while nothing reads it
  string flood(4 * 1024 * 1024, 'a');
  auto before = chrono::steady_clock::now();
  size_t accepted = terminal.write(flood);
  REQUIRE(chrono::steady_clock::now() - before < chrono::seconds(2));
  REQUIRE(accepted < flood.size());

  terminal.kill(SIGKILL);
  readUntil(&terminal, "");
  REQUIRE(terminal.handleSessionEnd() == 128 + SIGKILL);
}

TEST_CASE("Calls after cleanup are harmless", "[PipeUserTerminal]") {
  PipeUserTerminal terminal;
  terminal.setup(defaultSize());
  terminal.write("exit 2\n");
  readUntil(&terminal, "");
  REQUIRE(terminal.handleSessionEnd() == 2);
  terminal.cleanup();

  REQUIRE(terminal.getInputFd() == -1);
  REQUIRE_THROWS_AS(terminal.write("ls\n"), std::runtime_error);
  // The pid is reaped, so no signal goes out
  terminal.kill(SIGTERM);
  terminal.setInfo(defaultSize());
  terminal.cleanup();
  REQUIRE(terminal.handleSessionEnd() == 2);
}
