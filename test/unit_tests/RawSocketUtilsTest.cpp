#include "RawSocketUtils.hpp"
#include "TestHeaders.hpp"

using namespace sb;

namespace {
string readExactly(int fd, size_t count) {
  string result;
  char buf[4096];
  while (result.size() < count) {
    ssize_t rc = ::read(fd, buf, std::min(sizeof(buf), count - result.size()));
    if (rc <= 0) {
      break;
    }
    result.append(buf, rc);
  }
  return result;
}
}  // namespace

TEST_CASE("writeAll delivers payloads larger than the pipe buffer",
          "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  // Non-blocking so the write loop has to wait for the reader
  int flags = ::fcntl(fds[1], F_GETFL, 0);
  REQUIRE(::fcntl(fds[1], F_SETFL, flags | O_NONBLOCK) == 0);

  string payload = genRandomAlphaNum(256 * 1024);
  std::thread writer([&]() {
    RawSocketUtils::writeAll(fds[1], payload.data(), payload.size());
  });

  REQUIRE(readExactly(fds[0], payload.size()) == payload);
  writer.join();
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("writeAll reports bad and broken descriptors", "[RawSocketUtils]") {
  REQUIRE_THROWS_AS(RawSocketUtils::writeAll(-1, "x", 1), std::runtime_error);

  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  ::close(fds[0]);
  // SIGPIPE is ignored by the test runner, so this surfaces as EPIPE
  REQUIRE_THROWS_AS(RawSocketUtils::writeAll(fds[1], "hello", 5),
                    std::runtime_error);
  ::close(fds[1]);

  // Nothing to write never touches the descriptor
  RawSocketUtils::writeAll(fds[1], "", 0);
}

TEST_CASE("writeSome stops when the descriptor is full", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  RawSocketUtils::setNonBlocking(fds[1]);
  REQUIRE((::fcntl(fds[1], F_GETFL, 0) & O_NONBLOCK) != 0);

  // Larger than any default pipe buffer, and nobody is reading
  string payload = genRandomAlphaNum(4 * 1024 * 1024);
  size_t accepted =
      RawSocketUtils::writeSome(fds[1], payload.data(), payload.size());
  REQUIRE(accepted > 0);
  REQUIRE(accepted < payload.size());
  REQUIRE(RawSocketUtils::writeSome(fds[1], payload.data(), 1) == 0);

  REQUIRE(readExactly(fds[0], accepted) == payload.substr(0, accepted));
  REQUIRE(RawSocketUtils::writeSome(fds[1], "tail", 4) == 4);
  REQUIRE(readExactly(fds[0], 4) == "tail");

  ::close(fds[0]);
  REQUIRE_THROWS_AS(RawSocketUtils::writeSome(fds[1], "x", 1),
                    std::runtime_error);
  ::close(fds[1]);
  REQUIRE_THROWS_AS(RawSocketUtils::writeSome(-1, "x", 1), std::runtime_error);
}
