#include "RawSocketUtils.hpp"

namespace sb {
void RawSocketUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        ::poll(&pfd, 1, 100);
        continue;
      }
      LOG(WARNING) << "Cannot write to fd " << fd << ": "
                   << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to terminal: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to terminal: closed");
    }
    bytesWritten += rc;
  }
}

size_t RawSocketUtils::writeSome(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeSome");
  }
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        break;
      }
      LOG(WARNING) << "Cannot write to fd " << fd << ": "
                   << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to terminal: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      break;
    }
    bytesWritten += rc;
  }
  return bytesWritten;
}

void RawSocketUtils::setNonBlocking(int fd) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  FATAL_FAIL(fcntl(fd, F_SETFL, opts | O_NONBLOCK));
}
}  // namespace sb
