#ifndef __SB_RAW_SOCKET_UTILS__
#define __SB_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Write helpers for pty masters and pipes.
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the whole buffer, waiting while the descriptor is full.
   * @throws std::runtime_error when the descriptor is closed or broken.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Writes what the descriptor accepts right now. `fd` must be
   * non-blocking.
   * @return Bytes written, 0 when the descriptor is full.
   * @throws std::runtime_error when the descriptor is closed or broken.
   */
  static size_t writeSome(int fd, const char* buf, size_t count);

  static void setNonBlocking(int fd);
};
}  // namespace sb
#endif  // __SB_RAW_SOCKET_UTILS__
