#ifndef __SB_CLIENT_CHANNEL_HPP__
#define __SB_CLIENT_CHANNEL_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace sb {
/**
 * @brief One client connection as seen by the protocol layer.
 *
 * Implementations must accept `send` from any thread and deliver frames in
 * the order they were sent.
 */
class ClientChannel {
 public:
  virtual ~ClientChannel() {}

  virtual void send(const json& frame) = 0;
  virtual bool isOpen() const = 0;
  /** @brief Closes the transport. Safe to call more than once. */
  virtual void close() = 0;
  virtual uint64_t getId() const = 0;
  virtual string getRemoteAddress() const = 0;
};
}  // namespace sb

#endif  // __SB_CLIENT_CHANNEL_HPP__
