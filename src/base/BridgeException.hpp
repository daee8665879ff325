#ifndef __SB_BRIDGE_EXCEPTION__
#define __SB_BRIDGE_EXCEPTION__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Failure classes surfaced to clients. Every code has a stable wire
 * name so the browser can branch on it.
 */
enum class BridgeErrorCode {
  InvalidToken,
  TokenInUse,
  SlotAlreadyExists,
  CapacityExceeded,
  NotFound,
  SpawnFailure,
  Timeout,
  MalformedFrame,
};

/** @brief snake_case name of the code, e.g. "resource_limit". */
const char *bridgeErrorCodeName(BridgeErrorCode code);

/**
 * @brief Raised when a request is rejected. `what()` is the human readable
 * reason that goes back to the client unchanged.
 */
class BridgeException : public std::runtime_error {
 public:
  BridgeException(BridgeErrorCode _code, const string &reason)
      : std::runtime_error(reason), code(_code) {}

  BridgeErrorCode getCode() const { return code; }

 protected:
  BridgeErrorCode code;
};
}  // namespace sb

#endif  // __SB_BRIDGE_EXCEPTION__
