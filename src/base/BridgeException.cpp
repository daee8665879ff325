#include "BridgeException.hpp"

namespace sb {
const char *bridgeErrorCodeName(BridgeErrorCode code) {
  switch (code) {
    case BridgeErrorCode::InvalidToken:
      return "invalid_token";
    case BridgeErrorCode::TokenInUse:
      return "token_in_use";
    case BridgeErrorCode::SlotAlreadyExists:
      return "slot_exists";
    case BridgeErrorCode::CapacityExceeded:
      return "resource_limit";
    case BridgeErrorCode::NotFound:
      return "not_found";
    case BridgeErrorCode::SpawnFailure:
      return "spawn_failure";
    case BridgeErrorCode::Timeout:
      return "timeout";
    case BridgeErrorCode::MalformedFrame:
      return "malformed_frame";
  }
  return "unknown";
}
}  // namespace sb
