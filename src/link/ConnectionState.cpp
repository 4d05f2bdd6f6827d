#include "ConnectionState.hpp"

namespace scanlink {
const char* connectionStatusName(ConnectionStatus status) {
  switch (status) {
    case ConnectionStatus::DISCONNECTED:
      return "Disconnected";
    case ConnectionStatus::CONNECTING:
      return "Connecting";
    case ConnectionStatus::CONNECTED:
      return "Connected";
    case ConnectionStatus::RECONNECTING:
      return "Reconnecting";
    case ConnectionStatus::FAILED:
      return "Failed";
  }
  return "Unknown";
}

const char* failureKindName(FailureKind kind) {
  switch (kind) {
    case FailureKind::NONE:
      return "None";
    case FailureKind::UNREACHABLE:
      return "Unreachable";
    case FailureKind::HANDSHAKE_REJECTED:
      return "HandshakeRejected";
    case FailureKind::HANDSHAKE_TIMEOUT:
      return "HandshakeTimeout";
    case FailureKind::CONNECTION_LOST:
      return "ConnectionLost";
    case FailureKind::CANCELLED:
      return "Cancelled";
  }
  return "Unknown";
}

string ConnectionState::toString() const {
  stringstream ss;
  ss << connectionStatusName(status);
  switch (status) {
    case ConnectionStatus::CONNECTING:
      if (attempt > 0) {
        ss << " (retry " << attempt << ")";
      }
      break;
    case ConnectionStatus::RECONNECTING:
      ss << " (attempt " << attempt << " in " << nextDelay.count() << "ms)";
      break;
    case ConnectionStatus::FAILED:
      ss << "(" << failureKindName(failureKind);
      if (!reason.empty()) {
        ss << ": " << reason;
      }
      ss << ")";
      break;
    default:
      break;
  }
  return ss.str();
}
}  // namespace scanlink
