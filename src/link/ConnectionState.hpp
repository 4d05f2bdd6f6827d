#ifndef __SCANLINK_CONNECTION_STATE__
#define __SCANLINK_CONNECTION_STATE__

#include "Headers.hpp"

namespace scanlink {
enum class ConnectionStatus {
  DISCONNECTED,
  CONNECTING,
  CONNECTED,
  RECONNECTING,
  FAILED,
};

enum class FailureKind {
  NONE,
  // The transport could not be established
  UNREACHABLE,
  // The console refused the credentials
  HANDSHAKE_REJECTED,
  // The console never acknowledged the hello
  HANDSHAKE_TIMEOUT,
  // An established transport dropped and was not recovered
  CONNECTION_LOST,
  // disconnect() or a newer connect() ended the attempt
  CANCELLED,
};

const char* connectionStatusName(ConnectionStatus status);
const char* failureKindName(FailureKind kind);

/**
 * @brief A snapshot of the channel state machine.
 *
 * Reconnecting carries the retry number and the delay before it. Failed
 * carries the failure kind and a human readable reason.
 */
class ConnectionState {
 public:
  ConnectionState()
      : status(ConnectionStatus::DISCONNECTED),
        failureKind(FailureKind::NONE),
        attempt(0),
        nextDelay(0) {}

  static ConnectionState disconnected() { return ConnectionState(); }
  static ConnectionState connecting(int attempt) {
    ConnectionState s;
    s.status = ConnectionStatus::CONNECTING;
    s.attempt = attempt;
    return s;
  }
  static ConnectionState connected() {
    ConnectionState s;
    s.status = ConnectionStatus::CONNECTED;
    return s;
  }
  static ConnectionState reconnecting(int attempt,
                                      std::chrono::milliseconds nextDelay) {
    ConnectionState s;
    s.status = ConnectionStatus::RECONNECTING;
    s.attempt = attempt;
    s.nextDelay = nextDelay;
    return s;
  }
  static ConnectionState failed(FailureKind kind, const string& reason) {
    ConnectionState s;
    s.status = ConnectionStatus::FAILED;
    s.failureKind = kind;
    s.reason = reason;
    return s;
  }

  ConnectionStatus getStatus() const { return status; }
  FailureKind getFailureKind() const { return failureKind; }
  const string& getReason() const { return reason; }
  int getAttempt() const { return attempt; }
  std::chrono::milliseconds getNextDelay() const { return nextDelay; }

  bool operator==(const ConnectionState& other) const {
    return status == other.status && failureKind == other.failureKind &&
           reason == other.reason && attempt == other.attempt &&
           nextDelay == other.nextDelay;
  }
  bool operator!=(const ConnectionState& other) const {
    return !(*this == other);
  }

  string toString() const;

 protected:
  ConnectionStatus status;
  FailureKind failureKind;
  string reason;
  int attempt;
  std::chrono::milliseconds nextDelay;
};

inline std::ostream& operator<<(std::ostream& os,
                                const ConnectionState& state) {
  os << state.toString();
  return os;
}

/**
 * @brief What a connect() call ended with.
 */
class ConnectResult {
 public:
  static ConnectResult success() { return ConnectResult(FailureKind::NONE, ""); }
  static ConnectResult failure(FailureKind kind, const string& reason) {
    return ConnectResult(kind, reason);
  }

  bool isSuccess() const { return kind == FailureKind::NONE; }
  FailureKind getFailureKind() const { return kind; }
  const string& getReason() const { return reason; }

 protected:
  ConnectResult(FailureKind _kind, const string& _reason)
      : kind(_kind), reason(_reason) {}

  FailureKind kind;
  string reason;
};
}  // namespace scanlink

#endif  // __SCANLINK_CONNECTION_STATE__
