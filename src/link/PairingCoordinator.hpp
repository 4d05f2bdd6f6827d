#ifndef __SCANLINK_PAIRING_COORDINATOR__
#define __SCANLINK_PAIRING_COORDINATOR__

#include "ControlChannel.hpp"
#include "Headers.hpp"
#include "ScanCapability.hpp"
#include "SessionCredentials.hpp"

namespace scanlink {
class PairingOutcome {
 public:
  enum class Kind {
    SUCCESS,
    INVALID,
    CONNECT_FAILED,
  };
  enum class Field {
    NONE,
    HOST,
    TOKEN,
  };

  static PairingOutcome success() { return PairingOutcome(Kind::SUCCESS); }
  static PairingOutcome invalid(Field field) {
    PairingOutcome o(Kind::INVALID);
    o.field = field;
    return o;
  }
  static PairingOutcome connectFailed(FailureKind failureKind,
                                      const string& reason) {
    PairingOutcome o(Kind::CONNECT_FAILED);
    o.failureKind = failureKind;
    o.reason = reason;
    return o;
  }

  Kind getKind() const { return kind; }
  bool isSuccess() const { return kind == Kind::SUCCESS; }
  Field getField() const { return field; }
  FailureKind getFailureKind() const { return failureKind; }
  const string& getReason() const { return reason; }

  /** @brief The message shown to the operator. */
  string describe() const;

 protected:
  explicit PairingOutcome(Kind _kind)
      : kind(_kind), field(Field::NONE), failureKind(FailureKind::NONE) {}

  Kind kind;
  Field field;
  FailureKind failureKind;
  string reason;
};

/**
 * @brief Validates operator input and opens the control channel with it.
 *
 * pair() calls are serialized. A newer call preempts an older one that is
 * still connecting: the older call returns CONNECT_FAILED(CANCELLED).
 */
class PairingCoordinator {
 public:
  PairingCoordinator(shared_ptr<ControlChannel> _channel,
                     shared_ptr<ScanCapability> _capability,
                     int _defaultPort = DEFAULT_CONSOLE_PORT);

  PairingOutcome pair(const string& host, const string& token) {
    return pair(host, token, defaultPort);
  }
  PairingOutcome pair(const string& host, const string& token, int port);
  /**
   * @brief Pairs from a scanned QR code. Fields missing from the code are
   * taken from the last values entered.
   */
  PairingOutcome pair(const QrScanResult& scan);

  /** @brief Credentials of the last successful pairing. */
  optional<SessionCredentials> getCredentials();

 protected:
  shared_ptr<ControlChannel> channel;
  shared_ptr<ScanCapability> capability;
  int defaultPort;

  std::mutex pairMutex;
  std::atomic<int64_t> pairGeneration;
  std::atomic<int> pairsInFlight;

  std::mutex lastMutex;
  string lastHost;
  string lastToken;
  optional<SessionCredentials> pairedCredentials;

  void configureUploadTarget(const string& host);
};
}  // namespace scanlink

#endif  // __SCANLINK_PAIRING_COORDINATOR__
