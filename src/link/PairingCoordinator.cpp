#include "PairingCoordinator.hpp"

#include "AddressValidator.hpp"

namespace scanlink {
string PairingOutcome::describe() const {
  switch (kind) {
    case Kind::SUCCESS:
      return "Connected";
    case Kind::INVALID:
      if (field == Field::HOST) {
        return "Please enter a valid IP address (e.g. 192.168.1.100)";
      }
      return "Please enter the session token shown on the console";
    case Kind::CONNECT_FAILED:
      if (failureKind == FailureKind::HANDSHAKE_REJECTED) {
        return "The console rejected the token: " + reason;
      }
      return string("Could not connect (") + failureKindName(failureKind) +
             "): " + reason;
  }
  return "";
}

PairingCoordinator::PairingCoordinator(shared_ptr<ControlChannel> _channel,
                                       shared_ptr<ScanCapability> _capability,
                                       int _defaultPort)
    : channel(_channel),
      capability(_capability),
      defaultPort(_defaultPort),
      pairGeneration(0),
      pairsInFlight(0) {}

PairingOutcome PairingCoordinator::pair(const string& rawHost,
                                        const string& rawToken, int port) {
  string host = trim(rawHost);
  string token = trim(rawToken);
  {
    lock_guard<std::mutex> guard(lastMutex);
    lastHost = host;
    lastToken = token;
  }

  if (host.empty()) {
    LOG(INFO) << "Pairing refused: no address";
    return PairingOutcome::invalid(PairingOutcome::Field::HOST);
  }
  if (!validateToken(token)) {
    LOG(INFO) << "Pairing refused: no token";
    return PairingOutcome::invalid(PairingOutcome::Field::TOKEN);
  }
  if (!validateAddress(host)) {
    LOG(INFO) << "Pairing refused: invalid address " << host;
    return PairingOutcome::invalid(PairingOutcome::Field::HOST);
  }

  int64_t myGeneration = ++pairGeneration;
  if (pairsInFlight > 0) {
    LOG(INFO) << "Preempting the pairing in progress";
    channel->disconnect();
  }
  pairsInFlight++;
  std::lock_guard<std::mutex> pairGuard(pairMutex);

  PairingOutcome outcome = PairingOutcome::connectFailed(
      FailureKind::CANCELLED, "Superseded by a newer pairing request");
  if (myGeneration == pairGeneration) {
    SessionCredentials credentials(host, token, port);
    LOG(INFO) << "Pairing with " << credentials;
    auto result = channel->connect(credentials);
    if (myGeneration != pairGeneration) {
      VLOG(1) << "Pairing with " << host << " was preempted";
    } else if (result.isSuccess()) {
      configureUploadTarget(host);
      {
        lock_guard<std::mutex> guard(lastMutex);
        pairedCredentials = credentials;
      }
      outcome = PairingOutcome::success();
    } else {
      outcome = PairingOutcome::connectFailed(result.getFailureKind(),
                                              result.getReason());
    }
  }
  pairsInFlight--;
  LOG(INFO) << "Pairing outcome: " << outcome.describe();
  return outcome;
}

PairingOutcome PairingCoordinator::pair(const QrScanResult& scan) {
  string host, token;
  {
    lock_guard<std::mutex> guard(lastMutex);
    host = scan.has_host() ? scan.host() : lastHost;
    token = scan.has_token() ? scan.token() : lastToken;
  }
  int port = scan.has_port() ? scan.port() : defaultPort;
  return pair(host, token, port);
}

optional<SessionCredentials> PairingCoordinator::getCredentials() {
  lock_guard<std::mutex> guard(lastMutex);
  return pairedCredentials;
}

void PairingCoordinator::configureUploadTarget(const string& host) {
  if (!capability) {
    VLOG(1) << "No capture provider, skipping upload target";
    return;
  }
  try {
    capability->setUploadTarget(host);
    LOG(INFO) << "Upload target set to " << host;
  } catch (const std::exception& e) {
    LOG(WARNING) << "Could not set the upload target: " << e.what();
  }
}
}  // namespace scanlink
