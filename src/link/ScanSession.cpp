#include "ScanSession.hpp"

namespace scanlink {
namespace {
// Pulls a human readable line out of a capability event body
string describeBody(const json& body, const string& fallback) {
  if (body.is_string()) {
    return body.get<string>();
  }
  if (body.is_object()) {
    for (auto key : {"message", "text", "error", "value"}) {
      auto it = body.find(key);
      if (it != body.end() && it->is_string()) {
        return it->get<string>();
      }
    }
  }
  return fallback;
}
}  // namespace

ScanSession::ScanSession(shared_ptr<ControlChannel> _channel,
                         shared_ptr<EventDispatcher> _dispatcher,
                         shared_ptr<ScanCapability> _capability,
                         const SessionCredentials& _credentials)
    : channel(_channel),
      dispatcher(_dispatcher),
      capability(_capability),
      credentials(_credentials),
      bridge(_capability, _dispatcher),
      active(false),
      capabilityAvailable(false),
      scanning(false) {}

ScanSession::~ScanSession() { end(); }

void ScanSession::begin() {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  if (active) {
    return;
  }
  active = true;
  capabilityAvailable = capability->isSupported();
  if (!capabilityAvailable) {
    LOG(WARNING) << "Room capture is not supported on this device";
    setStatusLine("Capture not supported");
    channel->send(Message::status("Capture not supported on this device"));
  } else {
    setStatusLine(channel->isConnected() ? "Connected" : "Disconnected");
    bridge.start();
  }
  subscription = dispatcher->subscribe(
      [this](const ChannelEvent& event) { handleEvent(event); });
  LOG(INFO) << "Scan session started with " << credentials;
}

void ScanSession::end() {
  {
    lock_guard<std::recursive_mutex> guard(sessionMutex);
    if (!active) {
      return;
    }
    active = false;
  }
  bridge.stop();
  subscription.unsubscribe();
  {
    lock_guard<std::recursive_mutex> guard(sessionMutex);
    if (scanning) {
      auto outcome = capability->stopScan();
      if (!outcome.isOk()) {
        LOG(WARNING) << "Could not stop the scan: " << outcome.getError();
      }
      scanning = false;
    }
    setStatusLine("Disconnected");
  }
  channel->disconnect();
  LOG(INFO) << "Scan session ended";
}

void ScanSession::handleEvent(const ChannelEvent& event) {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  if (!active) {
    return;
  }
  switch (event.getKind()) {
    case EventKind::MESSAGE:
      handleMessage(event.getMessage());
      break;
    case EventKind::STATE_CHANGE:
      handleStateChange(event.getState());
      break;
    case EventKind::CAPABILITY:
      handleCapabilityEvent(event.getCapabilityEvent());
      break;
  }
}

void ScanSession::handleMessage(const Message& message) {
  switch (message.getType()) {
    case MessageType::CONTROL:
      if (message.getAction() == ControlAction::START) {
        startScan();
      } else {
        stopScan();
      }
      break;
    case MessageType::ROOM_UPDATE:
      roomStats = message.getPayload();
      break;
    case MessageType::INSTRUCTION:
      lastInstruction = message.getText();
      CLOG(INFO, "stdout") << "Instruction: " << message.getText() << endl;
      break;
    case MessageType::STATUS:
      setStatusLine(message.getText());
      break;
    default:
      break;
  }
}

void ScanSession::handleStateChange(const ConnectionState& state) {
  switch (state.getStatus()) {
    case ConnectionStatus::CONNECTED:
      setStatusLine(scanning ? "Scanning" : "Connected");
      break;
    case ConnectionStatus::RECONNECTING:
    case ConnectionStatus::CONNECTING:
      setStatusLine("Reconnecting...");
      break;
    case ConnectionStatus::DISCONNECTED:
      setStatusLine("Disconnected");
      break;
    case ConnectionStatus::FAILED:
      setStatusLine("Disconnected: " + state.getReason());
      break;
  }
}

void ScanSession::handleCapabilityEvent(const CapabilityEvent& event) {
  if (event.name == SCAN_UPDATE_EVENT) {
    roomStats = event.body;
    channel->send(Message::roomUpdate(event.body));
  } else if (event.name == INSTRUCTION_EVENT) {
    lastInstruction = describeBody(event.body, "");
    channel->send(Message::instruction(lastInstruction));
  } else if (event.name == SCAN_COMPLETE_EVENT) {
    scanning = false;
    setStatusLine("Scan complete");
    channel->send(Message::status("Scan complete"));
  } else if (event.name == SCAN_ERROR_EVENT) {
    scanning = false;
    string error = describeBody(event.body, "Unknown error");
    setStatusLine("Scan error: " + error);
    channel->send(Message::status("Scan error: " + error));
  } else {
    VLOG(1) << "Ignoring capability event " << event.name;
  }
}

void ScanSession::startScan() {
  if (!capabilityAvailable) {
    LOG(INFO) << "Ignoring start, capture is not supported";
    return;
  }
  if (scanning) {
    VLOG(1) << "Already scanning";
    return;
  }
  auto outcome = capability->startScan(credentials.getToken());
  if (outcome.isOk()) {
    scanning = true;
    setStatusLine("Scanning");
  } else {
    LOG(WARNING) << "Could not start the scan: " << outcome.getError();
    setStatusLine("Scan failed: " + outcome.getError());
    channel->send(Message::status("Scan failed: " + outcome.getError()));
  }
}

void ScanSession::stopScan() {
  if (!scanning) {
    VLOG(1) << "Not scanning";
    return;
  }
  auto outcome = capability->stopScan();
  scanning = false;
  if (outcome.isOk()) {
    setStatusLine(channel->isConnected() ? "Connected" : "Disconnected");
  } else {
    LOG(WARNING) << "Could not stop the scan: " << outcome.getError();
    setStatusLine("Stop failed: " + outcome.getError());
  }
}

void ScanSession::setStatusLine(const string& line) {
  if (line != statusLine) {
    statusLine = line;
    CLOG(INFO, "stdout") << "Status: " << line << endl;
  }
}

string ScanSession::getStatusLine() {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  return statusLine;
}

string ScanSession::getLastInstruction() {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  return lastInstruction;
}

optional<json> ScanSession::getRoomStats() {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  return roomStats;
}

bool ScanSession::isScanning() {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  return scanning;
}

bool ScanSession::isCapabilityAvailable() {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  return capabilityAvailable;
}

bool ScanSession::isActive() {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  return active;
}
}  // namespace scanlink
