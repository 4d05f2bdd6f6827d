#include "ScanSession.hpp"

#include "EventRecorder.hpp"
#include "FakeConsole.hpp"
#include "FakeScanCapability.hpp"
#include "PairingCoordinator.hpp"
#include "TestHeaders.hpp"

using namespace scanlink;

namespace {
class SessionFixture {
 public:
  SessionFixture()
      : console(makeTestPipePath("scanlink_session")),
        socketHandler(new LoopbackSocketHandler(console.getPipePath())),
        dispatcher(new EventDispatcher()),
        capability(new FakeScanCapability()) {
    console.start();
    ChannelOptions options;
    options.reconnectBaseDelay = std::chrono::milliseconds(20);
    options.keepaliveInterval = std::chrono::milliseconds(0);
    channel.reset(new ControlChannel(socketHandler, dispatcher, options));
    coordinator.reset(new PairingCoordinator(channel, capability));
  }

  void pairAndBegin() {
    REQUIRE(coordinator->pair("10.0.0.5", "abc123").isSuccess());
    session.reset(new ScanSession(channel, dispatcher, capability,
                                  *coordinator->getCredentials()));
    session->begin();
  }

  bool waitForStatusLine(const string& line) {
    return waitFor([this, line] { return session->getStatusLine() == line; });
  }

  FakeConsole console;
  shared_ptr<LoopbackSocketHandler> socketHandler;
  shared_ptr<EventDispatcher> dispatcher;
  shared_ptr<FakeScanCapability> capability;
  shared_ptr<ControlChannel> channel;
  shared_ptr<PairingCoordinator> coordinator;
  shared_ptr<ScanSession> session;
};
}  // namespace

TEST_CASE("Console controls the capture", "[ScanSession]") {
  SessionFixture f;
  f.pairAndBegin();
  REQUIRE(f.session->isActive());
  REQUIRE(f.session->isCapabilityAvailable());
  REQUIRE(f.session->getStatusLine() == "Connected");

  REQUIRE(f.console.send(Message::control(ControlAction::START)));
  REQUIRE(waitFor([&] { return f.session->isScanning(); }));
  REQUIRE(f.capability->getStartCalls() == 1);
  REQUIRE(f.capability->getLastScanToken() == "abc123");
  REQUIRE(f.session->getStatusLine() == "Scanning");

  // A second start while scanning is ignored
  REQUIRE(f.console.send(Message::control(ControlAction::START)));
  REQUIRE(f.console.send(Message::control(ControlAction::STOP)));
  REQUIRE(waitFor([&] { return !f.session->isScanning(); }));
  REQUIRE(f.capability->getStartCalls() == 1);
  REQUIRE(f.capability->getStopCalls() == 1);
  REQUIRE(f.session->getStatusLine() == "Connected");
}

TEST_CASE("Console updates reach the session state", "[ScanSession]") {
  SessionFixture f;
  f.pairAndBegin();

  REQUIRE(f.console.send(Message::instruction("Point at the door")));
  REQUIRE(f.console.send(Message::roomUpdate({{"walls", 3}})));
  REQUIRE(f.console.send(Message::status("Uploading")));
  REQUIRE(f.waitForStatusLine("Uploading"));
  REQUIRE(f.session->getLastInstruction() == "Point at the door");
  auto stats = f.session->getRoomStats();
  REQUIRE(stats.has_value());
  REQUIRE((*stats)["walls"] == 3);
}

TEST_CASE("Capture progress is relayed to the console", "[ScanSession]") {
  SessionFixture f;
  f.pairAndBegin();
  REQUIRE(f.console.send(Message::control(ControlAction::START)));
  REQUIRE(waitFor([&] { return f.session->isScanning(); }));

  f.capability->emit(INSTRUCTION_EVENT, {{"message", "Move left"}});
  f.capability->emit(SCAN_UPDATE_EVENT, {{"walls", 2}, {"progress", 0.5}});
  f.capability->emit(SCAN_COMPLETE_EVENT);
  REQUIRE(f.console.waitForReceived(MessageType::STATUS));

  auto instructions = f.console.getReceived(MessageType::INSTRUCTION);
  REQUIRE(instructions.size() == 1);
  REQUIRE(instructions[0].getText() == "Move left");
  auto updates = f.console.getReceived(MessageType::ROOM_UPDATE);
  REQUIRE(updates.size() == 1);
  REQUIRE(updates[0].getPayload()["walls"] == 2);
  auto statuses = f.console.getReceived(MessageType::STATUS);
  REQUIRE(statuses[0].getText() == "Scan complete");

  REQUIRE_FALSE(f.session->isScanning());
  REQUIRE(f.session->getStatusLine() == "Scan complete");
  REQUIRE(f.session->getLastInstruction() == "Move left");

  f.capability->emit(SCAN_ERROR_EVENT, {{"error", "Tracking lost"}});
  REQUIRE(f.console.waitForReceived(MessageType::STATUS, 2));
  REQUIRE(f.console.getReceived(MessageType::STATUS)[1].getText() ==
          "Scan error: Tracking lost");
}

TEST_CASE("Unsupported devices tell the console", "[ScanSession]") {
  SessionFixture f;
  f.capability->supported = false;
  f.pairAndBegin();
  REQUIRE_FALSE(f.session->isCapabilityAvailable());
  REQUIRE(f.session->getStatusLine() == "Capture not supported");
  REQUIRE(f.console.waitForReceived(MessageType::STATUS));
  REQUIRE(f.console.getReceived(MessageType::STATUS)[0].getText() ==
          "Capture not supported on this device");
  REQUIRE(f.capability->getListenerCount() == 0);

  REQUIRE(f.console.send(Message::control(ControlAction::START)));
  REQUIRE(f.console.send(Message::status("Noted")));
  REQUIRE(f.waitForStatusLine("Noted"));
  REQUIRE(f.capability->getStartCalls() == 0);
}

TEST_CASE("Failed captures are reported", "[ScanSession]") {
  SessionFixture f;
  f.capability->failStart = true;
  f.pairAndBegin();
  REQUIRE(f.console.send(Message::control(ControlAction::START)));
  REQUIRE(f.console.waitForReceived(MessageType::STATUS));
  REQUIRE(f.console.getReceived(MessageType::STATUS)[0].getText() ==
          "Scan failed: Camera unavailable");
  REQUIRE_FALSE(f.session->isScanning());
}

TEST_CASE("Connection changes show in the status line", "[ScanSession]") {
  SessionFixture f;
  f.pairAndBegin();
  EventRecorder recorder(f.dispatcher);

  f.console.dropClient();
  REQUIRE(recorder.waitForStatus(ConnectionStatus::RECONNECTING));
  REQUIRE(recorder.waitForStatus(ConnectionStatus::CONNECTED));
  REQUIRE(f.waitForStatusLine("Connected"));
  f.dispatcher->flush();
  REQUIRE(f.session->getStatusLine() == "Connected");
}

TEST_CASE("Ending the session stops everything", "[ScanSession]") {
  SessionFixture f;
  f.pairAndBegin();
  REQUIRE(f.console.send(Message::control(ControlAction::START)));
  REQUIRE(waitFor([&] { return f.session->isScanning(); }));
  REQUIRE(f.capability->getListenerCount() == 1);

  f.session->end();
  REQUIRE_FALSE(f.session->isActive());
  REQUIRE_FALSE(f.session->isScanning());
  REQUIRE(f.capability->getStopCalls() == 1);
  REQUIRE(f.capability->getListenerCount() == 0);
  REQUIRE(f.channel->getState().getStatus() == ConnectionStatus::DISCONNECTED);
  REQUIRE(f.session->getStatusLine() == "Disconnected");

  // Late provider events go nowhere
  f.capability->emit(SCAN_UPDATE_EVENT, {{"walls", 9}});
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(f.console.getReceived(MessageType::ROOM_UPDATE).empty());

  // Ending twice is harmless
  f.session->end();
}
