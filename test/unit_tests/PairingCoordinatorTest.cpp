#include "PairingCoordinator.hpp"

#include "EventRecorder.hpp"
#include "FakeConsole.hpp"
#include "FakeScanCapability.hpp"
#include "TestHeaders.hpp"

using namespace scanlink;

namespace {
class PairingFixture {
 public:
  PairingFixture(const ChannelOptions& options = ChannelOptions())
      : console(makeTestPipePath("scanlink_pairing")),
        socketHandler(new LoopbackSocketHandler(console.getPipePath())),
        dispatcher(new EventDispatcher()),
        recorder(dispatcher),
        capability(new FakeScanCapability()) {
    console.start();
    channel.reset(new ControlChannel(socketHandler, dispatcher, options));
    coordinator.reset(new PairingCoordinator(channel, capability));
  }

  FakeConsole console;
  shared_ptr<LoopbackSocketHandler> socketHandler;
  shared_ptr<EventDispatcher> dispatcher;
  EventRecorder recorder;
  shared_ptr<FakeScanCapability> capability;
  shared_ptr<ControlChannel> channel;
  shared_ptr<PairingCoordinator> coordinator;
};
}  // namespace

TEST_CASE("Pairs and points uploads at the console", "[PairingCoordinator]") {
  PairingFixture f;
  auto outcome = f.coordinator->pair("10.0.0.5", "abc123");
  REQUIRE(outcome.isSuccess());
  REQUIRE(outcome.describe() == "Connected");

  REQUIRE(f.console.getLastToken() == "abc123");
  auto endpoint = f.socketHandler->getLastEndpoint();
  REQUIRE(endpoint.name() == "10.0.0.5");
  REQUIRE(endpoint.port() == DEFAULT_CONSOLE_PORT);
  REQUIRE(f.capability->getUploadTargets() == vector<string>({"10.0.0.5"}));
  REQUIRE(f.coordinator->getCredentials() ==
          SessionCredentials("10.0.0.5", "abc123"));

  f.dispatcher->flush();
  REQUIRE(f.recorder.getStatuses() ==
          vector<ConnectionStatus>({ConnectionStatus::CONNECTING,
                                    ConnectionStatus::CONNECTED}));
}

TEST_CASE("Invalid input never reaches the network", "[PairingCoordinator]") {
  PairingFixture f;
  auto noHost = f.coordinator->pair("", "abc123");
  REQUIRE(noHost.getKind() == PairingOutcome::Kind::INVALID);
  REQUIRE(noHost.getField() == PairingOutcome::Field::HOST);

  auto noToken = f.coordinator->pair("10.0.0.5", "   ");
  REQUIRE(noToken.getKind() == PairingOutcome::Kind::INVALID);
  REQUIRE(noToken.getField() == PairingOutcome::Field::TOKEN);
  REQUIRE(noToken.describe().find("token") != string::npos);

  auto badHost = f.coordinator->pair("256.1.1.1", "abc123");
  REQUIRE(badHost.getField() == PairingOutcome::Field::HOST);
  REQUIRE(badHost.describe().find("valid IP address") != string::npos);

  REQUIRE(f.coordinator->pair("1.1.1", "abc123").getField() ==
          PairingOutcome::Field::HOST);
  REQUIRE(f.socketHandler->getConnectCalls() == 0);
  REQUIRE(f.capability->getUploadTargets().empty());
  REQUIRE_FALSE(f.coordinator->getCredentials().has_value());
}

TEST_CASE("Input is trimmed once for validation and use",
          "[PairingCoordinator]") {
  PairingFixture f;
  auto outcome = f.coordinator->pair(" 192.168.1.100 ", "\tabc123 \n");
  REQUIRE(outcome.isSuccess());
  REQUIRE(f.console.getLastToken() == "abc123");
  REQUIRE(f.socketHandler->getLastEndpoint().name() == "192.168.1.100");
  REQUIRE(f.capability->getUploadTargets() ==
          vector<string>({"192.168.1.100"}));
}

TEST_CASE("Upload target problems do not fail pairing",
          "[PairingCoordinator]") {
  PairingFixture f;
  f.capability->throwOnUpload = true;
  REQUIRE(f.coordinator->pair("10.0.0.5", "abc123").isSuccess());
  REQUIRE(f.channel->isConnected());

  PairingCoordinator withoutCapability(f.channel, nullptr);
  REQUIRE(withoutCapability.pair("10.0.0.5", "abc123").isSuccess());
}

TEST_CASE("Rejected tokens are reported", "[PairingCoordinator]") {
  PairingFixture f;
  f.console.setHelloReply(FakeConsole::HelloReply::REJECT, "Invalid token");
  auto outcome = f.coordinator->pair("10.0.0.5", "wrong");
  REQUIRE(outcome.getKind() == PairingOutcome::Kind::CONNECT_FAILED);
  REQUIRE(outcome.getFailureKind() == FailureKind::HANDSHAKE_REJECTED);
  REQUIRE(outcome.describe() ==
          "The console rejected the token: Invalid token");
  REQUIRE(f.capability->getUploadTargets().empty());
  REQUIRE_FALSE(f.coordinator->getCredentials().has_value());
}

TEST_CASE("A newer pairing preempts one in flight", "[PairingCoordinator]") {
  ChannelOptions options;
  options.handshakeTimeout = std::chrono::seconds(10);
  PairingFixture f(options);
  f.console.setHelloReply(FakeConsole::HelloReply::SILENT);

  auto first = std::async(std::launch::async, [&] {
    return f.coordinator->pair("10.0.0.5", "first");
  });
  REQUIRE(f.console.waitForHelloCount(1));
  f.console.setHelloReply(FakeConsole::HelloReply::ACK);

  auto second = f.coordinator->pair("10.0.0.6", "second");
  REQUIRE(second.isSuccess());
  auto firstOutcome = first.get();
  REQUIRE(firstOutcome.getKind() == PairingOutcome::Kind::CONNECT_FAILED);
  REQUIRE(firstOutcome.getFailureKind() == FailureKind::CANCELLED);

  REQUIRE(f.console.getLastToken() == "second");
  REQUIRE(f.capability->getUploadTargets() == vector<string>({"10.0.0.6"}));
  REQUIRE(f.channel->getCredentials() ==
          SessionCredentials("10.0.0.6", "second"));
  REQUIRE(f.channel->isConnected());
}

TEST_CASE("QR pairing fills gaps from the last input", "[PairingCoordinator]") {
  PairingFixture f;
  REQUIRE(f.coordinator->pair("10.0.0.5", "").getField() ==
          PairingOutcome::Field::TOKEN);

  QrScanResult scan;
  scan.set_token("abc123");
  scan.set_port(9000);
  REQUIRE(f.coordinator->pair(scan).isSuccess());
  auto endpoint = f.socketHandler->getLastEndpoint();
  REQUIRE(endpoint.name() == "10.0.0.5");
  REQUIRE(endpoint.port() == 9000);
  REQUIRE(f.console.getLastToken() == "abc123");
  REQUIRE(f.coordinator->getCredentials()->getPort() == 9000);
}
