#include "CapabilityEventBridge.hpp"

#include "FakeScanCapability.hpp"
#include "TestHeaders.hpp"

using namespace scanlink;

TEST_CASE("Forwards capability events as local events",
          "[CapabilityEventBridge]") {
  auto capability = make_shared<FakeScanCapability>();
  auto dispatcher = make_shared<EventDispatcher>();
  std::mutex seenMutex;
  vector<ChannelEvent> seen;
  auto subscription = dispatcher->subscribe([&](const ChannelEvent& event) {
    lock_guard<std::mutex> guard(seenMutex);
    seen.push_back(event);
  });

  CapabilityEventBridge bridge(capability, dispatcher);
  // Nothing flows before start()
  capability->emit(SCAN_UPDATE_EVENT, {{"walls", 1}});
  bridge.start();
  REQUIRE(bridge.isRunning());
  REQUIRE(capability->getListenerCount() == 1);

  capability->emit(SCAN_UPDATE_EVENT, {{"walls", 2}});
  capability->emit(SCAN_COMPLETE_EVENT);
  dispatcher->flush();

  lock_guard<std::mutex> guard(seenMutex);
  REQUIRE(seen.size() == 2);
  REQUIRE(seen[0].getKind() == EventKind::CAPABILITY);
  REQUIRE(seen[0].getSource() == EventSource::LOCAL);
  REQUIRE(seen[0].getCapabilityEvent().name == SCAN_UPDATE_EVENT);
  REQUIRE(seen[0].getCapabilityEvent().body["walls"] == 2);
  REQUIRE(seen[1].getCapabilityEvent().name == SCAN_COMPLETE_EVENT);
  REQUIRE(bridge.getForwardedEvents() == 2);
}

TEST_CASE("Nothing is forwarded after stop", "[CapabilityEventBridge]") {
  auto capability = make_shared<FakeScanCapability>();
  auto dispatcher = make_shared<EventDispatcher>();
  std::atomic<int> delivered(0);
  auto subscription =
      dispatcher->subscribe([&](const ChannelEvent&) { delivered++; });

  CapabilityEventBridge bridge(capability, dispatcher);
  bridge.start();
  bridge.start();
  REQUIRE(capability->getListenerCount() == 1);
  capability->emit(INSTRUCTION_EVENT, "Move closer");
  bridge.stop();
  REQUIRE_FALSE(bridge.isRunning());
  REQUIRE(capability->getListenerCount() == 0);
  capability->emit(INSTRUCTION_EVENT, "Too late");
  dispatcher->flush();
  REQUIRE(delivered == 1);

  // A stopped bridge can be restarted
  bridge.start();
  capability->emit(INSTRUCTION_EVENT, "Again");
  dispatcher->flush();
  REQUIRE(delivered == 2);
}

TEST_CASE("Stopping races with a provider thread safely",
          "[CapabilityEventBridge]") {
  auto capability = make_shared<FakeScanCapability>();
  auto dispatcher = make_shared<EventDispatcher>();
  std::atomic<bool> stopped(false);
  std::atomic<int> lateEvents(0);
  auto subscription = dispatcher->subscribe([&](const ChannelEvent& event) {
    if (event.getCapabilityEvent().body == "after") {
      lateEvents++;
    }
  });

  CapabilityEventBridge bridge(capability, dispatcher);
  bridge.start();
  std::atomic<bool> emitting(true);
  std::thread provider([&]() {
    while (emitting) {
      capability->emit(SCAN_UPDATE_EVENT, stopped ? "after" : "before");
    }
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  bridge.stop();
  stopped = true;
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  emitting = false;
  provider.join();
  dispatcher->flush();
  REQUIRE(lateEvents == 0);
}
