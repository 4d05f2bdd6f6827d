#include "EventDispatcher.hpp"

#include "TestHeaders.hpp"

using namespace scanlink;

namespace {
ChannelEvent statusEvent(const string& text) {
  return ChannelEvent::fromMessage(Message::status(text));
}
}  // namespace

TEST_CASE("Delivers every event in post order", "[EventDispatcher]") {
  auto dispatcher = make_shared<EventDispatcher>();
  std::mutex seenMutex;
  vector<string> seen;
  auto subscription = dispatcher->subscribe([&](const ChannelEvent& event) {
    lock_guard<std::mutex> guard(seenMutex);
    seen.push_back(event.getMessage().getText());
  });

  for (int a = 0; a < 100; a++) {
    dispatcher->post(statusEvent(to_string(a)));
  }
  // Two identical statuses are both delivered
  dispatcher->post(statusEvent("same"));
  dispatcher->post(statusEvent("same"));
  dispatcher->flush();

  lock_guard<std::mutex> guard(seenMutex);
  REQUIRE(seen.size() == 102);
  for (int a = 0; a < 100; a++) {
    REQUIRE(seen[a] == to_string(a));
  }
  REQUIRE(seen[100] == "same");
  REQUIRE(seen[101] == "same");
}

TEST_CASE("A throwing handler does not affect the others",
          "[EventDispatcher]") {
  auto dispatcher = make_shared<EventDispatcher>();
  std::atomic<int> delivered(0);
  auto bad = dispatcher->subscribe([](const ChannelEvent&) {
    throw std::runtime_error("handler bug");
  });
  auto good =
      dispatcher->subscribe([&](const ChannelEvent&) { delivered++; });

  dispatcher->post(statusEvent("one"));
  dispatcher->post(statusEvent("two"));
  dispatcher->flush();
  REQUIRE(delivered == 2);
  REQUIRE(dispatcher->getHandlerFaults() == 2);
}

TEST_CASE("Unsubscribed handlers are not called again", "[EventDispatcher]") {
  auto dispatcher = make_shared<EventDispatcher>();
  std::atomic<int> delivered(0);
  auto subscription =
      dispatcher->subscribe([&](const ChannelEvent&) { delivered++; });
  REQUIRE(dispatcher->getHandlerCount() == 1);

  dispatcher->post(statusEvent("one"));
  dispatcher->flush();
  subscription.unsubscribe();
  REQUIRE_FALSE(subscription.isActive());
  REQUIRE(dispatcher->getHandlerCount() == 0);

  dispatcher->post(statusEvent("two"));
  dispatcher->flush();
  REQUIRE(delivered == 1);

  // Unsubscribing twice is harmless
  subscription.unsubscribe();
}

TEST_CASE("Unsubscribe waits for a running handler", "[EventDispatcher]") {
  auto dispatcher = make_shared<EventDispatcher>();
  std::atomic<bool> inHandler(false);
  std::atomic<bool> handlerDone(false);
  auto subscription = dispatcher->subscribe([&](const ChannelEvent&) {
    inHandler = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    handlerDone = true;
  });

  dispatcher->post(statusEvent("slow"));
  REQUIRE(waitFor([&] { return bool(inHandler); }));
  subscription.unsubscribe();
  REQUIRE(handlerDone);
}

TEST_CASE("Handlers may unsubscribe themselves", "[EventDispatcher]") {
  auto dispatcher = make_shared<EventDispatcher>();
  std::atomic<int> delivered(0);
  Subscription subscription;
  subscription = dispatcher->subscribe([&](const ChannelEvent&) {
    delivered++;
    subscription.unsubscribe();
    // flush() from the dispatch thread must not wait on itself
    dispatcher->flush();
  });

  dispatcher->post(statusEvent("one"));
  dispatcher->post(statusEvent("two"));
  dispatcher->flush();
  REQUIRE(delivered == 1);
}

TEST_CASE("Subscriptions end with their scope", "[EventDispatcher]") {
  auto dispatcher = make_shared<EventDispatcher>();
  {
    auto subscription = dispatcher->subscribe([](const ChannelEvent&) {});
    REQUIRE(dispatcher->getHandlerCount() == 1);
  }
  REQUIRE(dispatcher->getHandlerCount() == 0);
}

TEST_CASE("Posts after shutdown are dropped", "[EventDispatcher]") {
  auto dispatcher = make_shared<EventDispatcher>();
  std::atomic<int> delivered(0);
  auto subscription =
      dispatcher->subscribe([&](const ChannelEvent&) { delivered++; });
  dispatcher->shutdown();
  dispatcher->post(statusEvent("late"));
  dispatcher->flush();
  REQUIRE(delivered == 0);
}

TEST_CASE("A handler may release the last reference to the dispatcher",
          "[EventDispatcher]") {
  auto dispatcher = make_shared<EventDispatcher>();
  std::weak_ptr<EventDispatcher> watcher = dispatcher;
  shared_ptr<EventDispatcher> owner = dispatcher;
  std::atomic<bool> released(false);
  auto subscription = dispatcher->subscribe([&](const ChannelEvent&) {
    owner.reset();
    released = true;
  });

  dispatcher->post(statusEvent("last"));
  dispatcher.reset();
  REQUIRE(waitFor([&] { return released.load(); }));
  REQUIRE(waitFor([&] { return watcher.expired(); }));
  subscription.unsubscribe();
  REQUIRE_FALSE(subscription.isActive());
}
