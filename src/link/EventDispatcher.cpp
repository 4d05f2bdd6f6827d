#include "EventDispatcher.hpp"

namespace scanlink {
Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    unsubscribe();
    dispatcher = std::move(other.dispatcher);
    id = other.id;
    other.id = -1;
  }
  return *this;
}

void Subscription::unsubscribe() {
  if (id < 0) {
    return;
  }
  auto d = dispatcher.lock();
  if (d) {
    d->unsubscribe(id);
  }
  id = -1;
}

EventDispatcher::EventDispatcher()
    : running(true), delivering(false), nextHandlerId(0), handlerFaults(0) {
  dispatchThread.reset(new std::thread(&EventDispatcher::run, this));
}

EventDispatcher::~EventDispatcher() { shutdown(); }

Subscription EventDispatcher::subscribe(EventHandler handler) {
  lock_guard<std::recursive_mutex> guard(handlerMutex);
  int64_t id = nextHandlerId++;
  handlers[id] = handler;
  VLOG(2) << "Subscribed event handler " << id;
  return Subscription(shared_from_this(), id);
}

void EventDispatcher::unsubscribe(int64_t id) {
  lock_guard<std::recursive_mutex> guard(handlerMutex);
  if (handlers.erase(id)) {
    VLOG(2) << "Unsubscribed event handler " << id;
  }
}

size_t EventDispatcher::getHandlerCount() {
  lock_guard<std::recursive_mutex> guard(handlerMutex);
  return handlers.size();
}

void EventDispatcher::post(const ChannelEvent& event) {
  {
    lock_guard<std::mutex> guard(queueMutex);
    if (!running) {
      VLOG(1) << "Dropping event posted after shutdown";
      return;
    }
    queue.push_back(event);
  }
  queueCv.notify_one();
}

void EventDispatcher::flush() {
  if (dispatchThread && std::this_thread::get_id() == dispatchThread->get_id()) {
    return;
  }
  std::unique_lock<std::mutex> lock(queueMutex);
  idleCv.wait(lock,
              [this] { return !running || (queue.empty() && !delivering); });
}

void EventDispatcher::shutdown() {
  {
    lock_guard<std::mutex> guard(queueMutex);
    if (!running) {
      return;
    }
    running = false;
    queue.clear();
  }
  queueCv.notify_all();
  idleCv.notify_all();
  if (dispatchThread) {
    if (std::this_thread::get_id() == dispatchThread->get_id()) {
      dispatchThread->detach();
    } else {
      dispatchThread->join();
    }
    dispatchThread.reset();
  }
}

void EventDispatcher::run() {
  el::Helpers::setThreadName("dispatch");
  while (true) {
    optional<ChannelEvent> event;
    // Held across delivery: a handler may drop the last outside reference
    shared_ptr<EventDispatcher> self;
    {
      std::unique_lock<std::mutex> lock(queueMutex);
      queueCv.wait(lock, [this] { return !running || !queue.empty(); });
      if (!running) {
        break;
      }
      event = queue.front();
      queue.pop_front();
      delivering = true;
      self = weak_from_this().lock();
    }
    deliver(*event);
    {
      lock_guard<std::mutex> guard(queueMutex);
      delivering = false;
    }
    idleCv.notify_all();

    if (!self) {
      continue;
    }
    std::weak_ptr<EventDispatcher> watcher = self;
    self.reset();
    if (watcher.expired()) {
      // Destroyed on this thread; no member may be touched from here on
      return;
    }
  }
}

void EventDispatcher::deliver(const ChannelEvent& event) {
  lock_guard<std::recursive_mutex> guard(handlerMutex);
  vector<int64_t> ids;
  for (const auto& it : handlers) {
    ids.push_back(it.first);
  }
  for (auto id : ids) {
    auto it = handlers.find(id);
    if (it == handlers.end()) {
      // Removed by an earlier handler for this event
      continue;
    }
    // The handler may unsubscribe itself, so call a copy
    EventHandler handler = it->second;
    try {
      handler(event);
    } catch (const std::exception& e) {
      handlerFaults++;
      LOG(ERROR) << "Event handler " << id << " threw: " << e.what();
    } catch (...) {
      handlerFaults++;
      LOG(ERROR) << "Event handler " << id << " threw a non-standard exception";
    }
  }
}
}  // namespace scanlink
