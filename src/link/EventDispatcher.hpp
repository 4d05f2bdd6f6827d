#ifndef __SCANLINK_EVENT_DISPATCHER__
#define __SCANLINK_EVENT_DISPATCHER__

#include "ChannelEvent.hpp"
#include "Headers.hpp"

namespace scanlink {
class EventDispatcher;

typedef std::function<void(const ChannelEvent&)> EventHandler;

/**
 * @brief Keeps a handler registered for as long as it is alive.
 */
class Subscription {
 public:
  Subscription() : id(-1) {}
  Subscription(std::weak_ptr<EventDispatcher> _dispatcher, int64_t _id)
      : dispatcher(_dispatcher), id(_id) {}
  Subscription(Subscription&& other) noexcept
      : dispatcher(std::move(other.dispatcher)), id(other.id) {
    other.id = -1;
  }
  Subscription& operator=(Subscription&& other) noexcept;
  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;
  ~Subscription() { unsubscribe(); }

  /**
   * @brief Removes the handler. When this returns the handler is not running
   * and will not run again. Safe to call from inside the handler.
   */
  void unsubscribe();
  bool isActive() const { return id >= 0; }

 protected:
  std::weak_ptr<EventDispatcher> dispatcher;
  int64_t id;
};

/**
 * @brief Delivers events to every subscribed handler on a dedicated thread.
 *
 * Events reach each handler in the order they were posted. post() never waits
 * for handlers. A handler that throws is logged and counted and does not
 * affect delivery to the others.
 */
class EventDispatcher : public std::enable_shared_from_this<EventDispatcher> {
 public:
  EventDispatcher();
  ~EventDispatcher();

  /** @brief The dispatcher must be owned by a shared_ptr. */
  Subscription subscribe(EventHandler handler);
  void unsubscribe(int64_t id);

  void post(const ChannelEvent& event);

  /**
   * @brief Blocks until every event posted so far has been delivered. Returns
   * immediately when called from a handler.
   */
  void flush();

  /** @brief Stops the dispatch thread. Queued events are dropped. */
  void shutdown();

  int64_t getHandlerFaults() const { return handlerFaults; }
  size_t getHandlerCount();

 protected:
  void run();
  void deliver(const ChannelEvent& event);

  std::mutex queueMutex;
  std::condition_variable queueCv;
  std::condition_variable idleCv;
  deque<ChannelEvent> queue;
  bool running;
  bool delivering;
  shared_ptr<std::thread> dispatchThread;

  // Held while handlers run so that unsubscribe() waits them out
  std::recursive_mutex handlerMutex;
  map<int64_t, EventHandler> handlers;
  int64_t nextHandlerId;
  std::atomic<int64_t> handlerFaults;
};
}  // namespace scanlink

#endif  // __SCANLINK_EVENT_DISPATCHER__
