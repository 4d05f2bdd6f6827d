#ifndef __SCANLINK_CAPABILITY_EVENT_BRIDGE__
#define __SCANLINK_CAPABILITY_EVENT_BRIDGE__

#include "EventDispatcher.hpp"
#include "Headers.hpp"
#include "ScanCapability.hpp"

namespace scanlink {
/**
 * @brief Re-posts the capture provider's events on an EventDispatcher as
 * locally sourced CAPABILITY events.
 *
 * Once stop() returns the bridge posts nothing more, even if the provider
 * keeps emitting.
 */
class CapabilityEventBridge {
 public:
  CapabilityEventBridge(shared_ptr<ScanCapability> _capability,
                        shared_ptr<EventDispatcher> _dispatcher);
  ~CapabilityEventBridge();

  void start();
  void stop();
  bool isRunning();

  int64_t getForwardedEvents() const { return forwarded->load(); }

 protected:
  // Shared with the listener so it stays valid if the provider outlives us
  struct Gate {
    std::mutex mutex;
    bool open = false;
  };

  shared_ptr<ScanCapability> capability;
  shared_ptr<EventDispatcher> dispatcher;
  shared_ptr<Gate> gate;
  shared_ptr<std::atomic<int64_t>> forwarded;
  int64_t listenerId;
};
}  // namespace scanlink

#endif  // __SCANLINK_CAPABILITY_EVENT_BRIDGE__
