#include "CapabilityEventBridge.hpp"

namespace scanlink {
CapabilityEventBridge::CapabilityEventBridge(
    shared_ptr<ScanCapability> _capability,
    shared_ptr<EventDispatcher> _dispatcher)
    : capability(_capability),
      dispatcher(_dispatcher),
      gate(new Gate()),
      forwarded(new std::atomic<int64_t>(0)),
      listenerId(-1) {}

CapabilityEventBridge::~CapabilityEventBridge() { stop(); }

void CapabilityEventBridge::start() {
  {
    lock_guard<std::mutex> guard(gate->mutex);
    if (gate->open) {
      return;
    }
    gate->open = true;
  }
  auto localGate = gate;
  auto localForwarded = forwarded;
  std::weak_ptr<EventDispatcher> weakDispatcher = dispatcher;
  listenerId = capability->addListener(
      [localGate, localForwarded, weakDispatcher](const CapabilityEvent& event) {
        lock_guard<std::mutex> guard(localGate->mutex);
        if (!localGate->open) {
          VLOG(1) << "Dropping " << event.name << " after the bridge stopped";
          return;
        }
        auto d = weakDispatcher.lock();
        if (!d) {
          return;
        }
        VLOG(2) << "Forwarding capability event " << event.name;
        d->post(ChannelEvent::fromCapability(event));
        (*localForwarded)++;
      });
  LOG(INFO) << "Capability event bridge started";
}

void CapabilityEventBridge::stop() {
  {
    lock_guard<std::mutex> guard(gate->mutex);
    if (!gate->open) {
      return;
    }
    gate->open = false;
  }
  if (listenerId >= 0) {
    capability->removeListener(listenerId);
    listenerId = -1;
  }
  LOG(INFO) << "Capability event bridge stopped";
}

bool CapabilityEventBridge::isRunning() {
  lock_guard<std::mutex> guard(gate->mutex);
  return gate->open;
}
}  // namespace scanlink
