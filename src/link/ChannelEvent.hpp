#ifndef __SCANLINK_CHANNEL_EVENT__
#define __SCANLINK_CHANNEL_EVENT__

#include "ConnectionState.hpp"
#include "Headers.hpp"
#include "Message.hpp"
#include "ScanCapability.hpp"

namespace scanlink {
enum class EventKind {
  // A decoded inbound frame
  MESSAGE,
  // The channel moved to a new ConnectionState
  STATE_CHANGE,
  // A notification from the local capture provider
  CAPABILITY,
};

enum class EventSource {
  CHANNEL,
  LOCAL,
};

/**
 * @brief What subscribers of an EventDispatcher receive. Exactly one of
 * message, state or capability event is meaningful, selected by the kind.
 */
class ChannelEvent {
 public:
  static ChannelEvent fromMessage(const Message& message) {
    ChannelEvent e(EventKind::MESSAGE, EventSource::CHANNEL);
    e.message = message;
    return e;
  }
  static ChannelEvent fromState(const ConnectionState& state) {
    ChannelEvent e(EventKind::STATE_CHANGE, EventSource::CHANNEL);
    e.state = state;
    return e;
  }
  static ChannelEvent fromCapability(const CapabilityEvent& capabilityEvent) {
    ChannelEvent e(EventKind::CAPABILITY, EventSource::LOCAL);
    e.capabilityEvent = capabilityEvent;
    return e;
  }

  EventKind getKind() const { return kind; }
  EventSource getSource() const { return source; }
  /** @brief Only valid for MESSAGE events. */
  const Message& getMessage() const { return *message; }
  const ConnectionState& getState() const { return state; }
  const CapabilityEvent& getCapabilityEvent() const { return capabilityEvent; }

 protected:
  ChannelEvent(EventKind _kind, EventSource _source)
      : kind(_kind), source(_source) {}

  EventKind kind;
  EventSource source;
  optional<Message> message;
  ConnectionState state;
  CapabilityEvent capabilityEvent;
};
}  // namespace scanlink

#endif  // __SCANLINK_CHANNEL_EVENT__
