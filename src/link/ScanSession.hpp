#ifndef __SCANLINK_SCAN_SESSION__
#define __SCANLINK_SCAN_SESSION__

#include "CapabilityEventBridge.hpp"
#include "ControlChannel.hpp"
#include "EventDispatcher.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "ScanCapability.hpp"
#include "SessionCredentials.hpp"

namespace scanlink {
/**
 * @brief What happens on the device once pairing succeeded.
 *
 * Starts and stops the capture when the console says so, relays local
 * capture progress to the console, and keeps the status line and room
 * statistics that the UI shows. Everything runs on the dispatcher thread.
 */
class ScanSession {
 public:
  ScanSession(shared_ptr<ControlChannel> _channel,
              shared_ptr<EventDispatcher> _dispatcher,
              shared_ptr<ScanCapability> _capability,
              const SessionCredentials& _credentials);
  ~ScanSession();

  void begin();
  /** @brief Stops capture and event delivery, then disconnects. */
  void end();

  string getStatusLine();
  string getLastInstruction();
  optional<json> getRoomStats();
  bool isScanning();
  bool isCapabilityAvailable();
  bool isActive();

 protected:
  shared_ptr<ControlChannel> channel;
  shared_ptr<EventDispatcher> dispatcher;
  shared_ptr<ScanCapability> capability;
  SessionCredentials credentials;
  CapabilityEventBridge bridge;
  Subscription subscription;

  std::recursive_mutex sessionMutex;
  bool active;
  bool capabilityAvailable;
  bool scanning;
  string statusLine;
  string lastInstruction;
  optional<json> roomStats;

  void handleEvent(const ChannelEvent& event);
  void handleMessage(const Message& message);
  void handleStateChange(const ConnectionState& state);
  void handleCapabilityEvent(const CapabilityEvent& event);
  void startScan();
  void stopScan();
  void setStatusLine(const string& line);
};
}  // namespace scanlink

#endif  // __SCANLINK_SCAN_SESSION__
