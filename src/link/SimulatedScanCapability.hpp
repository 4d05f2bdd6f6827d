#ifndef __SCANLINK_SIMULATED_SCAN_CAPABILITY__
#define __SCANLINK_SIMULATED_SCAN_CAPABILITY__

#include "Headers.hpp"
#include "ScanCapability.hpp"

namespace scanlink {
/**
 * @brief A capture provider that pretends to scan a room, for hosts without
 * a capture engine.
 *
 * Each scan emits one instruction, then a scanUpdate every step with growing
 * wall/door/window/object counts, then scanComplete after totalSteps.
 */
class SimulatedScanCapability : public ScanCapability {
 public:
  SimulatedScanCapability(std::chrono::milliseconds _stepInterval =
                              std::chrono::milliseconds(1000),
                          int _totalSteps = 30);
  virtual ~SimulatedScanCapability();

  virtual bool isSupported() { return true; }
  virtual CapabilityOutcome startScan(const string& token);
  virtual CapabilityOutcome stopScan();
  virtual void setUploadTarget(const string& host);

  virtual int64_t addListener(CapabilityListener listener);
  virtual void removeListener(int64_t listenerId);

  string getUploadTarget();

 protected:
  std::chrono::milliseconds stepInterval;
  int totalSteps;

  std::recursive_mutex listenerMutex;
  map<int64_t, CapabilityListener> listeners;
  int64_t nextListenerId;

  std::mutex scanMutex;
  std::condition_variable scanCv;
  bool stopRequested;
  shared_ptr<std::thread> scanThread;
  string uploadTarget;

  void runScan(string token);
  void emit(const string& name, const json& body);
  void joinScanThread();
};
}  // namespace scanlink

#endif  // __SCANLINK_SIMULATED_SCAN_CAPABILITY__
