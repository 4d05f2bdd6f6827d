#ifndef __SCANLINK_SCAN_CAPABILITY__
#define __SCANLINK_SCAN_CAPABILITY__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace scanlink {
// Event names emitted by capture providers
const char* const SCAN_UPDATE_EVENT = "scanUpdate";
const char* const SCAN_COMPLETE_EVENT = "scanComplete";
const char* const SCAN_ERROR_EVENT = "scanError";
const char* const INSTRUCTION_EVENT = "instruction";

/**
 * @brief A capture progress notification from the provider. The body is
 * provider-defined.
 */
struct CapabilityEvent {
  string name;
  json body;
};

class CapabilityOutcome {
 public:
  static CapabilityOutcome ok() { return CapabilityOutcome(""); }
  static CapabilityOutcome failure(const string& error) {
    return CapabilityOutcome(error.empty() ? "Unknown error" : error);
  }

  bool isOk() const { return error.empty(); }
  const string& getError() const { return error; }

 protected:
  explicit CapabilityOutcome(const string& _error) : error(_error) {}

  string error;
};

typedef std::function<void(const CapabilityEvent&)> CapabilityListener;

/**
 * @brief The room capture engine, seen from the session protocol.
 *
 * Listeners may be invoked from any thread. removeListener() returns only
 * after any in-flight call to that listener has finished.
 */
class ScanCapability {
 public:
  virtual ~ScanCapability() {}

  virtual bool isSupported() = 0;
  virtual CapabilityOutcome startScan(const string& token) = 0;
  virtual CapabilityOutcome stopScan() = 0;
  /** @brief Where finished scans get uploaded. May throw. */
  virtual void setUploadTarget(const string& host) = 0;

  virtual int64_t addListener(CapabilityListener listener) = 0;
  virtual void removeListener(int64_t listenerId) = 0;
};
}  // namespace scanlink

#endif  // __SCANLINK_SCAN_CAPABILITY__
