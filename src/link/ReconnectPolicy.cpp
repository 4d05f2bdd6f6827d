#include "ReconnectPolicy.hpp"

namespace scanlink {
ReconnectPolicy::ReconnectPolicy(std::chrono::milliseconds _baseDelay,
                                 std::chrono::milliseconds _maxDelay,
                                 double _factor, int _maxAttempts)
    : baseDelay(_baseDelay),
      maxDelay(_maxDelay),
      factor(_factor),
      maxAttempts(_maxAttempts),
      attempt(0),
      nextDelay(_baseDelay) {
  if (baseDelay.count() < 0) {
    LOG(WARNING) << "Negative reconnect delay, using 0";
    baseDelay = std::chrono::milliseconds(0);
  }
  if (maxDelay < baseDelay) {
    LOG(WARNING) << "Reconnect delay cap " << maxDelay.count()
                 << "ms is below the base delay, using " << baseDelay.count()
                 << "ms";
    maxDelay = baseDelay;
  }
  if (factor < 1.0) {
    LOG(WARNING) << "Reconnect backoff factor " << factor
                 << " would shrink delays, using 1";
    factor = 1.0;
  }
  if (maxAttempts < 0) {
    maxAttempts = 0;
  }
  reset();
}

void ReconnectPolicy::reset() {
  attempt = 0;
  nextDelay = baseDelay;
}

std::chrono::milliseconds ReconnectPolicy::advance() {
  auto delay = nextDelay;
  attempt++;
  double scaled = double(nextDelay.count()) * factor;
  if (scaled >= double(maxDelay.count())) {
    nextDelay = maxDelay;
  } else {
    nextDelay = std::chrono::milliseconds(int64_t(scaled));
  }
  VLOG(1) << "Reconnect attempt " << attempt << " after " << delay.count()
          << "ms, next delay " << nextDelay.count() << "ms";
  return delay;
}
}  // namespace scanlink
