#ifndef __SCANLINK_RECONNECT_POLICY__
#define __SCANLINK_RECONNECT_POLICY__

#include "Headers.hpp"

namespace scanlink {
/**
 * @brief Capped exponential backoff between reconnect attempts.
 *
 * Delays never decrease between two calls to reset(): each advance() returns
 * the current delay and multiplies the next one by the factor, up to the cap.
 */
class ReconnectPolicy {
 public:
  ReconnectPolicy(std::chrono::milliseconds _baseDelay,
                  std::chrono::milliseconds _maxDelay, double _factor,
                  int _maxAttempts = 0);

  /** @brief Back to {0, baseDelay}. Called on every successful connect. */
  void reset();

  /**
   * @brief Consumes one attempt.
   * @return How long to wait before that attempt.
   */
  std::chrono::milliseconds advance();

  /** @brief True once maxAttempts retries were made (never if it is 0). */
  bool exhausted() const { return maxAttempts > 0 && attempt >= maxAttempts; }

  int getAttempt() const { return attempt; }
  std::chrono::milliseconds getNextDelay() const { return nextDelay; }
  std::chrono::milliseconds getBaseDelay() const { return baseDelay; }
  std::chrono::milliseconds getMaxDelay() const { return maxDelay; }

 protected:
  std::chrono::milliseconds baseDelay;
  std::chrono::milliseconds maxDelay;
  double factor;
  int maxAttempts;
  int attempt;
  std::chrono::milliseconds nextDelay;
};
}  // namespace scanlink

#endif  // __SCANLINK_RECONNECT_POLICY__
