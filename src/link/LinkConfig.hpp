#ifndef __SCANLINK_LINK_CONFIG__
#define __SCANLINK_LINK_CONFIG__

#include "ControlChannel.hpp"
#include "Headers.hpp"

namespace scanlink {
/**
 * @brief Settings read from the scanlink INI file. Every key is optional.
 *
 *   [Networking] host, port, token
 *   [Reconnect]  enabled, base_delay_ms, max_delay_ms, factor, max_attempts
 *   [Session]    keepalive_seconds, handshake_timeout_ms
 *   [Debug]      verbose, silent, logsize
 */
struct LinkConfig {
  string host;
  string token;
  int port = DEFAULT_CONSOLE_PORT;

  bool reconnectEnabled = true;
  int reconnectBaseDelayMs = DEFAULT_RECONNECT_BASE_DELAY_MS;
  int reconnectMaxDelayMs = DEFAULT_RECONNECT_MAX_DELAY_MS;
  double reconnectFactor = DEFAULT_RECONNECT_FACTOR;
  int maxReconnectAttempts = 0;

  int keepaliveSeconds = DEFAULT_KEEPALIVE_SECONDS;
  int handshakeTimeoutMs = DEFAULT_HANDSHAKE_TIMEOUT_MS;

  int verbose = 0;
  bool silent = false;
  // default max log file size is 20MB
  string maxLogSize = "20971520";

  /**
   * @brief Loads the file at path on top of the defaults.
   * @throws std::runtime_error if the file cannot be read or a value does not
   * parse.
   */
  static LinkConfig loadFromFile(const string& path);

  ChannelOptions toChannelOptions() const;
};
}  // namespace scanlink

#endif  // __SCANLINK_LINK_CONFIG__
