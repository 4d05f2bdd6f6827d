#ifndef __SCANLINK_TCP_SOCKET_HANDLER__
#define __SCANLINK_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace scanlink {
/**
 * @brief Implements IPv4/IPv6 socket operations built on top of
 * UnixSocketHandler.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  explicit TcpSocketHandler(int _connectTimeoutMs = 10 * 1000);
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects to the console, giving up
   * after the connect timeout.
   */
  virtual int connect(const SocketEndpoint& endpoint);

 protected:
  int connectTimeoutMs;

  /**
   * @brief Performs additional TCP-specific socket configuration (NODELAY).
   */
  virtual void initSocket(int fd);
};
}  // namespace scanlink

#endif  // __SCANLINK_TCP_SOCKET_HANDLER__
