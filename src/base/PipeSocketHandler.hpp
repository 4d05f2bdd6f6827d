#ifndef __SCANLINK_PIPE_SOCKET_HANDLER__
#define __SCANLINK_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace scanlink {
/**
 * @brief Handles UNIX domain socket connections addressed by a filesystem
 * path. The endpoint port is ignored.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to a pipe identified by the endpoint name.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Creates a listening UNIX socket and stores it internally.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /**
   * @brief Stops listening on the specified pipe, closes its fd and removes
   * the socket file.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Tracks path -> listening socket descriptors for each pipe. */
  map<string, set<int>> pipeServerSockets;
};
}  // namespace scanlink

#endif  // __SCANLINK_PIPE_SOCKET_HANDLER__
