#ifndef __SCANLINK_FLAKY_SOCKET_HANDLER__
#define __SCANLINK_FLAKY_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace scanlink {
/**
 * @brief Wraps another SocketHandler and injects transport faults.
 *
 * Faults are either random (reads, writes and connects fail some of the time)
 * or driven explicitly with setOffline() and severActiveSockets().
 */
class FlakySocketHandler : public SocketHandler {
 public:
  FlakySocketHandler(shared_ptr<SocketHandler> _actualSocketHandler,
                     bool _randomFaults = false)
      : actualSocketHandler(_actualSocketHandler),
        randomFaults(_randomFaults),
        offline(false),
        connectAttempts(0) {}
  virtual ~FlakySocketHandler() {}

  /** @brief While offline every connect fails as if the host were down. */
  void setOffline(bool _offline) { offline = _offline; }

  /**
   * @brief Shuts down every open connection so that the peers see EOF.
   */
  void severActiveSockets() {
    for (int fd : actualSocketHandler->getActiveSockets()) {
      ::shutdown(fd, SHUT_RDWR);
    }
  }

  int getConnectAttempts() const { return connectAttempts; }

  virtual int connect(const SocketEndpoint& endpoint) {
    connectAttempts++;
    if (offline || (randomFaults && rand() % 2 == 0)) {
      errno = ECONNREFUSED;
      return -1;
    }
    return actualSocketHandler->connect(endpoint);
  }
  virtual bool hasData(int fd) {
    if (randomFaults && rand() % 10 == 0) {
      return false;
    }
    return actualSocketHandler->hasData(fd);
  }
  virtual ssize_t read(int fd, void* buf, size_t count) {
    if (randomFaults && rand() % 20 == 0) {
      errno = EPIPE;
      return -1;
    }
    return actualSocketHandler->read(fd, buf, count);
  }
  virtual ssize_t write(int fd, const void* buf, size_t count) {
    if (randomFaults && rand() % 20 == 0) {
      errno = EPIPE;
      return -1;
    }
    return actualSocketHandler->write(fd, buf, count);
  }
  virtual void close(int fd) { actualSocketHandler->close(fd); }
  virtual vector<int> getActiveSockets() {
    return actualSocketHandler->getActiveSockets();
  }

 protected:
  shared_ptr<SocketHandler> actualSocketHandler;
  bool randomFaults;
  atomic<bool> offline;
  atomic<int> connectAttempts;
};
}  // namespace scanlink

#endif  // __SCANLINK_FLAKY_SOCKET_HANDLER__
