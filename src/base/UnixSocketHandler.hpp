#ifndef __SCANLINK_UNIX_SOCKET_HANDLER__
#define __SCANLINK_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace scanlink {
/**
 * @brief Default SocketHandler implementation using POSIX sockets with one
 * mutex per active descriptor.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /**
   * @brief Blocks with select() until the fd becomes readable or the timeout
   * passes.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  virtual bool hasData(int fd);
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes `count` bytes, retrying on EAGAIN for up to 5 seconds. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /** @brief Accepts a pending connection on a listening fd, or -1. */
  virtual int accept(int fd);
  /** @brief Closes the descriptor and removes it from the tracked set. */
  virtual void close(int fd);
  virtual vector<int> getActiveSockets();

 protected:
  /**
   * @brief Ensures that a descriptor is tracked and has its own mutex.
   */
  void addToActiveSockets(int fd);
  /**
   * @brief Per-socket initialization (non-blocking, no SIGPIPE).
   */
  virtual void initSocket(int fd);
  /**
   * @brief Adds SO_REUSEADDR for listening sockets.
   */
  virtual void initServerSocket(int fd);

  /** @brief Mutex per active socket to ensure serial read/write. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Guards access to the active socket map. */
  recursive_mutex globalMutex;
};
}  // namespace scanlink

#endif  // __SCANLINK_UNIX_SOCKET_HANDLER__
