#ifndef __SCANLINK_SOCKET_HANDLER__
#define __SCANLINK_SOCKET_HANDLER__

#include "Headers.hpp"

namespace scanlink {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Returns true when the kernel reports data ready to read on a
   * descriptor.
   */
  virtual bool hasData(int fd) = 0;
  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Writes one newline-terminated frame.
   * @throws std::runtime_error when the socket fails or stalls.
   */
  inline void writeFrame(int fd, const string& frame) {
    if (frame.find('\n') != string::npos) {
      STFATAL << "Frames may not contain newlines: " << frame;
    }
    if (frame.length() > MAX_FRAME_LENGTH) {
      STFATAL << "Invalid frame length: " << frame.length();
    }
    string s = frame + "\n";
    writeAllOrThrow(fd, &s[0], s.length(), true);
  }

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
  /** @brief Returns all currently active (read/write) sockets. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace scanlink

#endif  // __SCANLINK_SOCKET_HANDLER__
