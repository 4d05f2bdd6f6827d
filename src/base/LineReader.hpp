#ifndef __SCANLINK_LINE_READER__
#define __SCANLINK_LINE_READER__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace scanlink {
/**
 * @brief Splits the byte stream of a socket into newline-delimited frames.
 *
 * Bytes that arrive without a terminating newline are kept until the rest of
 * the frame shows up. A frame that grows past MAX_FRAME_LENGTH is dropped up
 * to and including its newline and counted in getDiscardedFrames().
 */
class LineReader {
 public:
  LineReader(shared_ptr<SocketHandler> socketHandler, int socketFd);

  /**
   * @brief Returns true if a complete frame is buffered or the socket is
   * readable.
   */
  bool hasData();

  /**
   * @brief Reads the next frame from the buffer or the socket.
   * @param frame Filled with the frame contents, without the newline.
   * @return 1 when a frame was read, 0 if more bytes are required, and -1 on
   * socket error or EOF (errno is EPIPE on EOF).
   */
  int read(string* frame);

  /** @brief Number of oversized frames dropped so far. */
  int64_t getDiscardedFrames() const { return discardedFrames; }

  int getSocketFd() const { return socketFd; }

 protected:
  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  /** @brief Bytes received after the last complete frame. */
  string partialFrame;
  /** @brief True while skipping the remainder of an oversized frame. */
  bool discarding;
  int64_t discardedFrames;

  bool popFrame(string* frame);
};
}  // namespace scanlink

#endif  // __SCANLINK_LINE_READER__
