#include "LineReader.hpp"

namespace scanlink {
LineReader::LineReader(shared_ptr<SocketHandler> socketHandler_, int socketFd_)
    : socketHandler(socketHandler_),
      socketFd(socketFd_),
      discarding(false),
      discardedFrames(0) {}

bool LineReader::hasData() {
  if (partialFrame.find('\n') != string::npos) {
    return true;
  }
  return socketHandler->hasData(socketFd);
}

int LineReader::read(string* frame) {
  if (popFrame(frame)) {
    return 1;
  }

  char tmpBuf[4096];
  ssize_t bytesRead = socketHandler->read(socketFd, tmpBuf, sizeof(tmpBuf));
  if (bytesRead == 0) {
    // The console closed the stream
    errno = EPIPE;
    return -1;
  } else if (bytesRead == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
    return 0;
  } else if (bytesRead == -1) {
    return -1;
  } else if (bytesRead < 0) {
    STFATAL << "Read returned value outside of [-1,inf): " << bytesRead;
  }
  partialFrame.append(tmpBuf, bytesRead);

  if (popFrame(frame)) {
    return 1;
  }
  return 0;
}

bool LineReader::popFrame(string* frame) {
  while (true) {
    auto newline = partialFrame.find('\n');
    if (discarding) {
      if (newline == string::npos) {
        partialFrame.clear();
        return false;
      }
      partialFrame.erase(0, newline + 1);
      discarding = false;
      continue;
    }
    if (newline == string::npos) {
      if (partialFrame.length() > MAX_FRAME_LENGTH) {
        LOG(WARNING) << "Dropping frame longer than " << MAX_FRAME_LENGTH
                     << " bytes";
        partialFrame.clear();
        discarding = true;
        discardedFrames++;
      }
      return false;
    }
    if (newline > MAX_FRAME_LENGTH) {
      LOG(WARNING) << "Dropping frame of length " << newline;
      partialFrame.erase(0, newline + 1);
      discardedFrames++;
      continue;
    }
    *frame = partialFrame.substr(0, newline);
    partialFrame.erase(0, newline + 1);
    if (!frame->empty() && frame->back() == '\r') {
      frame->pop_back();
    }
    if (frame->empty()) {
      // Blank lines carry nothing
      continue;
    }
    return true;
  }
}
}  // namespace scanlink
