#ifndef __SCANLINK_HEADERS__
#define __SCANLINK_HEADERS__

#if __APPLE__
#include <sys/ucred.h>
#endif

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <pthread.h>
#include <resolv.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#endif

#include "ScanLink.pb.h"
#include "easylogging++.h"
#include "ust.hpp"

using namespace std;

// Port the operator console listens on unless pairing says otherwise
static const int DEFAULT_CONSOLE_PORT = 8080;

// Role announced in the hello frame
static const char* const DEVICE_ROLE = "device";

// Handshake and liveness defaults
const int DEFAULT_HANDSHAKE_TIMEOUT_MS = 5000;
// The console must answer every {"type":"keepalive"} frame with one of its
// own (any inbound frame also counts). Two silent intervals are treated as a
// lost connection. Consoles that do not echo need keepalive_seconds = 0.
const int DEFAULT_KEEPALIVE_SECONDS = 20;

// Reconnect backoff defaults
const int DEFAULT_RECONNECT_BASE_DELAY_MS = 500;
const int DEFAULT_RECONNECT_MAX_DELAY_MS = 30 * 1000;
const double DEFAULT_RECONNECT_FACTOR = 2.0;

// Longest newline-delimited frame we accept from the console
const size_t MAX_FRAME_LENGTH = 1024 * 1024;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)     \
  if (((X) == -1) && errno != EINVAL) \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef SCANLINK_VERSION
#define SCANLINK_VERSION "unknown"
#endif

namespace scanlink {
inline std::ostream &operator<<(std::ostream &os,
                                const scanlink::SocketEndpoint &se) {
  if (se.has_name()) {
    os << se.name();
  }
  if (se.has_port()) {
    os << ":" << se.port();
  }
  return os;
}

template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

/** @brief Strips leading and trailing ASCII whitespace. */
inline string trim(const string &s) {
  static const char *whitespace = " \t\r\n\f\v";
  auto start = s.find_first_not_of(whitespace);
  if (start == string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(start, end - start + 1);
}

/**
 * @brief Hides a session token for logging, keeping only the first four
 * characters.
 */
inline string maskToken(const string &token) {
  if (token.length() <= 4) {
    return string(token.length(), '*');
  }
  return token.substr(0, 4) + string(token.length() - 4, '*');
}

/**
 * @brief Waits up to the given number of milliseconds for fd to become
 * readable.
 */
inline bool waitOnSocketData(int fd, int timeoutMs = 1000) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  VLOG(4) << "Before selecting sockFd";
  int rc = select(fd + 1, &fdset, NULL, NULL, &tv);
  if (rc == -1) {
    if (errno == EINTR) {
      return false;
    }
    STFATAL << "Error: (" << errno << "): " << strerror(errno);
  }
  return FD_ISSET(fd, &fdset);
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace scanlink

#endif
