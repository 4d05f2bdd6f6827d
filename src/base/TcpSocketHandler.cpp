#include "TcpSocketHandler.hpp"

namespace scanlink {
TcpSocketHandler::TcpSocketHandler(int _connectTimeoutMs)
    : connectTimeoutMs(_connectTimeoutMs) {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  int sockFd = -1;
  addrinfo *results = NULL;
  addrinfo *p = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = (AI_CANONNAME | AI_V4MAPPED | AI_ADDRCONFIG | AI_ALL);
  std::string portname = std::to_string(endpoint.port());
  std::string hostname = endpoint.name();

  // Resolution happens without holding the handler lock so that a slow DNS
  // lookup never blocks reads and writes on other sockets.
  ::res_init();
  int rc = getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &results);

  if (rc == EAI_NONAME) {
    VLOG_EVERY_N(1, 10) << "Cannot resolve hostname: " << gai_strerror(rc);
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  if (rc != 0) {
    LOG(ERROR) << "Error getting address info for " << endpoint << ": " << rc
               << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  // loop through all the results and connect to the first we can
  for (p = results; p != NULL; p = p->ai_next) {
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket: " << errno << " " << strerror(errno);
      continue;
    }

    // Set nonblocking just for the connect phase
    {
      int opts;
      opts = fcntl(sockFd, F_GETFL);
      FATAL_FAIL(opts);
      opts |= O_NONBLOCK;
      FATAL_FAIL(fcntl(sockFd, F_SETFL, opts));
    }
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1 &&
        errno != EINPROGRESS) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << errno << " "
                << strerror(errno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
    fd_set fdset;
    FD_ZERO(&fdset);
    FD_SET(sockFd, &fdset);
    timeval tv;
    tv.tv_sec = connectTimeoutMs / 1000;
    tv.tv_usec = (connectTimeoutMs % 1000) * 1000;
    VLOG(4) << "Before selecting sockFd";
    select(sockFd + 1, NULL, &fdset, NULL, &tv);

    if (FD_ISSET(sockFd, &fdset)) {
      int so_error;
      socklen_t len = sizeof so_error;

      FATAL_FAIL(::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &so_error, &len));

      if (so_error == 0) {
        LOG(INFO) << "Connected to console " << endpoint << " using fd "
                  << sockFd;
        break;  // if we get here, we must have connected successfully
      } else {
        LOG(INFO) << "Error connecting to " << endpoint << ": " << so_error
                  << " " << strerror(so_error);
        ::close(sockFd);
        sockFd = -1;
        continue;
      }
    } else {
      LOG(INFO) << "Timed out connecting to " << endpoint;
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    LOG(INFO) << "Could not reach " << endpoint;
    return -1;
  }
  lock_guard<std::recursive_mutex> guard(globalMutex);
  addToActiveSockets(sockFd);
  initSocket(sockFd);
  return sockFd;
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace scanlink
