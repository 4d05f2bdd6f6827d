#ifndef __SCANLINK_SESSION_CREDENTIALS__
#define __SCANLINK_SESSION_CREDENTIALS__

#include "Headers.hpp"

namespace scanlink {
/**
 * @brief Everything needed to open a channel to one console. Held in memory
 * only.
 */
class SessionCredentials {
 public:
  SessionCredentials() : port(DEFAULT_CONSOLE_PORT) {}
  SessionCredentials(const string& _host, const string& _token,
                     int _port = DEFAULT_CONSOLE_PORT)
      : host(_host), token(_token), port(_port) {}

  const string& getHost() const { return host; }
  const string& getToken() const { return token; }
  int getPort() const { return port; }

  SocketEndpoint getEndpoint() const {
    SocketEndpoint endpoint;
    endpoint.set_name(host);
    endpoint.set_port(port);
    return endpoint;
  }

  bool operator==(const SessionCredentials& other) const {
    return host == other.host && token == other.token && port == other.port;
  }
  bool operator!=(const SessionCredentials& other) const {
    return !(*this == other);
  }

 protected:
  string host;
  string token;
  int port;
};

inline std::ostream& operator<<(std::ostream& os,
                                const SessionCredentials& credentials) {
  os << credentials.getHost() << ":" << credentials.getPort() << " (token "
     << maskToken(credentials.getToken()) << ")";
  return os;
}
}  // namespace scanlink

#endif  // __SCANLINK_SESSION_CREDENTIALS__
