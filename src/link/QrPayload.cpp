#include "QrPayload.hpp"

namespace scanlink {
namespace {
struct ParsedUrl {
  string scheme;
  string host;
  optional<int> port;
  vector<string> path;
  vector<pair<string, string>> query;

  optional<string> queryValue(const string& key) const {
    for (const auto& it : query) {
      if (it.first == key) {
        return it.second;
      }
    }
    return std::nullopt;
  }
};

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

optional<int> parsePort(const string& s) {
  if (s.empty() || s.length() > 5) {
    return std::nullopt;
  }
  for (char c : s) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }
  int port = stoi(s);
  if (port <= 0 || port > 65535) {
    return std::nullopt;
  }
  return port;
}

bool parseUrl(const string& text, ParsedUrl* url) {
  auto schemeEnd = text.find("://");
  if (schemeEnd == string::npos || schemeEnd == 0) {
    return false;
  }
  url->scheme = text.substr(0, schemeEnd);
  std::transform(url->scheme.begin(), url->scheme.end(), url->scheme.begin(),
                 [](unsigned char c) { return char(::tolower(c)); });
  string rest = text.substr(schemeEnd + 3);

  auto fragment = rest.find('#');
  if (fragment != string::npos) {
    rest = rest.substr(0, fragment);
  }
  string queryString;
  auto queryStart = rest.find('?');
  if (queryStart != string::npos) {
    queryString = rest.substr(queryStart + 1);
    rest = rest.substr(0, queryStart);
  }
  string authority = rest;
  string pathString;
  auto pathStart = rest.find('/');
  if (pathStart != string::npos) {
    authority = rest.substr(0, pathStart);
    pathString = rest.substr(pathStart);
  }

  // Drop any userinfo
  auto at = authority.rfind('@');
  if (at != string::npos) {
    authority = authority.substr(at + 1);
  }
  string portString;
  if (!authority.empty() && authority[0] == '[') {
    auto close = authority.find(']');
    if (close == string::npos) {
      return false;
    }
    url->host = authority.substr(1, close - 1);
    if (close + 1 < authority.length() && authority[close + 1] == ':') {
      portString = authority.substr(close + 2);
    }
  } else {
    auto colon = authority.find(':');
    url->host = authority.substr(0, colon);
    if (colon != string::npos) {
      portString = authority.substr(colon + 1);
    }
  }
  if (!portString.empty()) {
    url->port = parsePort(portString);
    if (!url->port) {
      return false;
    }
  }

  for (const auto& component : split(pathString, '/')) {
    if (!component.empty()) {
      url->path.push_back(percentDecode(component));
    }
  }
  for (const auto& item : split(queryString, '&')) {
    if (item.empty()) {
      continue;
    }
    auto equals = item.find('=');
    if (equals == string::npos) {
      url->query.push_back(make_pair(percentDecode(item), string()));
    } else {
      url->query.push_back(make_pair(percentDecode(item.substr(0, equals)),
                                     percentDecode(item.substr(equals + 1))));
    }
  }
  return true;
}

const char* PAIR_FORMAT = "roomscan://pair?token=...&host=...&port=...";
}  // namespace

string percentDecode(const string& s) {
  string decoded;
  decoded.reserve(s.length());
  for (size_t a = 0; a < s.length(); a++) {
    if (s[a] == '%' && a + 2 < s.length()) {
      int high = hexValue(s[a + 1]);
      int low = hexValue(s[a + 2]);
      if (high >= 0 && low >= 0) {
        decoded.push_back(char(high * 16 + low));
        a += 2;
        continue;
      }
    }
    if (s[a] == '+') {
      decoded.push_back(' ');
    } else {
      decoded.push_back(s[a]);
    }
  }
  return decoded;
}

optional<QrScanResult> parseQrPayload(const string& rawText, string* error) {
  string text = trim(rawText);
  ParsedUrl url;
  if (text.empty() || !parseUrl(text, &url)) {
    *error = string("Invalid QR code format. Expected ") + PAIR_FORMAT;
    return std::nullopt;
  }

  QrScanResult result;
  if (url.scheme == "roomscan" && url.host == "pair") {
    auto token = url.queryValue("token");
    auto host = url.queryValue("host");
    if (!token || token->empty()) {
      *error = string("QR code missing session token. Expected format: ") +
               PAIR_FORMAT;
      return std::nullopt;
    }
    if (!host || host->empty()) {
      *error = string("QR code missing server address. Expected format: ") +
               PAIR_FORMAT;
      return std::nullopt;
    }
    result.set_token(*token);
    result.set_host(*host);
    auto portValue = url.queryValue("port");
    if (portValue) {
      auto port = parsePort(*portValue);
      if (port) {
        result.set_port(*port);
      } else {
        LOG(WARNING) << "Ignoring invalid port in QR code: " << *portValue;
      }
    }
    return result;
  }

  if (url.scheme != "http" && url.scheme != "https") {
    *error = "Unsupported QR code scheme: " + url.scheme;
    return std::nullopt;
  }

  auto download = std::find(url.path.begin(), url.path.end(), "download");
  if (download != url.path.end()) {
    if (download + 1 == url.path.end() || (download + 1)->empty()) {
      *error =
          "QR code missing session token in URL path. Expected format: "
          "http://host:port/download/<token>/room.usdz";
      return std::nullopt;
    }
    result.set_token(*(download + 1));
  } else {
    auto token = url.queryValue("token");
    if (!token || token->empty()) {
      *error =
          "QR code missing token parameter. Expected format: "
          "http://host:port?token=...&host=...";
      return std::nullopt;
    }
    result.set_token(*token);
    auto host = url.queryValue("host");
    if (host && !host->empty()) {
      result.set_host(*host);
    }
  }
  if (!result.has_host() && !url.host.empty()) {
    result.set_host(url.host);
  }
  if (url.port) {
    result.set_port(*url.port);
  }
  return result;
}
}  // namespace scanlink
