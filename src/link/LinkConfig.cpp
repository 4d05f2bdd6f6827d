#include "LinkConfig.hpp"

#include "SimpleIni.h"

namespace scanlink {
namespace {
int readInt(const CSimpleIniA& ini, const char* section, const char* key,
            int defaultValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (!value) {
    return defaultValue;
  }
  try {
    size_t used = 0;
    int parsed = stoi(value, &used);
    if (used != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid value for ") + section + "." +
                             key + ": " + value);
  }
}

double readDouble(const CSimpleIniA& ini, const char* section,
                  const char* key, double defaultValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (!value) {
    return defaultValue;
  }
  try {
    return stod(value);
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid value for ") + section + "." +
                             key + ": " + value);
  }
}
}  // namespace

LinkConfig LinkConfig::loadFromFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  LinkConfig config;
  const char* host = ini.GetValue("Networking", "host", NULL);
  if (host) {
    config.host = trim(host);
  }
  const char* token = ini.GetValue("Networking", "token", NULL);
  if (token) {
    config.token = trim(token);
  }
  config.port = readInt(ini, "Networking", "port", config.port);
  if (config.port <= 0 || config.port > 65535) {
    throw std::runtime_error("Invalid port in " + path + ": " +
                             to_string(config.port));
  }

  config.reconnectEnabled =
      readInt(ini, "Reconnect", "enabled", config.reconnectEnabled) != 0;
  config.reconnectBaseDelayMs =
      readInt(ini, "Reconnect", "base_delay_ms", config.reconnectBaseDelayMs);
  config.reconnectMaxDelayMs =
      readInt(ini, "Reconnect", "max_delay_ms", config.reconnectMaxDelayMs);
  config.reconnectFactor =
      readDouble(ini, "Reconnect", "factor", config.reconnectFactor);
  config.maxReconnectAttempts =
      readInt(ini, "Reconnect", "max_attempts", config.maxReconnectAttempts);

  config.keepaliveSeconds =
      readInt(ini, "Session", "keepalive_seconds", config.keepaliveSeconds);
  config.handshakeTimeoutMs =
      readInt(ini, "Session", "handshake_timeout_ms", config.handshakeTimeoutMs);

  config.verbose = readInt(ini, "Debug", "verbose", config.verbose);
  config.silent = readInt(ini, "Debug", "silent", 0) != 0;
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // make sure maxlogsize is a string of int value
    config.maxLogSize = to_string(atoi(logsize));
  }
  return config;
}

ChannelOptions LinkConfig::toChannelOptions() const {
  ChannelOptions options;
  options.autoReconnect = reconnectEnabled;
  options.reconnectBaseDelay = std::chrono::milliseconds(reconnectBaseDelayMs);
  options.reconnectMaxDelay = std::chrono::milliseconds(reconnectMaxDelayMs);
  options.reconnectFactor = reconnectFactor;
  options.maxReconnectAttempts = maxReconnectAttempts;
  options.handshakeTimeout = std::chrono::milliseconds(handshakeTimeoutMs);
  options.keepaliveInterval = std::chrono::seconds(keepaliveSeconds);
  return options;
}
}  // namespace scanlink
