#include "ClientConfig.hpp"

#include "SimpleIni.h"

namespace mx {
namespace {
int readInt(const CSimpleIniA& ini, const char* section, const char* key,
            int fallback) {
  const char* value = ini.GetValue(section, key, NULL);
  if (!value) {
    return fallback;
  }
  try {
    size_t consumed = 0;
    int result = stoi(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return result;
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid integer for [") + section + "] " +
                             key + ": " + value);
  }
}

std::chrono::milliseconds readMillis(const CSimpleIniA& ini,
                                     const char* section, const char* key,
                                     std::chrono::milliseconds fallback) {
  int ms = readInt(ini, section, key, int(fallback.count()));
  if (ms < 0) {
    throw std::runtime_error(string("Negative duration for [") + section +
                             "] " + key);
  }
  return std::chrono::milliseconds(ms);
}

void readString(const CSimpleIniA& ini, const char* section, const char* key,
                string* out) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value) {
    *out = string(value);
  }
}
}  // namespace

void ClientConfig::loadFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  readString(ini, "Networking", "endpoint", &endpoint);
  readString(ini, "Networking", "origin", &origin);

  readString(ini, "Auth", "language", &language);
  chatsCount = readInt(ini, "Auth", "chats_count", chatsCount);
  tokenAuthTimeout = readMillis(ini, "Auth", "token_timeout", tokenAuthTimeout);
  reauthTimeout = readMillis(ini, "Auth", "reauth_timeout", reauthTimeout);

  pollInterval = readMillis(ini, "Timing", "poll_ms", pollInterval);
  reconnectDelay =
      readMillis(ini, "Timing", "reconnect_delay_ms", reconnectDelay);
  authDelay = readMillis(ini, "Timing", "auth_delay_ms", authDelay);
  reconnectCooldown =
      readMillis(ini, "Timing", "reconnect_cooldown_ms", reconnectCooldown);

  readString(ini, "Session", "file", &sessionFile);

  verbose = readInt(ini, "Debug", "verbose", verbose);
  silent = readInt(ini, "Debug", "silent", silent ? 1 : 0) != 0;
  debug = readInt(ini, "Debug", "debug", debug ? 1 : 0) != 0;
  // Keep the log size a string holding an int, easylogging wants it that way
  int logsize = readInt(ini, "Debug", "logsize", 0);
  if (logsize > 0) {
    maxLogSize = to_string(logsize);
  }
  LOG(INFO) << "Loaded config from " << path;
}
}  // namespace mx
