#ifndef __MX_DEVICE_PROFILE__
#define __MX_DEVICE_PROFILE__

#include "Headers.hpp"
#include "SessionStore.hpp"

namespace mx {
const string DEFAULT_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) "
    "AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/142.0.0.0 Safari/537.36";
const string DEFAULT_APP_VERSION = "25.12.3";
const string DEFAULT_DEVICE_TYPE = "ANDROID";
const string DEFAULT_LOCALE = "ru";
const string DEFAULT_OS_VERSION = "Windows";
const string DEFAULT_DEVICE_NAME = "Chrome";
const string DEFAULT_SCREEN = "1080x1920 1.0x";
const string DEFAULT_TIMEZONE = "Europe/Moscow";

/**
 * @brief How this client presents itself to the server.
 */
struct DeviceProfile {
  string deviceId;
  string userAgent = DEFAULT_USER_AGENT;
  string appVersion = DEFAULT_APP_VERSION;
  string deviceType = DEFAULT_DEVICE_TYPE;
  string locale = DEFAULT_LOCALE;
  string deviceLocale = DEFAULT_LOCALE;
  string osVersion = DEFAULT_OS_VERSION;
  string deviceName = DEFAULT_DEVICE_NAME;
  string screen = DEFAULT_SCREEN;
  string timezone = DEFAULT_TIMEZONE;
  int version = PROTOCOL_VERSION;

  /** @brief Reads the profile keys, falling back to the defaults. */
  static DeviceProfile fromStore(const SessionStore& store);

  /** @brief Writes every profile key into the store (without saving). */
  void writeTo(SessionStore* store) const;

  /** @brief The `userAgent` object of the device-init payload. */
  json userAgentJson() const;

  /** @brief Full device-init payload. */
  json deviceInitPayload() const;
};
}  // namespace mx

#endif  // __MX_DEVICE_PROFILE__
