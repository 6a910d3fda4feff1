#include "DeviceProfile.hpp"

namespace mx {
namespace {
string readString(const SessionStore& store, const string& key,
                  const string& fallback) {
  json value = store.get(key);
  if (value.is_string()) {
    return value.get<string>();
  }
  return fallback;
}
}  // namespace

DeviceProfile DeviceProfile::fromStore(const SessionStore& store) {
  DeviceProfile profile;
  profile.deviceId = readString(store, "device_id", "");
  profile.userAgent = readString(store, "user_agent", DEFAULT_USER_AGENT);
  profile.appVersion = readString(store, "app_version", DEFAULT_APP_VERSION);
  profile.deviceType = readString(store, "device_type", DEFAULT_DEVICE_TYPE);
  profile.locale = readString(store, "locale", DEFAULT_LOCALE);
  profile.deviceLocale = readString(store, "device_locale", DEFAULT_LOCALE);
  profile.osVersion = readString(store, "os_version", DEFAULT_OS_VERSION);
  profile.deviceName = readString(store, "device_name", DEFAULT_DEVICE_NAME);
  profile.screen = readString(store, "screen", DEFAULT_SCREEN);
  profile.timezone = readString(store, "timezone", DEFAULT_TIMEZONE);
  json version = store.get("version");
  if (version.is_number_integer()) {
    profile.version = version.get<int>();
  }
  return profile;
}

void DeviceProfile::writeTo(SessionStore* store) const {
  store->set("device_id", deviceId);
  store->set("user_agent", userAgent);
  store->set("app_version", appVersion);
  store->set("device_type", deviceType);
  store->set("locale", locale);
  store->set("device_locale", deviceLocale);
  store->set("os_version", osVersion);
  store->set("device_name", deviceName);
  store->set("screen", screen);
  store->set("timezone", timezone);
  store->set("version", version);
  if (store->get("token").is_null()) {
    store->set("token", nullptr);
  }
  if (store->get("phone").is_null()) {
    store->set("phone", nullptr);
  }
}

json DeviceProfile::userAgentJson() const {
  return {{"deviceType", deviceType},   {"locale", locale},
          {"deviceLocale", deviceLocale}, {"osVersion", osVersion},
          {"deviceName", deviceName},   {"headerUserAgent", userAgent},
          {"appVersion", appVersion},   {"screen", screen},
          {"timezone", timezone}};
}

json DeviceProfile::deviceInitPayload() const {
  return {{"userAgent", userAgentJson()}, {"deviceId", deviceId}};
}
}  // namespace mx
