#include "AuthSession.hpp"
#include "DeviceProfile.hpp"
#include "SessionStore.hpp"
#include "TestHeaders.hpp"

using namespace mx;

namespace {
string makeTempDirectory() {
  string pattern = GetTempDirectory() + string("mx_session_XXXXXXXX");
  return string(mkdtemp(&pattern[0]));
}
}  // namespace

TEST_CASE("A fresh session has the device defaults", "[SessionStore]") {
  JsonFileSessionStore store(GetTempDirectory() + "mx_missing/session.mx");
  REQUIRE(store.get("user_agent") == DEFAULT_USER_AGENT);
  REQUIRE(store.get("app_version") == "25.12.3");
  REQUIRE(store.get("device_type") == "ANDROID");
  REQUIRE(store.get("screen") == "1080x1920 1.0x");
  REQUIRE(store.get("timezone") == "Europe/Moscow");
  REQUIRE(store.get("version") == 11);
  REQUIRE(store.get("token").is_null());
  REQUIRE(store.get("phone").is_null());
  REQUIRE_FALSE(store.getString("token"));
  REQUIRE(store.get("device_id").get<string>().length() == 36);
  REQUIRE(store.get("absent", "fallback") == "fallback");

  JsonFileSessionStore other(GetTempDirectory() + "mx_missing/session.mx");
  REQUIRE(other.get("device_id") != store.get("device_id"));
}

TEST_CASE("Sessions survive a save and load", "[SessionStore]") {
  string directory = makeTempDirectory();
  string path = directory + "/nested/session.mx";

  string deviceId;
  {
    JsonFileSessionStore store(path);
    store.set("token", "secret-token");
    store.set("phone", "+79990000000");
    deviceId = store.get("device_id").get<string>();
    store.save();
  }
  REQUIRE(fs::exists(path));

  JsonFileSessionStore reloaded(path);
  reloaded.load();
  REQUIRE(reloaded.getString("token") == string("secret-token"));
  REQUIRE(reloaded.getString("phone") == string("+79990000000"));
  REQUIRE(reloaded.get("device_id") == deviceId);
  REQUIRE(reloaded.get("locale") == "ru");

  fs::remove_all(directory);
}

TEST_CASE("A corrupt session file is ignored", "[SessionStore]") {
  string directory = makeTempDirectory();
  string path = directory + "/session.mx";
  {
    ofstream out(path);
    out << "{ this is not json";
  }
  JsonFileSessionStore store(path);
  store.load();
  REQUIRE(store.get("device_type") == "ANDROID");
  fs::remove_all(directory);
}

TEST_CASE("Saving into an unwritable location raises PersistenceError",
          "[SessionStore]") {
  string directory = makeTempDirectory();
  string blocker = directory + "/file";
  {
    ofstream out(blocker);
    out << "x";
  }
  JsonFileSessionStore store(blocker + "/session.mx");
  REQUIRE_THROWS_AS(store.save(), PersistenceError);
  fs::remove_all(directory);
}

TEST_CASE("Device profile reads the store with defaults", "[DeviceProfile]") {
  MemorySessionStore store;
  store.set("device_id", "00000000-1111-2222-3333-444444444444");
  store.set("device_name", "Firefox");
  store.set("version", 12);

  DeviceProfile profile = DeviceProfile::fromStore(store);
  REQUIRE(profile.deviceId == "00000000-1111-2222-3333-444444444444");
  REQUIRE(profile.deviceName == "Firefox");
  REQUIRE(profile.osVersion == "Windows");
  REQUIRE(profile.version == 12);

  json init = profile.deviceInitPayload();
  REQUIRE(init["deviceId"] == "00000000-1111-2222-3333-444444444444");
  REQUIRE(init["userAgent"]["deviceName"] == "Firefox");
  REQUIRE(init["userAgent"]["headerUserAgent"] == DEFAULT_USER_AGENT);
  REQUIRE(init["userAgent"]["deviceType"] == "ANDROID");
  REQUIRE(init["userAgent"]["deviceLocale"] == "ru");
  REQUIRE(init["userAgent"]["appVersion"] == "25.12.3");
  REQUIRE(init["userAgent"].size() == 9);
}

TEST_CASE("Invalid UTF-8 values still save", "[SessionStore]") {
  string directory = makeTempDirectory();
  string path = directory + "/session.mx";
  {
    JsonFileSessionStore store(path);
    store.set("phone", string("+7999\xff\xfe"));
    store.set("token", "kept-token");
    REQUIRE_NOTHROW(store.save());
  }

  JsonFileSessionStore reloaded(path);
  reloaded.load();
  REQUIRE(reloaded.getString("token") == string("kept-token"));
  auto phone = reloaded.getString("phone");
  REQUIRE(phone);
  REQUIRE(phone->rfind("+7999", 0) == 0);
  fs::remove_all(directory);
}

TEST_CASE("Session persistence failures do not reach the caller",
          "[SessionStore]") {
  SECTION("Invalid UTF-8 phone in a file store") {
    string directory = makeTempDirectory();
    auto store =
        make_shared<JsonFileSessionStore>(directory + "/session.mx");
    AuthSession session(store);
    REQUIRE_NOTHROW(session.persistPhone(string("+7\xff")));
    REQUIRE(fs::exists(directory + "/session.mx"));
    REQUIRE(session.getPhone() == string("+7\xff"));
    fs::remove_all(directory);
  }

  SECTION("A store that refuses to save") {
    auto store = make_shared<MemorySessionStore>();
    store->setFailSaves(true);
    AuthSession session(store);
    REQUIRE_NOTHROW(session.persistToken("T"));
    REQUIRE(session.getToken() == string("T"));
  }
}
