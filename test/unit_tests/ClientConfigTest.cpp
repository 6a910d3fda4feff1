#include "ClientConfig.hpp"
#include "TestHeaders.hpp"

using namespace mx;

namespace {
string writeConfig(const string& contents) {
  string pattern = GetTempDirectory() + string("mx_config_XXXXXXXX");
  string directory = string(mkdtemp(&pattern[0]));
  string path = directory + "/mx.cfg";
  ofstream out(path);
  out << contents;
  return path;
}
}  // namespace

TEST_CASE("Defaults match the web client", "[ClientConfig]") {
  ClientConfig config;
  REQUIRE(config.endpoint == "wss://ws-api.oneme.ru/websocket");
  REQUIRE(config.origin == "https://web.max.ru");
  REQUIRE(config.language == "ru");
  REQUIRE(config.chatsCount == 40);
  REQUIRE(config.pollInterval == std::chrono::seconds(1));
  REQUIRE(config.reconnectDelay == std::chrono::seconds(2));
  REQUIRE(config.authDelay == std::chrono::milliseconds(500));
  REQUIRE(config.reconnectCooldown == std::chrono::seconds(5));
  REQUIRE(config.reauthTimeout == std::chrono::seconds(60));
  REQUIRE(config.tokenAuthTimeout == std::chrono::seconds(60));
  REQUIRE(config.sessionFile == "session.mx");
  REQUIRE_FALSE(config.debug);
}

TEST_CASE("Config files override only what they name", "[ClientConfig]") {
  string path = writeConfig(
      "[Networking]\n"
      "endpoint = ws://localhost:9000/socket\n"
      "\n"
      "[Auth]\n"
      "chats_count = 10\n"
      "reauth_timeout = 1500\n"
      "\n"
      "[Timing]\n"
      "poll_ms = 250\n"
      "auth_delay_ms = 0\n"
      "\n"
      "[Session]\n"
      "file = /var/lib/mx/session.mx\n"
      "\n"
      "[Debug]\n"
      "verbose = 3\n"
      "debug = 1\n"
      "logsize = 1024\n");

  ClientConfig config;
  config.loadFile(path);
  REQUIRE(config.endpoint == "ws://localhost:9000/socket");
  REQUIRE(config.origin == DEFAULT_ORIGIN);
  REQUIRE(config.chatsCount == 10);
  REQUIRE(config.reauthTimeout == std::chrono::milliseconds(1500));
  REQUIRE(config.tokenAuthTimeout == std::chrono::seconds(60));
  REQUIRE(config.pollInterval == std::chrono::milliseconds(250));
  REQUIRE(config.authDelay == std::chrono::milliseconds(0));
  REQUIRE(config.reconnectDelay == std::chrono::seconds(2));
  REQUIRE(config.sessionFile == "/var/lib/mx/session.mx");
  REQUIRE(config.verbose == 3);
  REQUIRE(config.debug);
  REQUIRE_FALSE(config.silent);
  REQUIRE(config.maxLogSize == "1024");

  fs::remove_all(fs::path(path).parent_path());
}

TEST_CASE("Bad config files are reported", "[ClientConfig]") {
  ClientConfig config;
  REQUIRE_THROWS_AS(config.loadFile(GetTempDirectory() + "mx_no_such.cfg"),
                    std::runtime_error);

  string path = writeConfig("[Timing]\npoll_ms = soon\n");
  REQUIRE_THROWS_AS(config.loadFile(path), std::runtime_error);
  fs::remove_all(fs::path(path).parent_path());

  SECTION("Trailing garbage after a number") {
    string trailing = writeConfig("[Timing]\npoll_ms = 12abc\n");
    ClientConfig partial;
    REQUIRE_THROWS_AS(partial.loadFile(trailing), std::runtime_error);
    REQUIRE(partial.pollInterval == std::chrono::seconds(1));
    fs::remove_all(fs::path(trailing).parent_path());
  }

  SECTION("Negative durations") {
    string negative = writeConfig("[Auth]\nreauth_timeout = -5\n");
    ClientConfig partial;
    REQUIRE_THROWS_AS(partial.loadFile(negative), std::runtime_error);
    fs::remove_all(fs::path(negative).parent_path());
  }
}
