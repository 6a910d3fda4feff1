#include "FakeTransport.hpp"
#include "MxConnection.hpp"
#include "TestHeaders.hpp"

using namespace mx;

namespace {
ClientConfig fastConfig() {
  ClientConfig config;
  config.endpoint = "wss://example.test/websocket";
  config.pollInterval = std::chrono::milliseconds(20);
  return config;
}

DeviceProfile testProfile() {
  DeviceProfile profile;
  profile.deviceId = "0a1b2c3d-0000-4000-8000-000000000000";
  return profile;
}
}  // namespace

TEST_CASE("Connecting sends device init before anything else",
          "[MxConnection]") {
  auto transport = make_shared<FakeTransport>();
  MxConnection connection(transport, fastConfig(), testProfile());
  connection.connect();
  REQUIRE(connection.isConnected());

  auto frames = transport->getSentFrames();
  REQUIRE(frames.size() == 1);
  REQUIRE(frames[0]["opcode"] == Opcode::DEVICE_INIT);
  REQUIRE(frames[0]["cmd"] == 0);
  REQUIRE(frames[0]["seq"] == 1);
  REQUIRE(frames[0]["ver"] == PROTOCOL_VERSION);
  REQUIRE(frames[0]["payload"]["deviceId"] ==
          "0a1b2c3d-0000-4000-8000-000000000000");
  REQUIRE(frames[0]["payload"]["userAgent"]["timezone"] == "Europe/Moscow");

  auto headers = transport->getLastHeaders();
  REQUIRE(headers["Origin"] == "https://web.max.ru");
  REQUIRE(headers["User-Agent"] == DEFAULT_USER_AGENT);
  REQUIRE(headers["Accept-Language"] == "ru-RU,ru;q=0.9,en-US;q=0.8,en;q=0.7");
  REQUIRE(headers["Accept-Encoding"] == "gzip, deflate, br, zstd");
  REQUIRE(headers["Cache-Control"] == "no-cache");
  REQUIRE(headers["Pragma"] == "no-cache");
  REQUIRE(transport->getLastEndpoint().getName() == "example.test");

  connection.disconnect();
  REQUIRE_FALSE(connection.isConnected());
}

TEST_CASE("Connect failures surface as ConnectError", "[MxConnection]") {
  auto transport = make_shared<FakeTransport>();
  transport->failNextOpens(1);
  MxConnection connection(transport, fastConfig(), testProfile());
  REQUIRE_THROWS_AS(connection.connect(), ConnectError);
  REQUIRE_FALSE(connection.isConnected());
  REQUIRE_THROWS_AS(connection.sendGetChats({1}), SendError);
}

TEST_CASE("Inbound frames reach handlers in arrival order", "[MxConnection]") {
  auto transport = make_shared<FakeTransport>();
  MxConnection connection(transport, fastConfig(), testProfile());

  std::mutex callsMutex;
  vector<int> calls;
  connection.getRouter()->registerHandler(
      EventName::NEW_MESSAGE, [&](const json& payload) {
        lock_guard<std::mutex> guard(callsMutex);
        calls.push_back(payload["n"].get<int>());
      });
  connection.connect();

  for (int i = 0; i < 20; i++) {
    transport->pushFrame(FrameCmd::PUSH, Opcode::NEW_MESSAGE, {{"n", i}});
  }
  REQUIRE(waitUntil([&]() {
    lock_guard<std::mutex> guard(callsMutex);
    return calls.size() == 20;
  }));
  for (int i = 0; i < 20; i++) {
    REQUIRE(calls[i] == i);
  }
  connection.disconnect();
}

TEST_CASE("Malformed and failing frames never stop the listen loop",
          "[MxConnection]") {
  auto transport = make_shared<FakeTransport>();
  MxConnection connection(transport, fastConfig(), testProfile());

  std::atomic<int> chats(0);
  connection.getRouter()->registerHandler(
      EventName::NEW_MESSAGE,
      [](const json&) { throw std::runtime_error("application bug"); });
  connection.getRouter()->registerHandler(EventName::CHATS_UPDATE,
                                          [&](const json&) { chats++; });
  connection.connect();

  transport->push("this is not json");
  transport->push("[]");
  transport->push(R"({"cmd":1})");
  transport->pushFrame(FrameCmd::PUSH, Opcode::NEW_MESSAGE, {{"n", 1}});
  transport->pushFrame(FrameCmd::REPLY_OK, 9999, json::object());
  transport->pushFrame(FrameCmd::REPLY_OK, Opcode::CHATS, {{"chats", {}}});

  REQUIRE(waitUntil([&]() { return chats == 1; }));
  REQUIRE(connection.isConnected());
  connection.disconnect();
}

TEST_CASE("A dropped transport ends the listen loop", "[MxConnection]") {
  auto transport = make_shared<FakeTransport>();
  MxConnection connection(transport, fastConfig(), testProfile());
  connection.connect();
  REQUIRE(connection.isConnected());

  transport->drop();
  REQUIRE(waitUntil([&]() { return !connection.isConnected(); }));
  REQUIRE_THROWS_AS(connection.sendGetContacts({7}), SendError);
}

TEST_CASE("Sequence numbers keep growing across reconnects",
          "[MxConnection]") {
  auto transport = make_shared<FakeTransport>();
  MxConnection connection(transport, fastConfig(), testProfile());
  connection.connect();
  REQUIRE(connection.sendGetChats({1, 2}) == 2);

  transport->drop();
  REQUIRE(waitUntil([&]() { return !connection.isConnected(); }));
  connection.connect();
  REQUIRE(transport->getOpenCount() == 2);

  auto frames = transport->getSentFrames();
  REQUIRE(frames.size() == 3);
  for (size_t i = 0; i < frames.size(); i++) {
    REQUIRE(frames[i]["seq"] == i + 1);
  }
  REQUIRE(frames[2]["opcode"] == Opcode::DEVICE_INIT);
  connection.disconnect();
}

TEST_CASE("Outbound builders produce the expected payloads",
          "[MxConnection]") {
  auto transport = make_shared<FakeTransport>();
  MxConnection connection(transport, fastConfig(), testProfile());
  connection.connect();

  SECTION("Text message with reply") {
    connection.sendMessage(100, "hello", string("msg-1"));
    json frame = transport->getSentFrames(Opcode::MESSAGE_SEND).at(0);
    json payload = frame["payload"];
    REQUIRE(payload["chatId"] == 100);
    REQUIRE(payload["notify"] == true);
    REQUIRE(payload["message"]["text"] == "hello");
    REQUIRE(payload["message"]["replyTo"] == "msg-1");
    REQUIRE(payload["message"]["elements"] == json::array());
    REQUIRE(payload["message"]["attaches"] == json::array());
    REQUIRE(payload["message"]["cid"].get<int64_t>() > 0);
  }

  SECTION("Sticker") {
    connection.sendSticker(100, 555);
    json payload =
        transport->getSentFrames(Opcode::MESSAGE_SEND).at(0)["payload"];
    REQUIRE(payload["message"]["attaches"][0]["_type"] == "STICKER");
    REQUIRE(payload["message"]["attaches"][0]["stickerId"] == 555);
    REQUIRE(payload["message"].count("replyTo") == 0);
  }

  SECTION("Reaction, edit and delete") {
    connection.sendReaction(5, "m1");
    connection.editMessage(5, "m1", "edited");
    connection.deleteMessage(5, "m1");
    json reaction = transport->getSentFrames(Opcode::REACTION).at(0)["payload"];
    REQUIRE(reaction["reaction"]["reactionType"] == "EMOJI");
    REQUIRE(reaction["reaction"]["id"] == "\xF0\x9F\x91\x8D");
    REQUIRE(reaction["messageId"] == "m1");
    json edit = transport->getSentFrames(Opcode::MESSAGE_EDIT).at(0)["payload"];
    REQUIRE(edit == json({{"chatId", 5}, {"messageId", "m1"}, {"text", "edited"}}));
    json remove =
        transport->getSentFrames(Opcode::MESSAGE_DELETE).at(0)["payload"];
    REQUIRE(remove == json({{"chatId", 5}, {"messageId", "m1"}}));
  }

  SECTION("Token auth") {
    connection.sendAuthToken("T");
    json payload = transport->getSentFrames(Opcode::AUTH_TOKEN).at(0)["payload"];
    REQUIRE(payload == json({{"interactive", false},
                             {"token", "T"},
                             {"chatsCount", 40},
                             {"chatsSync", 0},
                             {"contactsSync", 0},
                             {"presenceSync", 0},
                             {"draftsSync", 0}}));
  }

  connection.disconnect();
}

TEST_CASE("Invalid UTF-8 text does not skip sequence numbers",
          "[MxConnection]") {
  auto transport = make_shared<FakeTransport>();
  MxConnection connection(transport, fastConfig(), testProfile());
  connection.connect();

  REQUIRE(connection.sendMessage(7, string("bad \xff\xfe bytes")) == 2);
  REQUIRE(connection.sendMessage(7, "fine") == 3);

  auto frames = transport->getSentFrames();
  REQUIRE(frames.size() == 3);
  for (size_t i = 0; i < frames.size(); i++) {
    REQUIRE(frames[i]["seq"] == i + 1);
  }
  REQUIRE(frames[1]["payload"]["message"]["text"].get<string>().rfind(
              "bad ", 0) == 0);
  connection.disconnect();
}

TEST_CASE("Handlers cannot reconnect the connection they run on",
          "[MxConnection]") {
  auto transport = make_shared<FakeTransport>();
  MxConnection connection(transport, fastConfig(), testProfile());
  std::atomic<bool> refused(false);
  std::atomic<bool> onListenThread(false);
  connection.getRouter()->registerHandler(
      EventName::NEW_MESSAGE, [&](const json&) {
        onListenThread = connection.isListenThread();
        transport->drop();
        try {
          connection.connect();
        } catch (const ConnectError&) {
          refused = true;
        }
      });
  connection.connect();
  REQUIRE_FALSE(connection.isListenThread());

  transport->pushFrame(FrameCmd::PUSH, Opcode::NEW_MESSAGE, json::object());
  REQUIRE(waitUntil([&]() { return refused.load(); }));
  REQUIRE(onListenThread);
  REQUIRE(waitUntil([&]() { return !connection.isConnected(); }));
  REQUIRE(transport->getOpenCount() == 1);

  // A reconnect from outside the handler works as usual
  connection.connect();
  REQUIRE(connection.isConnected());
  REQUIRE(transport->getOpenCount() == 2);
  connection.disconnect();
}

TEST_CASE("Destroying a connection waits for the running handler",
          "[MxConnection]") {
  auto transport = make_shared<FakeTransport>();
  auto connection =
      make_shared<MxConnection>(transport, fastConfig(), testProfile());
  std::atomic<bool> entered(false);
  std::atomic<bool> finished(false);
  connection->getRouter()->registerHandler(
      EventName::NEW_MESSAGE, [&](const json&) {
        entered = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        finished = true;
      });
  connection->connect();
  transport->pushFrame(FrameCmd::PUSH, Opcode::NEW_MESSAGE, json::object());
  REQUIRE(waitUntil([&]() { return entered.load(); }));

  connection.reset();
  REQUIRE(finished);
}
