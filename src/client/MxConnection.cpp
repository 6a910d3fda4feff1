#include "MxConnection.hpp"

namespace mx {
MxConnection::MxConnection(std::shared_ptr<Transport> _transport,
                           const ClientConfig& _config,
                           const DeviceProfile& _profile)
    : transport(_transport),
      config(_config),
      profile(_profile),
      endpoint(SocketEndpoint::parse(_config.endpoint)),
      codec(_profile.version),
      listenThreadId(std::thread::id()),
      listening(false),
      stopRequested(false) {}

MxConnection::~MxConnection() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  if (isListenThread()) {
    STFATAL << "Connection destroyed from its own listen thread";
  }
  stopListening();
}

void MxConnection::connect() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  if (isListenThread()) {
    throw ConnectError("Cannot reconnect from the listen thread");
  }
  stopListening();

  LOG(INFO) << "Connecting to " << endpoint;
  transport->open(endpoint, getHandshakeHeaders());
  stopRequested = false;

  try {
    sendFrame(Opcode::DEVICE_INIT, profile.deviceInitPayload());
  } catch (const SendError& se) {
    LOG(INFO) << "Device init failed: " << se.what();
    transport->close();
    throw;
  }
  LOG(INFO) << "Sent device init (device " << profile.deviceId.substr(0, 8)
            << "...)";

  listening = true;
  listenThread = std::thread(&MxConnection::runListenLoop, this);
}

void MxConnection::disconnect() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  stopListening();
}

void MxConnection::stopListening() {
  stopRequested = true;
  transport->close();
  if (listenThread.joinable() &&
      listenThread.get_id() != std::this_thread::get_id()) {
    listenThread.join();
  }
}

bool MxConnection::isConnected() { return listening && transport->isOpen(); }

bool MxConnection::isListenThread() const {
  return listenThreadId.load() == std::this_thread::get_id();
}

void MxConnection::runListenLoop() {
  el::Helpers::setThreadName("Listen");
  listenThreadId = std::this_thread::get_id();
  VLOG(1) << "Listen loop started";
  while (!stopRequested && transport->isOpen()) {
    try {
      string text;
      ReceiveStatus status = transport->receive(&text, config.pollInterval);
      if (status == ReceiveStatus::TIMEOUT) {
        continue;
      }
      if (status == ReceiveStatus::CLOSED) {
        LOG(INFO) << "Connection closed by peer";
        break;
      }
      Frame frame;
      try {
        frame = codec.decode(text);
      } catch (const DecodeError& de) {
        LOG(WARNING) << "Dropping malformed frame: " << de.what();
        VLOG(1) << "Malformed frame text: " << text;
        continue;
      }
      logFrame("Received", frame);
      router.dispatch(frame);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Error while handling inbound frame: " << e.what();
    }
  }
  listening = false;
  listenThreadId = std::thread::id();
  LOG(INFO) << "Listen loop finished";
}

uint64_t MxConnection::sendFrame(int opcode, const json& payload) {
  lock_guard<std::mutex> guard(sendMutex);
  Frame frame = codec.encode(FrameCmd::PUSH, opcode, payload);
  logFrame("Sending", frame);
  transport->send(frame.serialize());
  return frame.getSeq();
}

void MxConnection::logFrame(const char* direction, const Frame& frame) {
  if (config.debug) {
    LOG(INFO) << direction << ": " << endl
              << json({{"ver", frame.getVersion()},
                       {"cmd", frame.getCmd()},
                       {"seq", frame.getSeq()},
                       {"opcode", frame.getOpcode()},
                       {"payload", frame.getPayload()}})
                     .dump(2, ' ', false, json::error_handler_t::replace);
  } else {
    VLOG(2) << direction << " cmd " << frame.getCmd() << " opcode "
            << frame.getOpcode() << " seq " << frame.getSeq();
  }
}

map<string, string> MxConnection::getHandshakeHeaders() const {
  return {
      {"Origin", config.origin},
      {"User-Agent", profile.userAgent},
      {"Accept-Language", "ru-RU,ru;q=0.9,en-US;q=0.8,en;q=0.7"},
      {"Accept-Encoding", "gzip, deflate, br, zstd"},
      {"Cache-Control", "no-cache"},
      {"Pragma", "no-cache"},
  };
}

uint64_t MxConnection::sendAuthStart(const string& phone,
                                     const string& language) {
  return sendFrame(Opcode::AUTH_START, {{"phone", phone},
                                        {"type", "START_AUTH"},
                                        {"language", language}});
}

uint64_t MxConnection::sendAuthCode(const string& token,
                                    const string& verifyCode) {
  return sendFrame(Opcode::AUTH_VERIFY_CODE,
                   {{"token", token},
                    {"verifyCode", verifyCode},
                    {"authTokenType", "CHECK_CODE"}});
}

uint64_t MxConnection::sendAuthToken(const string& token, bool interactive) {
  return sendFrame(Opcode::AUTH_TOKEN, {{"interactive", interactive},
                                        {"token", token},
                                        {"chatsCount", config.chatsCount},
                                        {"chatsSync", 0},
                                        {"contactsSync", 0},
                                        {"presenceSync", 0},
                                        {"draftsSync", 0}});
}

uint64_t MxConnection::sendEvents(const json& events) {
  return sendFrame(Opcode::TELEMETRY, {{"events", events}});
}

uint64_t MxConnection::sendGetChats(const vector<int64_t>& chatIds) {
  return sendFrame(Opcode::CHATS, {{"chatIds", chatIds}});
}

uint64_t MxConnection::sendGetContacts(const vector<int64_t>& contactIds) {
  return sendFrame(Opcode::CONTACTS, {{"contactIds", contactIds}});
}

uint64_t MxConnection::sendMessage(int64_t chatId, const string& text,
                                   const optional<string>& replyTo) {
  json message = {{"text", text},
                  {"cid", nowMillis()},
                  {"elements", json::array()},
                  {"attaches", json::array()}};
  if (replyTo) {
    message["replyTo"] = *replyTo;
  }
  return sendFrame(Opcode::MESSAGE_SEND,
                   {{"chatId", chatId}, {"message", message}, {"notify", true}});
}

uint64_t MxConnection::sendSticker(int64_t chatId, int64_t stickerId,
                                   const optional<string>& replyTo) {
  json message = {
      {"cid", nowMillis()},
      {"attaches",
       json::array({{{"_type", "STICKER"}, {"stickerId", stickerId}}})}};
  if (replyTo) {
    message["replyTo"] = *replyTo;
  }
  return sendFrame(Opcode::MESSAGE_SEND,
                   {{"chatId", chatId}, {"message", message}, {"notify", true}});
}

uint64_t MxConnection::sendReaction(int64_t chatId, const string& messageId,
                                    const string& reactionId,
                                    const string& reactionType) {
  return sendFrame(
      Opcode::REACTION,
      {{"chatId", chatId},
       {"messageId", messageId},
       {"reaction", {{"reactionType", reactionType}, {"id", reactionId}}}});
}

uint64_t MxConnection::editMessage(int64_t chatId, const string& messageId,
                                   const string& text) {
  return sendFrame(Opcode::MESSAGE_EDIT,
                   {{"chatId", chatId}, {"messageId", messageId}, {"text", text}});
}

uint64_t MxConnection::deleteMessage(int64_t chatId, const string& messageId) {
  return sendFrame(Opcode::MESSAGE_DELETE,
                   {{"chatId", chatId}, {"messageId", messageId}});
}
}  // namespace mx
