#include "MxClient.hpp"

namespace mx {
const size_t MxClient::MAX_SYNC_CONTACTS = 50;

MxClient::MxClient(const ClientConfig& _config,
                   std::shared_ptr<Transport> _transport,
                   std::shared_ptr<SessionStore> _store)
    : config(_config), store(_store), stopping(false) {
  store->load();
  profile = DeviceProfile::fromStore(*store);
  if (profile.deviceId.empty()) {
    profile.deviceId = sole::uuid4().str();
    store->set("device_id", profile.deviceId);
  }
  connection.reset(new MxConnection(_transport, config, profile));
  session.reset(new AuthSession(store));
  auth.reset(new AuthStateMachine(connection, session, config));
  supervisor.reset(new ReconnectSupervisor(connection, session, config));
}

MxClient::~MxClient() { shutdown(); }

json MxClient::start(const optional<string>& phone,
                     CodeProvider codeProvider) {
  connection->connect();
  json login = auth->authenticate(phone, codeProvider);
  syncAfterLogin(login);
  return login;
}

void MxClient::syncAfterLogin(const json& login) {
  bool hasSavedMessages = false;
  set<int64_t> contactIds;

  auto profileIt = login.find("profile");
  if (profileIt != login.end() && profileIt->is_object()) {
    auto contact = profileIt->find("contact");
    if (contact != profileIt->end() && contact->is_object()) {
      auto id = contact->find("id");
      if (id != contact->end() && id->is_number_integer()) {
        contactIds.insert(id->get<int64_t>());
      }
    }
  }

  auto chats = login.find("chats");
  if (chats != login.end() && chats->is_array()) {
    for (const auto& chat : *chats) {
      if (!chat.is_object()) {
        continue;
      }
      auto id = chat.find("id");
      if (id != chat.end() && id->is_number_integer() &&
          id->get<int64_t>() == 0) {
        hasSavedMessages = true;
      }
      auto participants = chat.find("participants");
      if (participants == chat.end() || !participants->is_object()) {
        continue;
      }
      for (auto it = participants->begin(); it != participants->end(); ++it) {
        try {
          size_t consumed = 0;
          int64_t participant = stoll(it.key(), &consumed);
          if (consumed == it.key().length()) {
            contactIds.insert(participant);
          }
        } catch (const std::logic_error&) {
          VLOG(1) << "Skipping participant id " << it.key();
        }
      }
    }
  }

  try {
    // Chat 0 is the saved-messages chat, the login reply leaves it partial
    if (hasSavedMessages) {
      connection->sendGetChats({0});
    }
    if (!contactIds.empty()) {
      vector<int64_t> ids(contactIds.begin(), contactIds.end());
      if (ids.size() > MAX_SYNC_CONTACTS) {
        ids.resize(MAX_SYNC_CONTACTS);
      }
      connection->sendGetContacts(ids);
    }
  } catch (const SendError& se) {
    LOG(WARNING) << "Error syncing after login: " << se.what();
  }
}

void MxClient::runUntilDisconnected() {
  unique_lock<std::mutex> lock(stopMutex);
  while (!stopping) {
    if (!connection->isConnected()) {
      lock.unlock();
      LOG(INFO) << "Connection lost, reconnecting";
      supervisor->reconnect();
      lock.lock();
      continue;
    }
    stopCondition.wait_for(lock, config.pollInterval);
  }
}

void MxClient::shutdown() {
  {
    lock_guard<std::mutex> guard(stopMutex);
    if (stopping) {
      return;
    }
    stopping = true;
    stopCondition.notify_all();
  }
  LOG(INFO) << "Shutting down";
  supervisor->cancel();
  connection->disconnect();
  auth->shutdown();
}

EventRouter::HandlerId MxClient::on(EventName name,
                                    EventRouter::Handler handler) {
  return connection->getRouter()->registerHandler(name, handler);
}

EventRouter::HandlerId MxClient::on(const string& name,
                                    EventRouter::Handler handler) {
  return connection->getRouter()->registerHandler(name, handler);
}

bool MxClient::removeHandler(EventName name, EventRouter::HandlerId id) {
  return connection->getRouter()->removeHandler(name, id);
}

void MxClient::ensureConnected() {
  if (!connection->isConnected()) {
    if (connection->isListenThread()) {
      // The listen loop is still unwinding; runUntilDisconnected reconnects
      throw SendError("Connection lost");
    }
    LOG(INFO) << "Connection lost, reconnecting";
    supervisor->reconnect();
  }
}

uint64_t MxClient::sendMessage(int64_t chatId, const string& text,
                               const optional<string>& replyTo) {
  ensureConnected();
  return connection->sendMessage(chatId, text, replyTo);
}

uint64_t MxClient::sendSticker(int64_t chatId, int64_t stickerId,
                               const optional<string>& replyTo) {
  ensureConnected();
  return connection->sendSticker(chatId, stickerId, replyTo);
}

uint64_t MxClient::sendReaction(int64_t chatId, const string& messageId,
                                const string& reaction) {
  ensureConnected();
  return connection->sendReaction(chatId, messageId, reaction);
}

uint64_t MxClient::editMessage(int64_t chatId, const string& messageId,
                               const string& text) {
  ensureConnected();
  return connection->editMessage(chatId, messageId, text);
}

uint64_t MxClient::deleteMessage(int64_t chatId, const string& messageId) {
  ensureConnected();
  return connection->deleteMessage(chatId, messageId);
}

uint64_t MxClient::requestChats(const vector<int64_t>& chatIds) {
  ensureConnected();
  return connection->sendGetChats(chatIds);
}

uint64_t MxClient::requestContacts(const vector<int64_t>& contactIds) {
  ensureConnected();
  return connection->sendGetContacts(contactIds);
}
}  // namespace mx
