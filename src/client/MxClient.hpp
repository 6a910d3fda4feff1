#ifndef __MX_CLIENT__
#define __MX_CLIENT__

#include "AuthStateMachine.hpp"
#include "ClientConfig.hpp"
#include "Headers.hpp"
#include "MxConnection.hpp"
#include "ReconnectSupervisor.hpp"
#include "SessionStore.hpp"
#include "Transport.hpp"

namespace mx {
/**
 * @brief Ties the connection, authentication and reconnect logic together
 * behind the API an application uses.
 */
class MxClient {
 public:
  MxClient(const ClientConfig& _config, std::shared_ptr<Transport> _transport,
           std::shared_ptr<SessionStore> _store);

  virtual ~MxClient();

  /** @brief Most contacts requested in the sync that follows login. */
  static const size_t MAX_SYNC_CONTACTS;

  /**
   * @brief Connects, authenticates and requests the saved-messages chat and
   * the contacts the login reply mentions.
   * @return the auth_success payload.
   * @throws ConnectError, SendError or AuthFailed.
   */
  json start(const optional<string>& phone = nullopt,
             CodeProvider codeProvider = nullptr);

  /**
   * @brief Keeps the connection alive, reconnecting whenever it drops, until
   * shutdown() is called.
   */
  void runUntilDisconnected();

  /** @brief Stops reconnecting and closes the connection. */
  void shutdown();

  bool isConnected() { return connection->isConnected(); }

  /** @brief Registers an application handler for an inbound event. */
  EventRouter::HandlerId on(EventName name, EventRouter::Handler handler);
  EventRouter::HandlerId on(const string& name, EventRouter::Handler handler);
  bool removeHandler(EventName name, EventRouter::HandlerId id);

  uint64_t sendMessage(int64_t chatId, const string& text,
                       const optional<string>& replyTo = nullopt);
  uint64_t sendSticker(int64_t chatId, int64_t stickerId,
                       const optional<string>& replyTo = nullopt);
  uint64_t sendReaction(int64_t chatId, const string& messageId,
                        const string& reaction);
  uint64_t editMessage(int64_t chatId, const string& messageId,
                       const string& text);
  uint64_t deleteMessage(int64_t chatId, const string& messageId);
  uint64_t requestChats(const vector<int64_t>& chatIds);
  uint64_t requestContacts(const vector<int64_t>& contactIds);

  std::shared_ptr<MxConnection> getConnection() { return connection; }
  std::shared_ptr<AuthStateMachine> getAuth() { return auth; }
  const DeviceProfile& getProfile() const { return profile; }

 protected:
  /**
   * @brief Makes one reconnect attempt when the connection is down.
   * @throws SendError instead when called from an event handler.
   */
  void ensureConnected();

  void syncAfterLogin(const json& login);

  ClientConfig config;
  std::shared_ptr<SessionStore> store;
  DeviceProfile profile;
  std::shared_ptr<MxConnection> connection;
  std::shared_ptr<AuthSession> session;
  std::shared_ptr<AuthStateMachine> auth;
  std::shared_ptr<ReconnectSupervisor> supervisor;

  std::mutex stopMutex;
  std::condition_variable stopCondition;
  bool stopping;
};
}  // namespace mx

#endif  // __MX_CLIENT__
