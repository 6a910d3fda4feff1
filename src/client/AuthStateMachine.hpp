#ifndef __MX_AUTH_STATE_MACHINE__
#define __MX_AUTH_STATE_MACHINE__

#include "AuthSession.hpp"
#include "ClientConfig.hpp"
#include "EventRouter.hpp"
#include "Headers.hpp"
#include "MxConnection.hpp"

namespace mx {
enum class AuthState {
  IDLE = 0,
  /** @brief A token-auth frame is out, waiting for auth_success. */
  AWAITING_TOKEN = 1,
  /** @brief Start-auth is out, the code exchange is in progress. */
  AWAITING_PHONE_CODE = 2,
  /** @brief The saved token was rejected and the phone flow restarted. */
  REAUTHENTICATING = 3,
  AUTHENTICATED = 4,
  FAILED = 5
};

const char* authStateName(AuthState state);

/**
 * @brief Drives login over an MxConnection: the token fast path, the phone
 * and code challenge, and re-authentication when the server rejects the
 * saved token.
 *
 * The event reactions run on the listen thread.  authenticate() runs on the
 * caller's thread and blocks until the current attempt completes.
 */
class AuthStateMachine {
 public:
  AuthStateMachine(std::shared_ptr<MxConnection> _connection,
                   std::shared_ptr<AuthSession> _session,
                   const ClientConfig& _config);

  virtual ~AuthStateMachine();

  /**
   * @brief Logs in with the saved token if there is one, otherwise with the
   * phone number (given here or saved earlier).
   *
   * The code provider is kept for later challenges, including the ones a
   * re-authentication triggers.
   *
   * @return the auth_success payload.
   * @throws AuthFailed when the attempt fails or times out.
   * @throws SendError when the connection is down.
   */
  json authenticate(const optional<string>& phone = nullopt,
                    CodeProvider codeProvider = nullptr);

  AuthState getState();

  /**
   * @brief Fails the current attempt and waits for the re-authentication
   * watcher.  Safe to call more than once.
   */
  void shutdown();

  void onAuthSuccess(const json& payload);
  void onAuthCodeRequested(const json& payload);
  void onAuthCodeChecked(const json& payload);
  void onAuthError(const json& payload);
  void onAuthCodeError(const json& payload);

 protected:
  /**
   * @brief Persists the phone, opens a new attempt, then sends start-auth and
   * the navigation telemetry.
   */
  std::shared_ptr<PendingOperation> startPhoneFlow(const string& phone,
                                                   AuthState newState);

  void startReauth(const string& phone);

  /** @brief Runs on the re-authentication watcher thread. */
  void watchReauth(std::shared_ptr<PendingOperation> operation);

  /**
   * @brief Waits for the attempt, following superseding attempts.
   */
  json awaitOutcome(std::shared_ptr<PendingOperation> operation,
                    optional<std::chrono::milliseconds> bound);

  void setState(AuthState newState);

  /** @brief Moves to FAILED and fails the current attempt. */
  void failCurrent(AuthFailureKind kind, const string& message);

  std::shared_ptr<MxConnection> connection;
  std::shared_ptr<AuthSession> session;
  ClientConfig config;

  std::mutex stateMutex;
  AuthState state;

  std::mutex watcherMutex;
  std::thread reauthWatcher;

  vector<pair<EventName, EventRouter::HandlerId>> registrations;
};
}  // namespace mx

#endif  // __MX_AUTH_STATE_MACHINE__
