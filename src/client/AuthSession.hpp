#ifndef __MX_AUTH_SESSION__
#define __MX_AUTH_SESSION__

#include "Headers.hpp"
#include "PendingOperation.hpp"
#include "SessionStore.hpp"

namespace mx {
/**
 * @brief Asks the user for the verification code.  Returning nullopt or an
 * empty string leaves the attempt pending.
 */
typedef std::function<optional<string>()> CodeProvider;

/**
 * @brief Credentials and the in-flight authentication attempt.
 *
 * Token and phone live in the session store; every change is written through
 * immediately.  Write failures are logged and otherwise ignored so that a
 * read-only session file never breaks a login.
 */
class AuthSession {
 public:
  explicit AuthSession(std::shared_ptr<SessionStore> _store);

  optional<string> getToken();
  void persistToken(const string& token);
  void clearToken();

  /** @brief The phone given to this session, else the persisted one. */
  optional<string> getPhone();
  void persistPhone(const string& phone);

  /**
   * @brief Starts a new attempt.  A previous attempt that is still pending
   * is superseded.
   */
  std::shared_ptr<PendingOperation> beginOperation();

  /** @brief The most recent attempt, or null before the first one. */
  std::shared_ptr<PendingOperation> getPending();

  void setCodeProvider(CodeProvider provider);
  CodeProvider getCodeProvider();

 protected:
  void saveStore();

  std::shared_ptr<SessionStore> store;
  optional<string> phone;
  std::shared_ptr<PendingOperation> pending;
  CodeProvider codeProvider;
  std::recursive_mutex sessionMutex;
};
}  // namespace mx

#endif  // __MX_AUTH_SESSION__
