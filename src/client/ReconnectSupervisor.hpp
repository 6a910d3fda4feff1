#ifndef __MX_RECONNECT_SUPERVISOR__
#define __MX_RECONNECT_SUPERVISOR__

#include "AuthSession.hpp"
#include "ClientConfig.hpp"
#include "Headers.hpp"
#include "MxConnection.hpp"

namespace mx {
/**
 * @brief Re-establishes a lost connection and replays the saved token.
 */
class ReconnectSupervisor {
 public:
  ReconnectSupervisor(std::shared_ptr<MxConnection> _connection,
                      std::shared_ptr<AuthSession> _session,
                      const ClientConfig& _config);

  /**
   * @brief One reconnect attempt: delay, reopen, replay the token.  A failed
   * attempt is followed by the cooldown before returning false.
   */
  bool reconnect();

  /** @brief Interrupts any delay in progress and makes reconnect() a no-op. */
  void cancel();

  bool isCancelled();

  int getAttempts() { return attempts; }

 protected:
  /** @brief Sleeps unless cancelled.  Returns false when cancelled. */
  bool pause(std::chrono::milliseconds duration);

  std::shared_ptr<MxConnection> connection;
  std::shared_ptr<AuthSession> session;
  ClientConfig config;

  std::mutex cancelMutex;
  std::condition_variable cancelCondition;
  bool cancelled;
  std::atomic<int> attempts;
};
}  // namespace mx

#endif  // __MX_RECONNECT_SUPERVISOR__
