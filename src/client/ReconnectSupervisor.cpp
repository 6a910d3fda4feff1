#include "ReconnectSupervisor.hpp"

namespace mx {
ReconnectSupervisor::ReconnectSupervisor(
    std::shared_ptr<MxConnection> _connection,
    std::shared_ptr<AuthSession> _session, const ClientConfig& _config)
    : connection(_connection),
      session(_session),
      config(_config),
      cancelled(false),
      attempts(0) {}

bool ReconnectSupervisor::reconnect() {
  if (!pause(config.reconnectDelay)) {
    return false;
  }
  attempts++;
  LOG_EVERY_N(10, INFO) << "Reconnecting to " << connection->getEndpoint();
  try {
    connection->connect();
    auto token = session->getToken();
    if (token) {
      if (!pause(config.authDelay)) {
        return false;
      }
      connection->sendAuthToken(*token, false);
      LOG(INFO) << "Reconnect complete, token replayed";
    } else {
      LOG(INFO) << "Reconnected without a saved token, re-authorization "
                   "required";
    }
    return true;
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "Error reconnecting: " << re.what();
  }
  pause(config.reconnectCooldown);
  return false;
}

void ReconnectSupervisor::cancel() {
  lock_guard<std::mutex> guard(cancelMutex);
  cancelled = true;
  cancelCondition.notify_all();
}

bool ReconnectSupervisor::isCancelled() {
  lock_guard<std::mutex> guard(cancelMutex);
  return cancelled;
}

bool ReconnectSupervisor::pause(std::chrono::milliseconds duration) {
  unique_lock<std::mutex> lock(cancelMutex);
  cancelCondition.wait_for(lock, duration, [this]() { return cancelled; });
  return !cancelled;
}
}  // namespace mx
