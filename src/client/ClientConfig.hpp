#ifndef __MX_CLIENT_CONFIG__
#define __MX_CLIENT_CONFIG__

#include "Headers.hpp"

namespace mx {
/**
 * @brief Tunables of the client.  Defaults match the official web client.
 */
struct ClientConfig {
  string endpoint = DEFAULT_ENDPOINT;
  string origin = DEFAULT_ORIGIN;
  /** @brief Language of the verification SMS. */
  string language = "ru";
  int chatsCount = DEFAULT_CHATS_COUNT;

  /** @brief Receive timeout of the listen loop and liveness poll period. */
  std::chrono::milliseconds pollInterval = std::chrono::milliseconds(1000);
  std::chrono::milliseconds reconnectDelay = std::chrono::milliseconds(2000);
  /** @brief Pause before replaying a token so device-init settles. */
  std::chrono::milliseconds authDelay = std::chrono::milliseconds(500);
  /** @brief Back-off after a failed reconnect attempt. */
  std::chrono::milliseconds reconnectCooldown = std::chrono::milliseconds(5000);
  std::chrono::milliseconds reauthTimeout = std::chrono::milliseconds(60000);
  std::chrono::milliseconds tokenAuthTimeout = std::chrono::milliseconds(60000);

  string sessionFile = "session.mx";

  /** @brief Log every frame in full. */
  bool debug = false;
  int verbose = 0;
  bool silent = false;
  string maxLogSize = "20971520";

  /**
   * @brief Overrides the fields present in an INI file.
   * @throws std::runtime_error when the file cannot be read or a value is
   * malformed.
   */
  void loadFile(const string& path);
};
}  // namespace mx

#endif  // __MX_CLIENT_CONFIG__
