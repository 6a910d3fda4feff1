#ifndef __MX_TRANSPORT__
#define __MX_TRANSPORT__

#include "Errors.hpp"
#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace mx {
/**
 * @brief Result of a bounded wait for one inbound message.
 */
enum class ReceiveStatus {
  /** @brief A complete message was copied to the output string. */
  RECEIVED = 0,
  /** @brief Nothing arrived before the timeout. */
  TIMEOUT = 1,
  /** @brief The connection is gone; no more messages will arrive. */
  CLOSED = 2
};

/**
 * @brief Provides an abstract API over a single duplex message connection.
 */
class Transport {
 public:
  virtual ~Transport() {}

  /**
   * @brief Connects and performs the handshake, replacing any previous
   * connection.
   * @throws ConnectError when the server cannot be reached.
   */
  virtual void open(const SocketEndpoint& endpoint,
                    const map<string, string>& headers) = 0;

  /**
   * @brief Writes one text message.
   * @throws SendError when the transport is not open or the write fails.
   */
  virtual void send(const string& data) = 0;

  /**
   * @brief Waits up to `timeout` for the next message.
   */
  virtual ReceiveStatus receive(string* data,
                                std::chrono::milliseconds timeout) = 0;

  /** @brief Closes the connection.  Safe to call when already closed. */
  virtual void close() = 0;

  virtual bool isOpen() = 0;
};
}  // namespace mx

#endif  // __MX_TRANSPORT__
