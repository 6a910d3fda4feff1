#ifndef __MX_WEBSOCKET_TRANSPORT__
#define __MX_WEBSOCKET_TRANSPORT__

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "Headers.hpp"
#include "Transport.hpp"

namespace mx {
/**
 * @brief Transport over a (TLS) WebSocket built on Boost.Beast.
 *
 * The handshake runs on the calling thread.  Afterwards every stream
 * operation runs on a private I/O thread: `send()` blocks until its write
 * completes and `receive()` issues at most one read at a time, only when the
 * caller asks for the next message.
 */
class WebSocketTransport : public Transport {
 public:
  WebSocketTransport();
  virtual ~WebSocketTransport();

  void open(const SocketEndpoint& endpoint,
            const map<string, string>& headers) override;
  void send(const string& data) override;
  ReceiveStatus receive(string* data,
                        std::chrono::milliseconds timeout) override;
  void close() override;
  bool isOpen() override { return connected; }

 protected:
  typedef boost::beast::websocket::stream<boost::beast::tcp_stream>
      PlainStream;
  typedef boost::beast::websocket::stream<
      boost::beast::ssl_stream<boost::beast::tcp_stream>>
      TlsStream;
  typedef boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>
      WorkGuard;

  template <typename F>
  void withStream(F&& f) {
    if (tlsStream) {
      f(*tlsStream);
    } else if (plainStream) {
      f(*plainStream);
    }
  }

  /** @brief Runs on the I/O thread. */
  void startRead();

  /**
   * @brief Closes the stream, stops the I/O thread and drops the stream.
   * Caller holds writeMutex.
   */
  void teardown();

  boost::asio::ssl::context sslContext;
  std::unique_ptr<boost::asio::io_context> ioContext;
  std::unique_ptr<WorkGuard> workGuard;
  std::unique_ptr<PlainStream> plainStream;
  std::unique_ptr<TlsStream> tlsStream;
  std::thread ioThread;
  std::atomic<bool> connected;

  /** @brief Serializes writes against each other and against open/close. */
  std::mutex writeMutex;

  std::mutex readMutex;
  std::condition_variable readCondition;
  boost::beast::flat_buffer readBuffer;
  bool readPending;
  bool readReady;
  string readData;
  boost::beast::error_code readError;
};
}  // namespace mx

#endif  // __MX_WEBSOCKET_TRANSPORT__
