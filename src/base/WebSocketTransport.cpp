#include "WebSocketTransport.hpp"

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace mx {
WebSocketTransport::WebSocketTransport()
    : sslContext(ssl::context::tlsv12_client),
      connected(false),
      readPending(false),
      readReady(false) {
  sslContext.set_default_verify_paths();
  sslContext.set_verify_mode(ssl::verify_peer);
}

WebSocketTransport::~WebSocketTransport() { close(); }

void WebSocketTransport::open(const SocketEndpoint& endpoint,
                              const map<string, string>& headers) {
  lock_guard<std::mutex> guard(writeMutex);
  teardown();

  ioContext.reset(new net::io_context());
  {
    lock_guard<std::mutex> readGuard(readMutex);
    readBuffer.consume(readBuffer.size());
    readPending = false;
    readReady = false;
    readData.clear();
    readError = {};
  }

  auto decorate = [headers](websocket::request_type& request) {
    for (const auto& it : headers) {
      request.set(it.first, it.second);
    }
  };

  try {
    VLOG(1) << "Resolving " << endpoint.getName();
    tcp::resolver resolver(*ioContext);
    auto results =
        resolver.resolve(endpoint.getName(), to_string(endpoint.getPort()));

    if (endpoint.isSecure()) {
      tlsStream.reset(new TlsStream(*ioContext, sslContext));
      beast::get_lowest_layer(*tlsStream).connect(results);
      if (!SSL_set_tlsext_host_name(tlsStream->next_layer().native_handle(),
                                    endpoint.getName().c_str())) {
        throw ConnectError("Could not set SNI host name");
      }
      tlsStream->next_layer().set_verify_callback(
          ssl::host_name_verification(endpoint.getName()));
      VLOG(1) << "TLS handshake";
      tlsStream->next_layer().handshake(ssl::stream_base::client);
      tlsStream->set_option(websocket::stream_base::decorator(decorate));
      VLOG(1) << "WebSocket handshake";
      tlsStream->handshake(endpoint.getHostHeader(), endpoint.getTarget());
      beast::get_lowest_layer(*tlsStream).expires_never();
      tlsStream->set_option(websocket::stream_base::timeout::suggested(
          beast::role_type::client));
      tlsStream->text(true);
    } else {
      plainStream.reset(new PlainStream(*ioContext));
      beast::get_lowest_layer(*plainStream).connect(results);
      plainStream->set_option(websocket::stream_base::decorator(decorate));
      VLOG(1) << "WebSocket handshake";
      plainStream->handshake(endpoint.getHostHeader(), endpoint.getTarget());
      beast::get_lowest_layer(*plainStream).expires_never();
      plainStream->set_option(websocket::stream_base::timeout::suggested(
          beast::role_type::client));
      plainStream->text(true);
    }
  } catch (const boost::system::system_error& se) {
    LOG(INFO) << "Error connecting to " << endpoint << ": " << se.what();
    plainStream.reset();
    tlsStream.reset();
    ioContext.reset();
    throw ConnectError(se.what());
  } catch (const ConnectError&) {
    plainStream.reset();
    tlsStream.reset();
    ioContext.reset();
    throw;
  }

  workGuard.reset(new WorkGuard(net::make_work_guard(*ioContext)));
  ioThread = std::thread([this]() {
    el::Helpers::setThreadName("TransportIO");
    ioContext->run();
    VLOG(1) << "I/O thread finished";
  });
  connected = true;
  LOG(INFO) << "Connected to " << endpoint;
}

void WebSocketTransport::send(const string& data) {
  lock_guard<std::mutex> guard(writeMutex);
  if (!connected) {
    throw SendError("Not connected");
  }

  auto payload = make_shared<string>(data);
  auto done = make_shared<std::promise<beast::error_code>>();
  auto result = done->get_future();
  net::post(*ioContext, [this, payload, done]() {
    bool started = false;
    withStream([&](auto& ws) {
      started = true;
      ws.async_write(net::buffer(*payload),
                     [payload, done](beast::error_code ec, std::size_t) {
                       done->set_value(ec);
                     });
    });
    if (!started) {
      done->set_value(beast::error_code(net::error::not_connected));
    }
  });

  beast::error_code ec = result.get();
  if (ec) {
    LOG(INFO) << "Write failed: " << ec.message();
    connected = false;
    throw SendError("Connection closed: " + ec.message());
  }
}

ReceiveStatus WebSocketTransport::receive(string* data,
                                          std::chrono::milliseconds timeout) {
  unique_lock<std::mutex> lock(readMutex);
  if (!readReady && !readPending) {
    if (!connected || !ioContext) {
      return ReceiveStatus::CLOSED;
    }
    readPending = true;
    net::post(*ioContext, [this]() { startRead(); });
  }

  if (!readCondition.wait_for(lock, timeout,
                              [this]() { return readReady; })) {
    return connected ? ReceiveStatus::TIMEOUT : ReceiveStatus::CLOSED;
  }
  readReady = false;
  if (readError) {
    LOG(INFO) << "Read failed: " << readError.message();
    connected = false;
    return ReceiveStatus::CLOSED;
  }
  *data = std::move(readData);
  readData.clear();
  return ReceiveStatus::RECEIVED;
}

void WebSocketTransport::startRead() {
  bool started = false;
  withStream([this, &started](auto& ws) {
    started = true;
    ws.async_read(readBuffer, [this](beast::error_code ec, std::size_t) {
      lock_guard<std::mutex> guard(readMutex);
      readPending = false;
      readReady = true;
      readError = ec;
      if (!ec) {
        readData = beast::buffers_to_string(readBuffer.data());
      }
      readBuffer.consume(readBuffer.size());
      readCondition.notify_all();
    });
  });
  if (!started) {
    lock_guard<std::mutex> guard(readMutex);
    readPending = false;
    readReady = true;
    readError = beast::error_code(net::error::not_connected);
    readCondition.notify_all();
  }
}

void WebSocketTransport::close() {
  lock_guard<std::mutex> guard(writeMutex);
  teardown();
}

void WebSocketTransport::teardown() {
  connected = false;
  if (ioThread.joinable()) {
    net::post(*ioContext, [this]() {
      withStream([](auto& ws) {
        if (!ws.is_open()) {
          beast::error_code ec;
          beast::get_lowest_layer(ws).socket().close(ec);
          return;
        }
        websocket::stream_base::timeout opt{
            std::chrono::seconds(2), websocket::stream_base::none(), false};
        ws.set_option(opt);
        ws.async_close(websocket::close_code::normal,
                       [&ws](beast::error_code) {
                         beast::error_code ec;
                         beast::get_lowest_layer(ws).socket().close(ec);
                       });
      });
    });
    workGuard.reset();
    ioThread.join();
    VLOG(1) << "Closed websocket";
  }

  lock_guard<std::mutex> readGuard(readMutex);
  plainStream.reset();
  tlsStream.reset();
  ioContext.reset();
  readPending = false;
  readCondition.notify_all();
}
}  // namespace mx
