#include <boost/beast/http.hpp>

#include "TestHeaders.hpp"
#include "WebSocketTransport.hpp"

using namespace mx;

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {
/**
 * Plain ws:// server on the loopback interface that accepts one client,
 * reads one message, answers "hello" and closes when told to.
 */
class LoopbackServer {
 public:
  LoopbackServer()
      : acceptor(ioContext, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
    port = acceptor.local_endpoint().port();
    serverThread = std::thread(&LoopbackServer::run, this);
  }

  ~LoopbackServer() {
    closeNow();
    if (serverThread.joinable()) {
      serverThread.join();
    }
  }

  int getPort() const { return port; }

  void closeNow() {
    lock_guard<std::mutex> guard(serverMutex);
    closeRequested = true;
    serverCondition.notify_all();
  }

  void join() { serverThread.join(); }

  map<string, string> headers;
  string target;
  string clientMessage;
  string error;

 protected:
  void run() {
    try {
      tcp::socket socket(ioContext);
      acceptor.accept(socket);

      beast::flat_buffer buffer;
      http::request<http::string_body> request;
      http::read(socket, buffer, request);
      for (const auto& field : request) {
        headers[string(field.name_string().data(),
                       field.name_string().size())] =
            string(field.value().data(), field.value().size());
      }
      target = string(request.target().data(), request.target().size());

      websocket::stream<tcp::socket> ws(std::move(socket));
      ws.accept(request);

      beast::flat_buffer messageBuffer;
      ws.read(messageBuffer);
      clientMessage = beast::buffers_to_string(messageBuffer.data());

      ws.text(true);
      ws.write(net::buffer(string("hello")));

      {
        unique_lock<std::mutex> lock(serverMutex);
        serverCondition.wait(lock, [this]() { return closeRequested; });
      }
      ws.close(websocket::close_code::normal);
    } catch (const boost::system::system_error& se) {
      error = se.what();
    }
  }

  net::io_context ioContext;
  tcp::acceptor acceptor;
  int port;
  std::thread serverThread;
  std::mutex serverMutex;
  std::condition_variable serverCondition;
  bool closeRequested = false;
};
}  // namespace

TEST_CASE("WebSocket transport talks to a loopback server",
          "[WebSocketTransport]") {
  LoopbackServer server;
  WebSocketTransport transport;
  REQUIRE_FALSE(transport.isOpen());

  SocketEndpoint endpoint = SocketEndpoint::parse(
      "ws://127.0.0.1:" + to_string(server.getPort()) + "/websocket");
  transport.open(endpoint, {{"Origin", "https://web.max.ru"},
                            {"Cache-Control", "no-cache"}});
  REQUIRE(transport.isOpen());

  // The server is waiting for our message, nothing can arrive yet
  string data;
  REQUIRE(transport.receive(&data, std::chrono::milliseconds(50)) ==
          ReceiveStatus::TIMEOUT);

  transport.send("ping");
  REQUIRE(transport.receive(&data, std::chrono::seconds(5)) ==
          ReceiveStatus::RECEIVED);
  REQUIRE(data == "hello");

  server.closeNow();
  REQUIRE(transport.receive(&data, std::chrono::seconds(5)) ==
          ReceiveStatus::CLOSED);
  REQUIRE_FALSE(transport.isOpen());
  REQUIRE_THROWS_AS(transport.send("late"), SendError);

  transport.close();
  server.join();
  REQUIRE(server.error.empty());
  REQUIRE(server.clientMessage == "ping");
  REQUIRE(server.target == "/websocket");
  REQUIRE(server.headers["Origin"] == "https://web.max.ru");
  REQUIRE(server.headers["Cache-Control"] == "no-cache");
}

TEST_CASE("WebSocket transport reports unreachable servers",
          "[WebSocketTransport]") {
  int port;
  {
    net::io_context ioContext;
    tcp::acceptor acceptor(
        ioContext, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    port = acceptor.local_endpoint().port();
  }

  WebSocketTransport transport;
  SocketEndpoint endpoint =
      SocketEndpoint::parse("ws://127.0.0.1:" + to_string(port) + "/");
  REQUIRE_THROWS_AS(transport.open(endpoint, {}), ConnectError);
  REQUIRE_FALSE(transport.isOpen());

  string data;
  REQUIRE(transport.receive(&data, std::chrono::milliseconds(10)) ==
          ReceiveStatus::CLOSED);
  REQUIRE_THROWS_AS(transport.send("nothing"), SendError);
}
