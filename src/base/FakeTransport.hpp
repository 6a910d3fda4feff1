#ifndef __MX_FAKE_TRANSPORT__
#define __MX_FAKE_TRANSPORT__

#include "Frame.hpp"
#include "Transport.hpp"

namespace mx {
/**
 * @brief In-memory transport used by tests.
 *
 * Outbound messages are recorded, inbound messages are queued by the test
 * with `push()`.  A send hook lets a test act as the server and answer
 * frames as they are written.
 */
class FakeTransport : public Transport {
 public:
  typedef std::function<void(const string&)> SendHook;

  FakeTransport();

  void open(const SocketEndpoint& endpoint,
            const map<string, string>& headers) override;
  void send(const string& data) override;
  ReceiveStatus receive(string* data,
                        std::chrono::milliseconds timeout) override;
  void close() override;
  bool isOpen() override;

  /** @brief Queues raw inbound text. */
  void push(const string& data);
  /** @brief Queues an inbound frame built from its parts. */
  void pushFrame(int cmd, int opcode, const json& payload);

  /** @brief Simulates the server dropping the connection. */
  void drop();

  /** @brief Makes the next `count` calls to open() throw ConnectError. */
  void failNextOpens(int count);

  /** @brief Called (outside the internal lock) after each recorded send. */
  void setSendHook(SendHook hook);

  vector<string> getSent();
  /** @brief Sent frames parsed back to json, optionally filtered by opcode. */
  vector<json> getSentFrames(int opcode = -1);
  /** @brief Blocks until at least `count` frames with `opcode` were sent. */
  bool waitForSent(int opcode, size_t count, std::chrono::milliseconds timeout);

  int getOpenCount();
  map<string, string> getLastHeaders();
  SocketEndpoint getLastEndpoint();

 protected:
  std::mutex transportMutex;
  std::condition_variable transportCondition;
  bool opened;
  int openCount;
  int openFailures;
  deque<string> inbound;
  vector<string> sent;
  map<string, string> lastHeaders;
  SocketEndpoint lastEndpoint;
  SendHook sendHook;
  uint64_t remoteSeq;
};
}  // namespace mx

#endif  // __MX_FAKE_TRANSPORT__
