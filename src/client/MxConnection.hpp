#ifndef __MX_CONNECTION__
#define __MX_CONNECTION__

#include "ClientConfig.hpp"
#include "DeviceProfile.hpp"
#include "EventRouter.hpp"
#include "FrameCodec.hpp"
#include "Headers.hpp"
#include "SocketEndpoint.hpp"
#include "Transport.hpp"

namespace mx {
/**
 * @brief One logical connection to the server: owns the transport, the frame
 * codec, the event router and the listen thread.
 *
 * Inbound frames are decoded and dispatched one at a time on the listen
 * thread.  Outbound frames may be sent from any thread; sequence numbers go
 * out on the wire in increasing order.
 */
class MxConnection {
 public:
  MxConnection(std::shared_ptr<Transport> _transport,
               const ClientConfig& _config, const DeviceProfile& _profile);

  /**
   * @brief Stops listening and joins the listen thread.  Must not run on the
   * listen thread, so handlers may not drop the last reference.
   */
  virtual ~MxConnection();

  /**
   * @brief Opens the transport, sends device-init and starts listening.  Any
   * previous connection is closed first.
   * @throws ConnectError or SendError.  Called from the listen thread it
   * throws ConnectError without touching the running connection.
   */
  void connect();

  /**
   * @brief Closes the transport and waits for the listen thread, unless
   * called from the listen thread itself.
   */
  void disconnect();

  /** @brief True while the transport is open and the listen loop runs. */
  bool isConnected();

  /** @brief True when called from inside an event handler. */
  bool isListenThread() const;

  EventRouter* getRouter() { return &router; }

  uint64_t getSequenceNumber() { return codec.getSequenceNumber(); }

  const SocketEndpoint& getEndpoint() const { return endpoint; }

  /**
   * @brief Encodes and sends one outbound (cmd 0) frame.
   * @return the sequence number of the frame.
   * @throws SendError when the connection is closed.
   */
  uint64_t sendFrame(int opcode, const json& payload);

  uint64_t sendAuthStart(const string& phone, const string& language);
  uint64_t sendAuthCode(const string& token, const string& verifyCode);
  uint64_t sendAuthToken(const string& token, bool interactive = false);
  uint64_t sendEvents(const json& events);
  uint64_t sendGetChats(const vector<int64_t>& chatIds);
  uint64_t sendGetContacts(const vector<int64_t>& contactIds);
  uint64_t sendMessage(int64_t chatId, const string& text,
                       const optional<string>& replyTo = nullopt);
  uint64_t sendSticker(int64_t chatId, int64_t stickerId,
                       const optional<string>& replyTo = nullopt);
  uint64_t sendReaction(int64_t chatId, const string& messageId,
                        const string& reactionId = "\xF0\x9F\x91\x8D",
                        const string& reactionType = "EMOJI");
  uint64_t editMessage(int64_t chatId, const string& messageId,
                       const string& text);
  uint64_t deleteMessage(int64_t chatId, const string& messageId);

  /** @brief The headers sent with the WebSocket upgrade request. */
  map<string, string> getHandshakeHeaders() const;

 protected:
  void runListenLoop();

  /** @brief Stops the listen thread.  Caller holds connectionMutex. */
  void stopListening();

  void logFrame(const char* direction, const Frame& frame);

  std::shared_ptr<Transport> transport;
  ClientConfig config;
  DeviceProfile profile;
  SocketEndpoint endpoint;
  FrameCodec codec;
  EventRouter router;

  std::recursive_mutex connectionMutex;
  /** @brief Keeps encode+send atomic so seq goes out in order. */
  std::mutex sendMutex;
  std::thread listenThread;
  std::atomic<std::thread::id> listenThreadId;
  std::atomic<bool> listening;
  std::atomic<bool> stopRequested;
};
}  // namespace mx

#endif  // __MX_CONNECTION__
