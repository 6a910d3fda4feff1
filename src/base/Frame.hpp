#ifndef __MX_FRAME_H__
#define __MX_FRAME_H__

#include "Headers.hpp"

namespace mx {
/**
 * @brief Classifies a frame as a push, a successful reply or an error reply.
 */
namespace FrameCmd {
static const int PUSH = 0;
static const int REPLY_OK = 1;
static const int REPLY_ERROR = 3;
}  // namespace FrameCmd

/**
 * @brief Operation codes used by this client.
 */
namespace Opcode {
static const int TELEMETRY = 5;
static const int DEVICE_INIT = 6;
static const int AUTH_START = 17;
static const int AUTH_VERIFY_CODE = 18;
static const int AUTH_TOKEN = 19;
static const int MESSAGE_EDIT = 21;
static const int MESSAGE_DELETE = 22;
static const int CONTACTS = 32;
static const int CHATS = 48;
static const int MESSAGE_SEND = 64;
static const int NEW_MESSAGE = 128;
static const int REACTION = 178;
}  // namespace Opcode

/**
 * @brief One protocol envelope exchanged over the transport.
 */
class Frame {
 public:
  Frame() : version(0), cmd(0), seq(0), opcode(0), payload(json::object()) {}

  Frame(int _version, int _cmd, uint64_t _seq, int _opcode,
        const json& _payload)
      : version(_version),
        cmd(_cmd),
        seq(_seq),
        opcode(_opcode),
        payload(_payload) {}

  int getVersion() const { return version; }
  int getCmd() const { return cmd; }
  uint64_t getSeq() const { return seq; }
  int getOpcode() const { return opcode; }
  const json& getPayload() const { return payload; }

  /** @brief Serializes the envelope into the textual wire format. */
  string serialize() const;

 protected:
  int version;
  int cmd;
  /** @brief Assigned by the sender; inbound values are not validated. */
  uint64_t seq;
  int opcode;
  json payload;
};
}  // namespace mx

#endif  // __MX_FRAME_H__
