#ifndef __MX_FRAME_CODEC__
#define __MX_FRAME_CODEC__

#include "Errors.hpp"
#include "Frame.hpp"
#include "Headers.hpp"

namespace mx {
/**
 * @brief Builds outbound frames and parses inbound ones.
 *
 * The codec owns the outbound sequence counter.  It starts at 1 and is never
 * reset for the lifetime of the codec, including across reconnects.
 */
class FrameCodec {
 public:
  explicit FrameCodec(int _version);

  /**
   * @brief Stamps the protocol version and the next sequence number.
   */
  Frame encode(int cmd, int opcode, const json& payload);

  /**
   * @brief Parses one inbound envelope.
   * @throws DecodeError on invalid json, a non-object envelope or a missing
   * cmd/opcode.
   */
  Frame decode(const string& text) const;

  /** @brief The sequence number of the most recent outbound frame. */
  uint64_t getSequenceNumber() {
    lock_guard<std::mutex> guard(codecMutex);
    return seq;
  }

  int getVersion() const { return version; }

 protected:
  int version;
  uint64_t seq;
  std::mutex codecMutex;
};
}  // namespace mx

#endif  // __MX_FRAME_CODEC__
