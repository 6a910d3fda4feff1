#include "FrameCodec.hpp"

namespace mx {
string Frame::serialize() const {
  json envelope = {{"ver", version},
                   {"cmd", cmd},
                   {"seq", seq},
                   {"opcode", opcode},
                   {"payload", payload}};
  // Invalid UTF-8 in a payload string is replaced rather than failing the
  // frame after its seq has been taken.
  return envelope.dump(-1, ' ', false, json::error_handler_t::replace);
}

FrameCodec::FrameCodec(int _version) : version(_version), seq(0) {}

Frame FrameCodec::encode(int cmd, int opcode, const json& payload) {
  lock_guard<std::mutex> guard(codecMutex);
  seq++;
  return Frame(version, cmd, seq, opcode, payload);
}

namespace {
int readInt(const json& envelope, const char* key, bool required) {
  auto it = envelope.find(key);
  if (it == envelope.end() || it->is_null()) {
    if (required) {
      throw DecodeError(string("Missing field: ") + key);
    }
    return 0;
  }
  if (!it->is_number_integer()) {
    throw DecodeError(string("Field is not an integer: ") + key);
  }
  bool inRange;
  if (it->is_number_unsigned()) {
    inRange = it->get<uint64_t>() <=
              uint64_t(std::numeric_limits<int>::max());
  } else {
    int64_t value = it->get<int64_t>();
    inRange = value >= std::numeric_limits<int>::min() &&
              value <= std::numeric_limits<int>::max();
  }
  if (!inRange) {
    throw DecodeError(string("Field out of range: ") + key);
  }
  return it->get<int>();
}
}  // namespace

Frame FrameCodec::decode(const string& text) const {
  json envelope = json::parse(text, nullptr, false);
  if (envelope.is_discarded()) {
    throw DecodeError("Failed to parse json");
  }
  if (!envelope.is_object()) {
    throw DecodeError("Envelope is not an object");
  }

  int cmd = readInt(envelope, "cmd", true);
  int opcode = readInt(envelope, "opcode", true);
  int remoteVersion = readInt(envelope, "ver", false);

  uint64_t remoteSeq = 0;
  auto seqIt = envelope.find("seq");
  if (seqIt != envelope.end() && seqIt->is_number_integer()) {
    remoteSeq = seqIt->get<uint64_t>();
  }

  json payload = json::object();
  auto payloadIt = envelope.find("payload");
  if (payloadIt != envelope.end() && !payloadIt->is_null()) {
    payload = *payloadIt;
  }
  return Frame(remoteVersion, cmd, remoteSeq, opcode, payload);
}
}  // namespace mx
