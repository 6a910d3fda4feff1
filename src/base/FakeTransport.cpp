#include "FakeTransport.hpp"

namespace mx {
FakeTransport::FakeTransport()
    : opened(false), openCount(0), openFailures(0), remoteSeq(0) {}

void FakeTransport::open(const SocketEndpoint& endpoint,
                         const map<string, string>& headers) {
  lock_guard<std::mutex> guard(transportMutex);
  if (openFailures > 0) {
    openFailures--;
    throw ConnectError("fake connect failure");
  }
  opened = true;
  openCount++;
  inbound.clear();
  lastHeaders = headers;
  lastEndpoint = endpoint;
  transportCondition.notify_all();
}

void FakeTransport::send(const string& data) {
  SendHook hook;
  {
    lock_guard<std::mutex> guard(transportMutex);
    if (!opened) {
      throw SendError("Not connected");
    }
    sent.push_back(data);
    hook = sendHook;
    transportCondition.notify_all();
  }
  if (hook) {
    hook(data);
  }
}

ReceiveStatus FakeTransport::receive(string* data,
                                     std::chrono::milliseconds timeout) {
  unique_lock<std::mutex> lock(transportMutex);
  transportCondition.wait_for(
      lock, timeout, [this]() { return !inbound.empty() || !opened; });
  if (!inbound.empty()) {
    *data = inbound.front();
    inbound.pop_front();
    return ReceiveStatus::RECEIVED;
  }
  if (!opened) {
    return ReceiveStatus::CLOSED;
  }
  return ReceiveStatus::TIMEOUT;
}

void FakeTransport::close() { drop(); }

bool FakeTransport::isOpen() {
  lock_guard<std::mutex> guard(transportMutex);
  return opened;
}

void FakeTransport::push(const string& data) {
  lock_guard<std::mutex> guard(transportMutex);
  inbound.push_back(data);
  transportCondition.notify_all();
}

void FakeTransport::pushFrame(int cmd, int opcode, const json& payload) {
  uint64_t seq;
  {
    lock_guard<std::mutex> guard(transportMutex);
    seq = ++remoteSeq;
  }
  push(Frame(PROTOCOL_VERSION, cmd, seq, opcode, payload).serialize());
}

void FakeTransport::drop() {
  lock_guard<std::mutex> guard(transportMutex);
  opened = false;
  inbound.clear();
  transportCondition.notify_all();
}

void FakeTransport::failNextOpens(int count) {
  lock_guard<std::mutex> guard(transportMutex);
  openFailures = count;
}

void FakeTransport::setSendHook(SendHook hook) {
  lock_guard<std::mutex> guard(transportMutex);
  sendHook = hook;
}

vector<string> FakeTransport::getSent() {
  lock_guard<std::mutex> guard(transportMutex);
  return sent;
}

vector<json> FakeTransport::getSentFrames(int opcode) {
  vector<json> frames;
  for (const auto& s : getSent()) {
    json frame = json::parse(s);
    if (opcode < 0 || frame["opcode"].get<int>() == opcode) {
      frames.push_back(frame);
    }
  }
  return frames;
}

bool FakeTransport::waitForSent(int opcode, size_t count,
                                std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  unique_lock<std::mutex> lock(transportMutex);
  while (true) {
    size_t matching = 0;
    for (const auto& s : sent) {
      if (json::parse(s)["opcode"].get<int>() == opcode) {
        matching++;
      }
    }
    if (matching >= count) {
      return true;
    }
    if (transportCondition.wait_until(lock, deadline) ==
        std::cv_status::timeout) {
      return false;
    }
  }
}

int FakeTransport::getOpenCount() {
  lock_guard<std::mutex> guard(transportMutex);
  return openCount;
}

map<string, string> FakeTransport::getLastHeaders() {
  lock_guard<std::mutex> guard(transportMutex);
  return lastHeaders;
}

SocketEndpoint FakeTransport::getLastEndpoint() {
  lock_guard<std::mutex> guard(transportMutex);
  return lastEndpoint;
}
}  // namespace mx
