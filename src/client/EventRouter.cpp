#include "EventRouter.hpp"

namespace mx {
namespace {
struct EventMapping {
  int cmd;
  int opcode;
  EventName name;
  const char* wireName;
};

const EventMapping EVENT_MAPPINGS[] = {
    {FrameCmd::REPLY_OK, Opcode::AUTH_TOKEN, EventName::AUTH_SUCCESS,
     "auth_success"},
    {FrameCmd::REPLY_OK, Opcode::AUTH_START, EventName::AUTH_CODE_REQUESTED,
     "auth_code_requested"},
    {FrameCmd::REPLY_OK, Opcode::AUTH_VERIFY_CODE,
     EventName::AUTH_CODE_CHECKED, "auth_code_checked"},
    {FrameCmd::REPLY_OK, Opcode::MESSAGE_SEND, EventName::MESSAGE_SENT,
     "message_sent"},
    {FrameCmd::REPLY_OK, Opcode::CONTACTS, EventName::CONTACTS_UPDATE,
     "contacts_update"},
    {FrameCmd::REPLY_OK, Opcode::CHATS, EventName::CHATS_UPDATE,
     "chats_update"},
    {FrameCmd::REPLY_ERROR, Opcode::AUTH_TOKEN, EventName::AUTH_ERROR,
     "auth_error"},
    {FrameCmd::REPLY_ERROR, Opcode::AUTH_START, EventName::AUTH_CODE_ERROR,
     "auth_code_error"},
    {FrameCmd::PUSH, Opcode::NEW_MESSAGE, EventName::NEW_MESSAGE,
     "new_message"},
};
}  // namespace

optional<EventName> lookupEventName(int cmd, int opcode) {
  for (const auto& mapping : EVENT_MAPPINGS) {
    if (mapping.cmd == cmd && mapping.opcode == opcode) {
      return mapping.name;
    }
  }
  return nullopt;
}

string eventNameToString(EventName name) {
  for (const auto& mapping : EVENT_MAPPINGS) {
    if (mapping.name == name) {
      return mapping.wireName;
    }
  }
  STFATAL << "Unhandled event name: " << int(name);
  return "";
}

EventName eventNameFromString(const string& name) {
  for (const auto& mapping : EVENT_MAPPINGS) {
    if (name == mapping.wireName) {
      return mapping.name;
    }
  }
  throw std::invalid_argument("Unknown event name: " + name);
}

EventRouter::EventRouter() : nextId(1) {}

EventRouter::HandlerId EventRouter::registerHandler(EventName name,
                                                    Handler handler) {
  lock_guard<std::mutex> guard(routerMutex);
  HandlerId id = nextId++;
  handlers[name].push_back(make_pair(id, handler));
  VLOG(1) << "Registered handler " << id << " for " << name;
  return id;
}

EventRouter::HandlerId EventRouter::registerHandler(const string& name,
                                                    Handler handler) {
  return registerHandler(eventNameFromString(name), handler);
}

bool EventRouter::removeHandler(EventName name, HandlerId id) {
  lock_guard<std::mutex> guard(routerMutex);
  auto it = handlers.find(name);
  if (it == handlers.end()) {
    return false;
  }
  auto& list = it->second;
  for (auto entry = list.begin(); entry != list.end(); ++entry) {
    if (entry->first == id) {
      list.erase(entry);
      return true;
    }
  }
  return false;
}

bool EventRouter::dispatch(const Frame& frame) {
  auto name = lookupEventName(frame.getCmd(), frame.getOpcode());
  if (!name) {
    VLOG(2) << "No event for cmd " << frame.getCmd() << " opcode "
            << frame.getOpcode();
    return false;
  }

  vector<pair<HandlerId, Handler>> toCall;
  {
    lock_guard<std::mutex> guard(routerMutex);
    auto it = handlers.find(*name);
    if (it != handlers.end()) {
      toCall = it->second;
    }
  }
  VLOG(1) << "Dispatching " << *name << " to " << toCall.size()
          << " handler(s)";
  for (auto& entry : toCall) {
    entry.second(frame.getPayload());
  }
  return true;
}

size_t EventRouter::getHandlerCount(EventName name) {
  lock_guard<std::mutex> guard(routerMutex);
  auto it = handlers.find(name);
  return it == handlers.end() ? 0 : it->second.size();
}
}  // namespace mx
