#ifndef __MX_EVENT_ROUTER__
#define __MX_EVENT_ROUTER__

#include "Frame.hpp"
#include "Headers.hpp"

namespace mx {
/**
 * @brief Logical events derived from the (cmd, opcode) pair of an inbound
 * frame.
 */
enum class EventName {
  AUTH_SUCCESS = 0,
  AUTH_CODE_REQUESTED = 1,
  AUTH_CODE_CHECKED = 2,
  MESSAGE_SENT = 3,
  CONTACTS_UPDATE = 4,
  CHATS_UPDATE = 5,
  AUTH_ERROR = 6,
  AUTH_CODE_ERROR = 7,
  NEW_MESSAGE = 8
};

/** @brief Maps a (cmd, opcode) pair to its event, if it has one. */
optional<EventName> lookupEventName(int cmd, int opcode);

/** @brief The wire name of the event, e.g. "auth_success". */
string eventNameToString(EventName name);

/**
 * @brief Inverse of eventNameToString.
 * @throws std::invalid_argument for a name that is not an event.
 */
EventName eventNameFromString(const string& name);

inline ostream& operator<<(ostream& os, EventName name) {
  return os << eventNameToString(name);
}

/**
 * @brief Keeps the handlers registered per event and invokes them for
 * inbound frames.
 *
 * Handlers for one event run in registration order, on the thread calling
 * dispatch().  Registration may happen from any thread, including from inside
 * a handler; a dispatch already in progress keeps the handler list it
 * started with.
 */
class EventRouter {
 public:
  typedef std::function<void(const json&)> Handler;
  typedef uint64_t HandlerId;

  EventRouter();

  HandlerId registerHandler(EventName name, Handler handler);

  /** @throws std::invalid_argument for an unknown event name. */
  HandlerId registerHandler(const string& name, Handler handler);

  /** @brief Removes one registration.  Returns false if it was not found. */
  bool removeHandler(EventName name, HandlerId id);

  /**
   * @brief Routes the frame to the handlers of its event.  Frames without an
   * event are ignored.  Exceptions thrown by handlers propagate to the
   * caller and skip the remaining handlers.
   * @return true if the frame mapped to an event.
   */
  bool dispatch(const Frame& frame);

  size_t getHandlerCount(EventName name);

 protected:
  std::mutex routerMutex;
  map<EventName, vector<pair<HandlerId, Handler>>> handlers;
  HandlerId nextId;
};
}  // namespace mx

#endif  // __MX_EVENT_ROUTER__
