#ifndef __MX_ERRORS__
#define __MX_ERRORS__

#include "Headers.hpp"

namespace mx {
/**
 * @brief Thrown when the transport cannot reach or handshake with the server.
 */
class ConnectError : public std::runtime_error {
 public:
  explicit ConnectError(const string& msg)
      : std::runtime_error("Failed to connect: " + msg) {}
};

/**
 * @brief Thrown when a frame cannot be written, including when the transport
 * is not open.
 */
class SendError : public std::runtime_error {
 public:
  explicit SendError(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Thrown by the codec for inbound text that is not a valid envelope.
 * The listen loop skips the message and keeps going.
 */
class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Thrown when the session file cannot be written.
 */
class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const string& msg) : std::runtime_error(msg) {}
};

enum class AuthFailureKind {
  /** @brief The server refused the credentials. */
  REJECTED = 0,
  /** @brief The verification code was wrong or expired. */
  INVALID_CODE = 1,
  /** @brief The server is rate limiting code attempts. */
  TOO_MANY_ATTEMPTS = 2,
  /** @brief Neither a usable token nor a phone number is known. */
  NO_CREDENTIALS = 3,
  /** @brief No answer arrived within the configured bound. */
  TIMEOUT = 4
};

inline const char* authFailureKindName(AuthFailureKind kind) {
  switch (kind) {
    case AuthFailureKind::REJECTED:
      return "rejected";
    case AuthFailureKind::INVALID_CODE:
      return "invalid code";
    case AuthFailureKind::TOO_MANY_ATTEMPTS:
      return "too many attempts";
    case AuthFailureKind::NO_CREDENTIALS:
      return "no credentials";
    case AuthFailureKind::TIMEOUT:
      return "timeout";
  }
  return "unknown";
}

/**
 * @brief Terminal failure of one authentication attempt, raised to whoever
 * is waiting in AuthStateMachine::authenticate().
 */
class AuthFailed : public std::runtime_error {
 public:
  AuthFailed(AuthFailureKind _kind, const string& msg)
      : std::runtime_error(msg), kind(_kind) {}

  AuthFailureKind getKind() const { return kind; }

 protected:
  AuthFailureKind kind;
};
}  // namespace mx

#endif  // __MX_ERRORS__
