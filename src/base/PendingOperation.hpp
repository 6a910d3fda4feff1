#ifndef __MX_PENDING_OPERATION__
#define __MX_PENDING_OPERATION__

#include "Errors.hpp"
#include "Headers.hpp"

namespace mx {
/**
 * @brief A one-shot result slot for an in-flight request, completed by the
 * listen thread and awaited by any number of other threads.
 */
class PendingOperation {
 public:
  enum class Outcome { PENDING = 0, SUCCEEDED = 1, FAILED = 2, SUPERSEDED = 3 };

  PendingOperation();

  /** @brief Completes successfully.  Returns false if already complete. */
  bool resolve(const json& result);

  /** @brief Completes with an error.  Returns false if already complete. */
  bool fail(AuthFailureKind kind, const string& message);

  /**
   * @brief Marks the operation as replaced by a newer attempt.  Waiters
   * wake up and are expected to move on to the replacement.
   */
  bool supersede();

  /**
   * @brief Blocks until the operation completes.  Without a timeout the wait
   * is unbounded.  Returns PENDING only when the timeout expired.
   */
  Outcome wait(optional<std::chrono::milliseconds> timeout = nullopt);

  Outcome getOutcome();

  json getResult();

  /** @brief Builds the exception describing a FAILED outcome. */
  AuthFailed getError();

 protected:
  bool complete(Outcome _outcome);

  std::mutex operationMutex;
  std::condition_variable operationCondition;
  Outcome outcome;
  json result;
  AuthFailureKind failureKind;
  string failureMessage;
};
}  // namespace mx

#endif  // __MX_PENDING_OPERATION__
