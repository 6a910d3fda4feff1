#include "PendingOperation.hpp"

namespace mx {
PendingOperation::PendingOperation()
    : outcome(Outcome::PENDING), failureKind(AuthFailureKind::REJECTED) {}

bool PendingOperation::resolve(const json& _result) {
  lock_guard<std::mutex> guard(operationMutex);
  if (outcome != Outcome::PENDING) {
    return false;
  }
  result = _result;
  return complete(Outcome::SUCCEEDED);
}

bool PendingOperation::fail(AuthFailureKind kind, const string& message) {
  lock_guard<std::mutex> guard(operationMutex);
  if (outcome != Outcome::PENDING) {
    return false;
  }
  failureKind = kind;
  failureMessage = message;
  return complete(Outcome::FAILED);
}

bool PendingOperation::supersede() {
  lock_guard<std::mutex> guard(operationMutex);
  if (outcome != Outcome::PENDING) {
    return false;
  }
  return complete(Outcome::SUPERSEDED);
}

bool PendingOperation::complete(Outcome _outcome) {
  outcome = _outcome;
  operationCondition.notify_all();
  return true;
}

PendingOperation::Outcome PendingOperation::wait(
    optional<std::chrono::milliseconds> timeout) {
  unique_lock<std::mutex> lock(operationMutex);
  auto done = [this]() { return outcome != Outcome::PENDING; };
  if (timeout) {
    operationCondition.wait_for(lock, *timeout, done);
  } else {
    operationCondition.wait(lock, done);
  }
  return outcome;
}

PendingOperation::Outcome PendingOperation::getOutcome() {
  lock_guard<std::mutex> guard(operationMutex);
  return outcome;
}

json PendingOperation::getResult() {
  lock_guard<std::mutex> guard(operationMutex);
  return result;
}

AuthFailed PendingOperation::getError() {
  lock_guard<std::mutex> guard(operationMutex);
  return AuthFailed(failureKind, failureMessage);
}
}  // namespace mx
