#include "AuthSession.hpp"

namespace mx {
AuthSession::AuthSession(std::shared_ptr<SessionStore> _store)
    : store(_store) {}

optional<string> AuthSession::getToken() {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  return store->getString("token");
}

void AuthSession::persistToken(const string& token) {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  store->set("token", token);
  saveStore();
  LOG(INFO) << "Token saved to session";
}

void AuthSession::clearToken() {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  store->set("token", nullptr);
  saveStore();
}

optional<string> AuthSession::getPhone() {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  if (phone) {
    return phone;
  }
  return store->getString("phone");
}

void AuthSession::persistPhone(const string& _phone) {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  phone = _phone;
  store->set("phone", _phone);
  saveStore();
}

std::shared_ptr<PendingOperation> AuthSession::beginOperation() {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  auto previous = pending;
  pending.reset(new PendingOperation());
  if (previous && previous->supersede()) {
    VLOG(1) << "Superseded the previous authentication attempt";
  }
  return pending;
}

std::shared_ptr<PendingOperation> AuthSession::getPending() {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  return pending;
}

void AuthSession::setCodeProvider(CodeProvider provider) {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  codeProvider = provider;
}

CodeProvider AuthSession::getCodeProvider() {
  lock_guard<std::recursive_mutex> guard(sessionMutex);
  return codeProvider;
}

void AuthSession::saveStore() {
  try {
    store->save();
  } catch (const PersistenceError& pe) {
    LOG(ERROR) << "Error saving session: " << pe.what();
  }
}
}  // namespace mx
