#include "AuthStateMachine.hpp"

namespace mx {
namespace {
string stringField(const json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return "";
  }
  return it->get<string>();
}

optional<string> extractLoginToken(const json& payload) {
  auto attrs = payload.find("tokenAttrs");
  if (attrs == payload.end() || !attrs->is_object()) {
    return nullopt;
  }
  auto login = attrs->find("LOGIN");
  if (login == attrs->end() || !login->is_object()) {
    return nullopt;
  }
  string token = stringField(*login, "token");
  if (token.empty()) {
    return nullopt;
  }
  return token;
}
}  // namespace

const char* authStateName(AuthState state) {
  switch (state) {
    case AuthState::IDLE:
      return "IDLE";
    case AuthState::AWAITING_TOKEN:
      return "AWAITING_TOKEN";
    case AuthState::AWAITING_PHONE_CODE:
      return "AWAITING_PHONE_CODE";
    case AuthState::REAUTHENTICATING:
      return "REAUTHENTICATING";
    case AuthState::AUTHENTICATED:
      return "AUTHENTICATED";
    case AuthState::FAILED:
      return "FAILED";
  }
  return "UNKNOWN";
}

AuthStateMachine::AuthStateMachine(std::shared_ptr<MxConnection> _connection,
                                   std::shared_ptr<AuthSession> _session,
                                   const ClientConfig& _config)
    : connection(_connection),
      session(_session),
      config(_config),
      state(AuthState::IDLE) {
  EventRouter* router = connection->getRouter();
  registrations.push_back(make_pair(
      EventName::AUTH_SUCCESS,
      router->registerHandler(EventName::AUTH_SUCCESS, [this](const json& p) {
        onAuthSuccess(p);
      })));
  registrations.push_back(make_pair(
      EventName::AUTH_CODE_REQUESTED,
      router->registerHandler(
          EventName::AUTH_CODE_REQUESTED,
          [this](const json& p) { onAuthCodeRequested(p); })));
  registrations.push_back(make_pair(
      EventName::AUTH_CODE_CHECKED,
      router->registerHandler(
          EventName::AUTH_CODE_CHECKED,
          [this](const json& p) { onAuthCodeChecked(p); })));
  registrations.push_back(make_pair(
      EventName::AUTH_ERROR,
      router->registerHandler(EventName::AUTH_ERROR, [this](const json& p) {
        onAuthError(p);
      })));
  registrations.push_back(make_pair(
      EventName::AUTH_CODE_ERROR,
      router->registerHandler(
          EventName::AUTH_CODE_ERROR,
          [this](const json& p) { onAuthCodeError(p); })));
}

AuthStateMachine::~AuthStateMachine() {
  for (const auto& it : registrations) {
    connection->getRouter()->removeHandler(it.first, it.second);
  }
  shutdown();
}

void AuthStateMachine::shutdown() {
  auto operation = session->getPending();
  if (operation) {
    operation->fail(AuthFailureKind::REJECTED, "Client is shutting down");
  }
  lock_guard<std::mutex> guard(watcherMutex);
  if (reauthWatcher.joinable()) {
    reauthWatcher.join();
  }
}

AuthState AuthStateMachine::getState() {
  lock_guard<std::mutex> guard(stateMutex);
  return state;
}

void AuthStateMachine::setState(AuthState newState) {
  lock_guard<std::mutex> guard(stateMutex);
  if (state != newState) {
    VLOG(1) << "Auth state " << authStateName(state) << " -> "
            << authStateName(newState);
  }
  state = newState;
}

json AuthStateMachine::authenticate(const optional<string>& phone,
                                    CodeProvider codeProvider) {
  if (codeProvider) {
    session->setCodeProvider(codeProvider);
  }

  auto token = session->getToken();
  if (token) {
    LOG(INFO) << "Found saved token, authorizing";
    std::this_thread::sleep_for(config.authDelay);
    // The attempt must exist before the frame goes out, the reply can
    // arrive before send() returns.
    auto operation = session->beginOperation();
    setState(AuthState::AWAITING_TOKEN);
    try {
      connection->sendAuthToken(*token, false);
    } catch (const SendError&) {
      setState(AuthState::FAILED);
      throw;
    }
    LOG(INFO) << "Token sent";
    return awaitOutcome(operation, config.tokenAuthTimeout);
  }

  optional<string> knownPhone = phone ? phone : session->getPhone();
  if (!knownPhone) {
    setState(AuthState::FAILED);
    throw AuthFailed(AuthFailureKind::NO_CREDENTIALS,
                     "No saved token and no phone number");
  }
  std::shared_ptr<PendingOperation> operation;
  try {
    operation = startPhoneFlow(*knownPhone, AuthState::AWAITING_PHONE_CODE);
  } catch (const SendError&) {
    setState(AuthState::FAILED);
    throw;
  }
  return awaitOutcome(operation, nullopt);
}

std::shared_ptr<PendingOperation> AuthStateMachine::startPhoneFlow(
    const string& phone, AuthState newState) {
  LOG(INFO) << "Sending phone number " << phone;
  session->persistPhone(phone);
  auto operation = session->beginOperation();
  setState(newState);
  connection->sendAuthStart(phone, config.language);
  connection->sendEvents(
      json::array({{{"type", "COLD_START"}, {"time", nowMillis()}}}));
  connection->sendEvents(
      json::array({{{"type", "GO"}, {"page", 1}, {"time", nowMillis()}}}));
  LOG(INFO) << "Phone number and navigation events sent";
  return operation;
}

json AuthStateMachine::awaitOutcome(
    std::shared_ptr<PendingOperation> operation,
    optional<std::chrono::milliseconds> bound) {
  while (true) {
    switch (operation->wait(bound)) {
      case PendingOperation::Outcome::SUCCEEDED:
        return operation->getResult();
      case PendingOperation::Outcome::FAILED:
        throw operation->getError();
      case PendingOperation::Outcome::SUPERSEDED:
        LOG(INFO) << "Authentication restarted, following the new attempt";
        operation = session->getPending();
        bound = config.reauthTimeout;
        break;
      case PendingOperation::Outcome::PENDING:
        if (operation->fail(AuthFailureKind::TIMEOUT,
                            "Authorization timeout")) {
          LOG(WARNING) << "Authorization timeout";
          if (session->getPending() == operation) {
            setState(AuthState::FAILED);
          }
        }
        // Either way the operation is complete now, report its outcome
        break;
    }
  }
}

void AuthStateMachine::failCurrent(AuthFailureKind kind,
                                   const string& message) {
  setState(AuthState::FAILED);
  auto operation = session->getPending();
  if (operation) {
    operation->fail(kind, message);
  }
}

void AuthStateMachine::onAuthSuccess(const json& payload) {
  string newToken = stringField(payload, "token");
  if (!newToken.empty()) {
    session->persistToken(newToken);
  }
  setState(AuthState::AUTHENTICATED);
  LOG(INFO) << "Authorized";
  auto operation = session->getPending();
  if (operation) {
    operation->resolve(payload);
  }
}

void AuthStateMachine::onAuthCodeRequested(const json& payload) {
  LOG(INFO) << "Code verification requested";
  CodeProvider provider = session->getCodeProvider();
  if (!provider) {
    LOG(WARNING) << "Verification code requested but no code provider is set";
    return;
  }
  optional<string> code = provider();
  if (!code || code->empty()) {
    LOG(INFO) << "No verification code entered";
    return;
  }
  connection->sendAuthCode(stringField(payload, "token"), *code);
  LOG(INFO) << "Verification code sent";
}

void AuthStateMachine::onAuthCodeChecked(const json& payload) {
  auto loginToken = extractLoginToken(payload);
  if (!loginToken) {
    LOG(INFO) << "Code checked but the reply carries no login token";
    return;
  }
  LOG(INFO) << "Code verified, authorization token received";
  session->persistToken(*loginToken);
  connection->sendAuthToken(*loginToken, false);
  LOG(INFO) << "Token sent";
}

void AuthStateMachine::onAuthError(const json& payload) {
  string error = stringField(payload, "error");
  string message = stringField(payload, "message");
  LOG(WARNING) << "Authorization error: " << message;

  if (error != "login.token" && message != "FAIL_LOGIN_TOKEN") {
    failCurrent(AuthFailureKind::REJECTED, "Auth error: " + message);
    return;
  }

  LOG(INFO) << "Token invalid, re-authorization required";
  session->clearToken();
  auto phone = session->getPhone();
  if (!phone) {
    LOG(WARNING) << "Phone number not found, manual authorization required";
    failCurrent(AuthFailureKind::NO_CREDENTIALS, "Phone number not found");
    return;
  }
  startReauth(*phone);
}

void AuthStateMachine::startReauth(const string& phone) {
  LOG(INFO) << "Requesting re-authorization by phone";
  lock_guard<std::mutex> guard(watcherMutex);
  // The previous watcher's attempt is superseded below, so it exits promptly
  auto operation = startPhoneFlow(phone, AuthState::REAUTHENTICATING);
  if (reauthWatcher.joinable()) {
    reauthWatcher.join();
  }
  reauthWatcher =
      std::thread(&AuthStateMachine::watchReauth, this, operation);
}

void AuthStateMachine::watchReauth(
    std::shared_ptr<PendingOperation> operation) {
  el::Helpers::setThreadName("Reauth");
  switch (operation->wait(config.reauthTimeout)) {
    case PendingOperation::Outcome::SUCCEEDED:
      LOG(INFO) << "Re-authorization successful";
      break;
    case PendingOperation::Outcome::FAILED:
      LOG(WARNING) << "Re-authorization failed: "
                   << operation->getError().what();
      break;
    case PendingOperation::Outcome::SUPERSEDED:
      VLOG(1) << "Re-authorization attempt superseded";
      break;
    case PendingOperation::Outcome::PENDING:
      if (operation->fail(AuthFailureKind::TIMEOUT,
                          "Re-authorization timeout")) {
        LOG(WARNING) << "Authorization timeout";
        if (session->getPending() == operation) {
          setState(AuthState::FAILED);
        }
      }
      break;
  }
}

void AuthStateMachine::onAuthCodeError(const json& payload) {
  string error = stringField(payload, "error");
  string localized = stringField(payload, "localizedMessage");
  if (localized.empty()) {
    localized = stringField(payload, "message");
  }
  LOG(WARNING) << "Authorization code error: " << localized;

  AuthFailureKind kind = AuthFailureKind::INVALID_CODE;
  if (error == "error.limit.violate") {
    LOG(WARNING) << "Too many attempts, please try again later";
    kind = AuthFailureKind::TOO_MANY_ATTEMPTS;
  }
  failCurrent(kind, "Auth code error: " + localized);
}
}  // namespace mx
