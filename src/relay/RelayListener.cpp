#include "RelayListener.hpp"

#include "WebSocketMessageSocket.hpp"

namespace oc {
RelayListener::RelayListener(const RelayListenerConfig& _config,
                             shared_ptr<ConnectionIdRegistry> _idRegistry,
                             MessageSocketFactory _socketFactory)
    : onChallenge(EventPolicy::ERROR),
      config(_config),
      idRegistry(_idRegistry),
      socketFactory(_socketFactory),
      machine(_config.spareConnectionLimit, _config.reconnectTimeoutMs,
              _idRegistry),
      applyingEffects(false),
      loop(new TaskLoop("listener")) {
  if (!socketFactory) {
    throw UsageError("RelayListener needs a socket factory");
  }
}

RelayListener::~RelayListener() {
  try {
    loop->runAndWait([this]() { apply(machine.stop("Listener destroyed")); });
  } catch (const std::exception& e) {
    STERROR << "Error while shutting down the listener: " << e.what();
  }
  loop->stop();

  // The loop is gone, so nothing else touches these any more.  Destroying
  // the connections joins their threads, and a retired one may still wait
  // for a hand-over or a close acknowledgement.
  auto remaining = std::move(connections);
  connections.clear();
  auto retired = std::move(retiredConnections);
  retiredConnections.clear();
  for (auto& it : remaining) {
    it.second->terminate("Listener destroyed");
  }
  for (auto& connection : retired) {
    connection->terminate("Listener destroyed");
  }
  remaining.clear();
  retired.clear();
  handedOverConnections.clear();
}

void RelayListener::setCrypto(CryptoFunction encrypt, CryptoFunction decrypt) {
  loop->runAndWait([this, encrypt, decrypt]() {
    if (machine.isRunning()) {
      throw UsageError("setCrypto() must be called before start()");
    }
    encryptFn = encrypt;
    decryptFn = decrypt;
  });
}

void RelayListener::start(const string& _serverUrl, const string& _publicKey) {
  loop->runAndWait([this, _serverUrl, _publicKey]() {
    if (machine.isRunning()) {
      throw UsageError("Already running");
    }
    LOG(INFO) << "Listening at " << _serverUrl << " for "
              << bytesToHex(_publicKey) << " with "
              << config.spareConnectionLimit << " spare connections";
    serverUrl = _serverUrl;
    publicKey = _publicKey;
    apply(machine.start());
  });
}

void RelayListener::stop() {
  loop->runAndWait([this]() {
    LOG(INFO) << "Stopping listener for " << serverUrl;
    apply(machine.stop());
  });
}

ListenerState RelayListener::getState() {
  ListenerState state;
  loop->runAndWait([this, &state]() { state = machine.getState(); });
  return state;
}

size_t RelayListener::spareConnectionCount() {
  size_t count;
  loop->runAndWait([this, &count]() { count = machine.spareCount(); });
  return count;
}

size_t RelayListener::inflightConnectionCount() {
  size_t count;
  loop->runAndWait([this, &count]() { count = machine.inflightCount(); });
  return count;
}

bool RelayListener::hasPendingRetry() {
  bool pending;
  loop->runAndWait(
      [this, &pending]() { pending = bool(machine.getPendingRetry()); });
  return pending;
}

shared_ptr<MessageSocket> RelayListener::defaultSocketFactory(
    const string& url) {
  return shared_ptr<MessageSocket>(new WebSocketMessageSocket(url));
}

void RelayListener::establishListeningConnection(
    RelayClientConnection& connection, const HandshakeSettings& settings,
    std::function<void(std::exception_ptr)> onHandover) {
  uint64_t id = connection.getId();
  auto socket = connection.getSocket();
  try {
    socket->connect();
    socket->waitForOpen(settings.requestTimeoutMs);

    VLOG(1) << "[" << id << "] registering";
    connection.sendRegisterMessage(settings.publicKey);

    json request = connection.waitForMessage(
        RelayCommand::AUTHENTICATION_REQUEST, settings.requestTimeoutMs);
    AuthenticationRequest authRequest =
        RelayProtocol::parseAuthenticationRequest(request);

    VLOG(1) << "[" << id << "] answering challenge";
    if (!settings.answerChallenge) {
      throw UsageError("No way to answer the authentication challenge");
    }
    connection.sendAuthenticationResponseMessage(settings.answerChallenge(
        authRequest.challenge, authRequest.publicKey));

    json success = connection.waitForMessage(
        RelayCommand::AUTHENTICATION_SUCCESS, settings.requestTimeoutMs);
    int64_t pingInterval = RelayProtocol::parseAuthenticationSuccess(success);
    connection.startPingPong(pingInterval, settings.pongTimeoutMs,
                             settings.missedPongLimit);
  } catch (const std::exception& e) {
    LOG(WARNING) << "[" << id << "] handshake failed: " << e.what();
    connection.stopPingPong();
    connection.close(e.what());
    throw;
  }

  LOG(INFO) << "[" << id << "] authenticated, waiting for a peer";
  if (settings.onAuthenticated) {
    settings.onAuthenticated();
  }
  connection.waitForHandoverInBackground(onHandover);
}

void RelayListener::apply(const vector<ListenerEffect>& effects) {
  // Effects caused by event handlers run after the current batch
  pendingEffects.insert(pendingEffects.end(), effects.begin(), effects.end());
  if (applyingEffects) {
    return;
  }
  applyingEffects = true;
  while (!pendingEffects.empty()) {
    ListenerEffect effect = pendingEffects.front();
    pendingEffects.pop_front();
    try {
      execute(effect);
    } catch (const std::exception& e) {
      STERROR << "Listener effect " << effect.type << " failed: " << e.what();
    }
  }
  applyingEffects = false;
  reapRetired();
}

void RelayListener::execute(const ListenerEffect& effect) {
  switch (effect.type) {
    case ListenerEffect::OPEN_CONNECTION:
      openConnection(effect.connectionId);
      break;
    case ListenerEffect::SCHEDULE_RETRY: {
      uint64_t token = effect.retryToken;
      VLOG(1) << "Retrying in " << effect.delayMs << "ms";
      retryTimers[token] = loop->postDelayed(effect.delayMs, [this, token]() {
        retryTimers.erase(token);
        apply(machine.retryTimerFired(token));
      });
      break;
    }
    case ListenerEffect::CANCEL_RETRY: {
      auto it = retryTimers.find(effect.retryToken);
      if (it != retryTimers.end()) {
        loop->cancel(it->second);
        retryTimers.erase(it);
      }
      break;
    }
    case ListenerEffect::CLOSE_CONNECTION:
      releaseConnection(effect.connectionId, effect.reason, true);
      break;
    case ListenerEffect::TERMINATE_CONNECTION:
      releaseConnection(effect.connectionId, effect.reason, false);
      break;
    case ListenerEffect::EMIT_CONNECTION:
      handOver(effect.connectionId);
      break;
    case ListenerEffect::EMIT_STATE_CHANGE:
      LOG(INFO) << "Listener state " << listenerStateName(effect.oldState)
                << " -> " << listenerStateName(effect.newState) << " ("
                << effect.reason << ")";
      onStateChange.emit(effect.newState, effect.oldState, effect.reason);
      break;
  }
}

void RelayListener::openConnection(uint64_t id) {
  shared_ptr<RelayClientConnection> connection;
  try {
    auto socket = BlockingMessageSocket::create(socketFactory(serverUrl), id,
                                                config.maxQueuedMessages);
    socket->setDefaultTimeout(config.requestTimeoutMs);
    connection = make_shared<RelayClientConnection>(socket);
  } catch (const std::exception& e) {
    LOG(WARNING) << "[" << id << "] cannot create socket: " << e.what();
    apply(machine.attemptFailed(id, e.what()));
    return;
  }
  connections[id] = connection;

  HandshakeSettings settings;
  settings.publicKey = publicKey;
  settings.requestTimeoutMs = config.requestTimeoutMs;
  settings.pongTimeoutMs = config.pongTimeoutMs;
  settings.missedPongLimit = config.missedPongLimit;
  settings.answerChallenge = [this](const string& challenge,
                                    const string& serverPublicKey) {
    return answerChallenge(challenge, serverPublicKey);
  };
  settings.onAuthenticated = [this, id]() {
    loop->post([this, id]() { apply(machine.attemptSucceeded(id)); });
  };

  // The connection joins its own threads, so a raw pointer is enough here.
  RelayClientConnection* rawConnection = connection.get();
  rawConnection->runInBackground([this, rawConnection, id, settings]() {
    try {
      establishListeningConnection(
          *rawConnection, settings, [this, id](std::exception_ptr error) {
            if (!error) {
              loop->post([this, id]() { apply(machine.handedOver(id)); });
              return;
            }
            string reason = describe(error);
            loop->post([this, id, reason]() {
              apply(machine.spareFailed(id, reason));
            });
          });
    } catch (const std::exception& e) {
      string reason = e.what();
      loop->post(
          [this, id, reason]() { apply(machine.attemptFailed(id, reason)); });
    }
  });
}

void RelayListener::releaseConnection(uint64_t id, const string& reason,
                                      bool graceful) {
  shared_ptr<RelayClientConnection> connection;
  auto it = connections.find(id);
  if (it != connections.end()) {
    connection = it->second;
    connections.erase(it);
  } else {
    // A handshake that finished after stop() has already been retired
    auto retired = std::find_if(
        retiredConnections.begin(), retiredConnections.end(),
        [id](const shared_ptr<RelayClientConnection>& candidate) {
          return candidate->getId() == id;
        });
    if (retired == retiredConnections.end()) {
      return;
    }
    VLOG(1) << "[" << id << "] closing retired connection: " << reason;
    connection = *retired;
    retiredConnections.erase(retired);
  }
  if (graceful) {
    connection->close(reason);
  } else {
    connection->terminate(reason);
  }
  retire(connection);
}

void RelayListener::handOver(uint64_t id) {
  auto it = connections.find(id);
  if (it == connections.end()) {
    STERROR << "[" << id << "] handed over connection is unknown";
    return;
  }
  auto connection = it->second;
  connections.erase(it);
  auto socket = connection->getSocket();
  // The socket belongs to the application now, only the threads are ours
  handedOverConnections.push_back(connection);

  if (onConnection.listenerCount() == 0) {
    LOG(WARNING) << "[" << id << "] nobody accepts connections, closing";
    socket->close("No connection handler");
    return;
  }
  onConnection.emit(socket);
}

void RelayListener::retire(shared_ptr<RelayClientConnection> connection) {
  retiredConnections.push_back(connection);
}

void RelayListener::reapRetired() {
  auto finished = [](const shared_ptr<RelayClientConnection>& connection) {
    return !connection->hasRunningTasks();
  };
  retiredConnections.erase(std::remove_if(retiredConnections.begin(),
                                          retiredConnections.end(), finished),
                           retiredConnections.end());
  handedOverConnections.erase(
      std::remove_if(handedOverConnections.begin(),
                     handedOverConnections.end(), finished),
      handedOverConnections.end());
}

string RelayListener::answerChallenge(const string& challenge,
                                      const string& serverPublicKey) {
  if (encryptFn && decryptFn) {
    string plain = decryptFn(serverPublicKey, challenge);
    return encryptFn(serverPublicKey, RelayProtocol::invertBytes(plain));
  }
  return onChallenge.emitRace(challenge, serverPublicKey);
}

string RelayListener::describe(std::exception_ptr error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}
}  // namespace oc
