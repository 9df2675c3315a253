#include "RelayServerConnection.hpp"

namespace oc {
RelayServerConnection::RelayServerConnection(
    shared_ptr<BlockingMessageSocket> _socket)
    : socket(_socket), answerPings(true), pingsReceived(0) {}

RelayServerConnection::~RelayServerConnection() {
  if (keepAliveDisconnect) {
    keepAliveDisconnect();
  }
}

string RelayServerConnection::waitForRegister(int64_t timeoutMs) {
  json message = waitForMessage(RelayCommand::REGISTER, timeoutMs);
  return RelayProtocol::parseRegister(message);
}

void RelayServerConnection::sendAuthenticationRequest(const string& publicKey,
                                                      const string& challenge) {
  send(RelayProtocol::makeAuthenticationRequest(publicKey, challenge));
}

string RelayServerConnection::waitForAuthenticationResponse(int64_t timeoutMs) {
  json message = waitForMessage(RelayCommand::AUTHENTICATION_RESPONSE, timeoutMs);
  return RelayProtocol::parseAuthenticationResponse(message);
}

void RelayServerConnection::sendAuthenticationSuccess(int64_t pingIntervalMs) {
  send(RelayProtocol::makeAuthenticationSuccess(pingIntervalMs));
}

void RelayServerConnection::sendConnectionHandover() {
  send(RelayProtocol::makeConnectionHandover());
}

void RelayServerConnection::sendPing() { send(RelayProtocol::makePing()); }

void RelayServerConnection::sendPong() { send(RelayProtocol::makePong()); }

json RelayServerConnection::waitForMessage(const string& command,
                                           int64_t timeoutMs) {
  while (true) {
    json message = socket->waitForJSONMessage(timeoutMs);
    string received = RelayProtocol::getCommand(message);
    if (received != command && RelayProtocol::isKeepAlive(received)) {
      if (received == RelayCommand::PING) {
        pingsReceived++;
        if (answerPings) {
          sendPong();
        }
      }
      continue;
    }
    if (!RelayProtocol::isClientMessage(message, command)) {
      RelayProtocol::throwMismatch(command);
    }
    return message;
  }
}

string RelayServerConnection::authenticate(CryptoHandler& crypto,
                                           int64_t pingIntervalMs,
                                           int64_t timeoutMs) {
  string clientKey = waitForRegister(timeoutMs);
  VLOG(1) << "[" << socket->getId() << "] register from "
          << bytesToHex(clientKey);

  string challenge(CHALLENGE_LENGTH, '\0');
  randombytes_buf(&challenge[0], challenge.length());
  sendAuthenticationRequest(crypto.getPublicKey(),
                            crypto.encrypt(clientKey, challenge));

  string response = waitForAuthenticationResponse(timeoutMs);
  string proof;
  try {
    proof = crypto.decrypt(clientKey, response);
  } catch (const std::runtime_error& e) {
    throw ProtocolError(string("Authentication failed: ") + e.what());
  }
  string expected = RelayProtocol::invertBytes(challenge);
  if (proof.length() != expected.length() ||
      sodium_memcmp(proof.data(), expected.data(), expected.length()) != 0) {
    throw ProtocolError("Authentication failed: wrong challenge response");
  }

  sendAuthenticationSuccess(pingIntervalMs);
  return clientKey;
}

void RelayServerConnection::serveKeepAlive(bool _answerPings) {
  answerPings = _answerPings;
  if (keepAliveDisconnect) {
    return;
  }
  socket->setWaitForMessageDisabled(true);
  keepAliveDisconnect = socket->onMessage.connect(
      [this](const string& message) { handleKeepAlive(message); });
}

void RelayServerConnection::setAnswerPings(bool _answerPings) {
  answerPings = _answerPings;
}

uint64_t RelayServerConnection::getPingsReceived() { return pingsReceived; }

void RelayServerConnection::close(const string& reason) {
  socket->close(reason);
}

void RelayServerConnection::terminate(const string& reason) {
  socket->terminate(reason);
}

void RelayServerConnection::send(const json& message) {
  socket->sendJSON(message);
}

void RelayServerConnection::handleKeepAlive(const string& message) {
  json parsed = json::parse(message, nullptr, false);
  if (parsed.is_discarded() ||
      !RelayProtocol::isClientMessage(parsed, RelayCommand::PING)) {
    return;
  }
  pingsReceived++;
  if (!answerPings) {
    return;
  }
  try {
    sendPong();
  } catch (const TransportError& e) {
    LOG(INFO) << "[" << socket->getId() << "] cannot answer ping: " << e.what();
  }
}
}  // namespace oc
