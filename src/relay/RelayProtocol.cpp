#include "RelayProtocol.hpp"

namespace oc {
json RelayProtocol::makeRegister(const string& publicKey) {
  return {{"command", RelayCommand::REGISTER},
          {"publicKey", bytesToHex(publicKey)}};
}

json RelayProtocol::makeAuthenticationRequest(const string& publicKey,
                                              const string& challenge) {
  return {{"command", RelayCommand::AUTHENTICATION_REQUEST},
          {"publicKey", bytesToHex(publicKey)},
          {"challenge", bytesToHex(challenge)}};
}

json RelayProtocol::makeAuthenticationResponse(const string& response) {
  return {{"command", RelayCommand::AUTHENTICATION_RESPONSE},
          {"response", bytesToHex(response)}};
}

json RelayProtocol::makeAuthenticationSuccess(int64_t pingIntervalMs) {
  return {{"command", RelayCommand::AUTHENTICATION_SUCCESS},
          {"pingInterval", pingIntervalMs}};
}

json RelayProtocol::makeConnectionHandover() {
  return {{"command", RelayCommand::CONNECTION_HANDOVER}};
}

json RelayProtocol::makePing() { return {{"command", RelayCommand::PING}}; }

json RelayProtocol::makePong() { return {{"command", RelayCommand::PONG}}; }

string RelayProtocol::getCommand(const json& message) {
  if (!hasStringField(message, "command")) {
    throw ProtocolError("Parsing message failed: no command field");
  }
  return message["command"].get<string>();
}

bool RelayProtocol::isServerMessage(const json& message,
                                    const string& command) {
  if (!hasStringField(message, "command") ||
      message["command"].get<string>() != command) {
    return false;
  }
  if (command == RelayCommand::AUTHENTICATION_REQUEST) {
    return hasStringField(message, "publicKey") &&
           hasStringField(message, "challenge");
  }
  if (command == RelayCommand::AUTHENTICATION_SUCCESS) {
    return hasNumberField(message, "pingInterval");
  }
  return command == RelayCommand::CONNECTION_HANDOVER ||
         command == RelayCommand::PING || command == RelayCommand::PONG;
}

bool RelayProtocol::isClientMessage(const json& message,
                                    const string& command) {
  if (!hasStringField(message, "command") ||
      message["command"].get<string>() != command) {
    return false;
  }
  if (command == RelayCommand::REGISTER) {
    return hasStringField(message, "publicKey");
  }
  if (command == RelayCommand::AUTHENTICATION_RESPONSE) {
    return hasStringField(message, "response");
  }
  return command == RelayCommand::PING || command == RelayCommand::PONG;
}

bool RelayProtocol::isKeepAlive(const string& command) {
  return command == RelayCommand::PING || command == RelayCommand::PONG;
}

void RelayProtocol::throwMismatch(const string& command) {
  throw ProtocolError(
      "Received data does not match the data expected for command '" +
      command + "'");
}

string RelayProtocol::parseRegister(const json& message) {
  return decodeHexField(message, "publicKey");
}

AuthenticationRequest RelayProtocol::parseAuthenticationRequest(
    const json& message) {
  AuthenticationRequest request;
  request.publicKey = decodeHexField(message, "publicKey");
  request.challenge = decodeHexField(message, "challenge");
  return request;
}

string RelayProtocol::parseAuthenticationResponse(const json& message) {
  return decodeHexField(message, "response");
}

int64_t RelayProtocol::parseAuthenticationSuccess(const json& message) {
  if (!hasNumberField(message, "pingInterval")) {
    throwMismatch(RelayCommand::AUTHENTICATION_SUCCESS);
  }
  int64_t pingInterval = message["pingInterval"].get<int64_t>();
  if (pingInterval <= 0) {
    throw ProtocolError("Invalid ping interval: " + to_string(pingInterval));
  }
  return pingInterval;
}

string RelayProtocol::invertBytes(const string& bytes) {
  string inverted(bytes);
  for (auto& c : inverted) {
    c = static_cast<char>(~static_cast<unsigned char>(c));
  }
  return inverted;
}

string RelayProtocol::decodeHexField(const json& message, const char* field) {
  if (!hasStringField(message, field)) {
    throw ProtocolError(string("Missing field '") + field + "'");
  }
  try {
    return hexToBytes(message[field].get<string>());
  } catch (const std::runtime_error& e) {
    throw ProtocolError(string("Field '") + field + "' is not hex: " +
                        e.what());
  }
}
}  // namespace oc
