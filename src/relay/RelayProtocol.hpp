#ifndef __OC_RELAY_PROTOCOL__
#define __OC_RELAY_PROTOCOL__

#include "Errors.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace oc {
/**
 * @brief Control frames spoken between a listening instance and the relay
 * server.  Every frame is a JSON object with a "command" field, binary fields
 * travel as lowercase hex.
 */
namespace RelayCommand {
static const char* const REGISTER = "register";
static const char* const AUTHENTICATION_REQUEST = "authentication_request";
static const char* const AUTHENTICATION_RESPONSE = "authentication_response";
static const char* const AUTHENTICATION_SUCCESS = "authentication_success";
static const char* const CONNECTION_HANDOVER = "connection_handover";
static const char* const PING = "comm_ping";
static const char* const PONG = "comm_pong";
}  // namespace RelayCommand

/** @brief Decoded authentication_request. */
struct AuthenticationRequest {
  string publicKey;
  string challenge;
};

class RelayProtocol {
 public:
  static json makeRegister(const string& publicKey);
  static json makeAuthenticationRequest(const string& publicKey,
                                        const string& challenge);
  static json makeAuthenticationResponse(const string& response);
  static json makeAuthenticationSuccess(int64_t pingIntervalMs);
  static json makeConnectionHandover();
  static json makePing();
  static json makePong();

  /**
   * @brief Returns the command of a frame.
   * @throws ProtocolError if there is none.
   */
  static string getCommand(const json& message);

  /** @brief Frames the server may send, with their required fields. */
  static bool isServerMessage(const json& message, const string& command);

  /** @brief Frames the client may send, with their required fields. */
  static bool isClientMessage(const json& message, const string& command);

  /** @brief comm_ping and comm_pong may show up at any time. */
  static bool isKeepAlive(const string& command);

  /**
   * @throws ProtocolError with the standard mismatch message.
   */
  [[noreturn]] static void throwMismatch(const string& command);

  // Decoders for frames that passed isServerMessage / isClientMessage.
  // All of them throw ProtocolError for undecodable binary fields.
  static string parseRegister(const json& message);
  static AuthenticationRequest parseAuthenticationRequest(const json& message);
  static string parseAuthenticationResponse(const json& message);
  static int64_t parseAuthenticationSuccess(const json& message);

  /** @brief Flips every bit of every byte. */
  static string invertBytes(const string& bytes);

 protected:
  static string decodeHexField(const json& message, const char* field);
};
}  // namespace oc

#endif  // __OC_RELAY_PROTOCOL__
