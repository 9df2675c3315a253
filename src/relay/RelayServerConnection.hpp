#ifndef __OC_RELAY_SERVER_CONNECTION__
#define __OC_RELAY_SERVER_CONNECTION__

#include "BlockingMessageSocket.hpp"
#include "CryptoHandler.hpp"
#include "Headers.hpp"
#include "RelayProtocol.hpp"

namespace oc {
/**
 * @brief Relay server side of the control protocol for one accepted socket.
 */
class RelayServerConnection {
 public:
  static const size_t CHALLENGE_LENGTH = 64;

  explicit RelayServerConnection(shared_ptr<BlockingMessageSocket> _socket);
  ~RelayServerConnection();

  inline shared_ptr<BlockingMessageSocket> getSocket() { return socket; }

  /** @return The public key the client registered with. */
  string waitForRegister(int64_t timeoutMs = USE_DEFAULT_TIMEOUT);

  void sendAuthenticationRequest(const string& publicKey,
                                 const string& challenge);
  string waitForAuthenticationResponse(int64_t timeoutMs = USE_DEFAULT_TIMEOUT);
  void sendAuthenticationSuccess(int64_t pingIntervalMs);
  void sendConnectionHandover();
  void sendPing();
  void sendPong();

  /**
   * @brief Waits for a client frame with the given command, answering pings
   * and dropping pongs on the way.
   */
  json waitForMessage(const string& command,
                      int64_t timeoutMs = USE_DEFAULT_TIMEOUT);

  /**
   * @brief Runs register / challenge / success against the client.
   *
   * The client proves it owns the registered key by returning the bitwise
   * complement of the challenge, encrypted for @p crypto's key.
   * @return The registered public key.
   * @throws ProtocolError if the proof is wrong.
   */
  string authenticate(CryptoHandler& crypto, int64_t pingIntervalMs,
                      int64_t timeoutMs = USE_DEFAULT_TIMEOUT);

  /**
   * @brief Switches the socket to push mode and answers every ping (unless
   * @p answerPings is false) until the socket closes.
   */
  void serveKeepAlive(bool answerPings = true);
  void setAnswerPings(bool answerPings);

  uint64_t getPingsReceived();

  void close(const string& reason = "");
  void terminate(const string& reason = "");

 protected:
  void send(const json& message);
  void handleKeepAlive(const string& message);

  shared_ptr<BlockingMessageSocket> socket;
  std::function<void()> keepAliveDisconnect;
  std::atomic<bool> answerPings;
  std::atomic<uint64_t> pingsReceived;
};
}  // namespace oc

#endif  // __OC_RELAY_SERVER_CONNECTION__
