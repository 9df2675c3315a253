#ifndef __OC_RELAY_LISTENER__
#define __OC_RELAY_LISTENER__

#include "BlockingMessageSocket.hpp"
#include "ConnectionIdRegistry.hpp"
#include "Event.hpp"
#include "Headers.hpp"
#include "ListenerStateMachine.hpp"
#include "MessageSocket.hpp"
#include "RelayClientConnection.hpp"
#include "TaskLoop.hpp"

namespace oc {
struct RelayListenerConfig {
  size_t spareConnectionLimit = 1;
  int64_t reconnectTimeoutMs = DEFAULT_RECONNECT_TIMEOUT_MS;
  int64_t pongTimeoutMs = DEFAULT_PONG_TIMEOUT_MS;
  int missedPongLimit = 1;
  // Applies to every wait of the handshake
  int64_t requestTimeoutMs = WAIT_FOREVER;
  size_t maxQueuedMessages = DEFAULT_MAX_QUEUED_MESSAGES;
};

/** @brief encrypt or decrypt @p data for / from @p peerPublicKey */
typedef std::function<string(const string& peerPublicKey, const string& data)>
    CryptoFunction;

/** @brief Everything one handshake needs besides the connection. */
struct HandshakeSettings {
  string publicKey;
  int64_t requestTimeoutMs = WAIT_FOREVER;
  int64_t pongTimeoutMs = DEFAULT_PONG_TIMEOUT_MS;
  int missedPongLimit = 1;
  // (challenge, serverPublicKey) -> proof
  std::function<string(const string&, const string&)> answerChallenge;
  // Runs once authenticated, before the hand-over wait starts
  std::function<void()> onAuthenticated;
};

/**
 * @brief Keeps a pool of authenticated spare connections registered at a
 * relay server and hands them to the application when a peer connects.
 *
 * Pool bookkeeping lives in a ListenerStateMachine that is only touched on
 * the listener's own TaskLoop.  Handshakes run on per-connection threads and
 * report back by posting to that loop.  The public methods are thread safe
 * and may be called from inside the event handlers.
 */
class RelayListener {
 public:
  explicit RelayListener(
      const RelayListenerConfig& _config,
      shared_ptr<ConnectionIdRegistry> _idRegistry =
          ConnectionIdRegistry::processWide(),
      MessageSocketFactory _socketFactory = defaultSocketFactory);
  ~RelayListener();

  /**
   * @brief Answer challenges with these functions instead of onChallenge.
   * Must be called before start().
   */
  void setCrypto(CryptoFunction encrypt, CryptoFunction decrypt);

  /**
   * @brief Starts filling the spare pool for @p publicKey at @p serverUrl.
   * @throws UsageError if already running.
   */
  void start(const string& serverUrl, const string& publicKey);

  /**
   * @brief Closes all spares and cancels the pending retry.  Connections
   * already handed over are left alone.
   */
  void stop();

  ListenerState getState();
  size_t spareConnectionCount();
  size_t inflightConnectionCount();
  bool hasPendingRetry();

  /** @brief Opens a WebSocketMessageSocket. */
  static shared_ptr<MessageSocket> defaultSocketFactory(const string& url);

  /**
   * @brief Registers and authenticates @p connection and starts the
   * background wait for its hand-over.
   *
   * Blocks until authentication succeeded.  On failure the connection is
   * closed with the error as reason and the error is rethrown.  The outcome of
   * the hand-over wait is reported later through @p onHandover.
   */
  static void establishListeningConnection(
      RelayClientConnection& connection, const HandshakeSettings& settings,
      std::function<void(std::exception_ptr)> onHandover);

  /** @brief A peer connected through one of the spares. */
  Event<void(shared_ptr<BlockingMessageSocket>)> onConnection;

  /** @brief (newState, oldState, reason) */
  Event<void(ListenerState, ListenerState, const string&)> onStateChange;

  /** @brief (challenge, serverPublicKey) -> proof.  Used without setCrypto. */
  Event<string(const string&, const string&)> onChallenge;

 protected:
  // Everything below runs on the loop
  void apply(const vector<ListenerEffect>& effects);
  void execute(const ListenerEffect& effect);
  void openConnection(uint64_t id);
  void releaseConnection(uint64_t id, const string& reason, bool graceful);
  void handOver(uint64_t id);
  void retire(shared_ptr<RelayClientConnection> connection);
  void reapRetired();

  string answerChallenge(const string& challenge,
                         const string& serverPublicKey);
  static string describe(std::exception_ptr error);

  RelayListenerConfig config;
  shared_ptr<ConnectionIdRegistry> idRegistry;
  MessageSocketFactory socketFactory;
  CryptoFunction encryptFn;
  CryptoFunction decryptFn;

  ListenerStateMachine machine;
  string serverUrl;
  string publicKey;
  map<uint64_t, shared_ptr<RelayClientConnection>> connections;
  // Closed or terminated, waiting for their threads to finish
  vector<shared_ptr<RelayClientConnection>> retiredConnections;
  // Handed over, their sockets are never touched again
  vector<shared_ptr<RelayClientConnection>> handedOverConnections;
  map<uint64_t, TaskLoop::TimerId> retryTimers;
  std::deque<ListenerEffect> pendingEffects;
  bool applyingEffects;

  unique_ptr<TaskLoop> loop;
};
}  // namespace oc

#endif  // __OC_RELAY_LISTENER__
