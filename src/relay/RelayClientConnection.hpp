#ifndef __OC_RELAY_CLIENT_CONNECTION__
#define __OC_RELAY_CLIENT_CONNECTION__

#include "BlockingMessageSocket.hpp"
#include "Headers.hpp"
#include "RelayProtocol.hpp"

namespace oc {
/**
 * @brief Client side of the relay control protocol on top of one
 * BlockingMessageSocket.
 *
 * Besides the blocking protocol calls this owns three optional background
 * threads: one running an arbitrary task (the handshake), one waiting for the
 * hand-over and one doing ping / pong.  The destructor joins all of them but
 * never closes the socket, which may belong to the application by then.
 */
class RelayClientConnection {
 public:
  explicit RelayClientConnection(shared_ptr<BlockingMessageSocket> _socket);
  ~RelayClientConnection();

  inline uint64_t getId() const { return id; }
  inline shared_ptr<BlockingMessageSocket> getSocket() { return socket; }

  void setRequestTimeout(int64_t timeoutMs);
  int64_t getRequestTimeout();

  void sendRegisterMessage(const string& publicKey);
  void sendAuthenticationResponseMessage(const string& response);
  void sendPingMessage();
  void sendPongMessage();

  /**
   * @brief Waits for a server frame with the given command.
   *
   * Pings from the server are answered and stray pongs dropped while waiting.
   * @throws ProtocolError for any other command or missing fields.
   * @throws TransportError / TimeoutError from the socket.
   */
  json waitForMessage(const string& command,
                      int64_t timeoutMs = USE_DEFAULT_TIMEOUT);

  /**
   * @brief Sends a ping every @p pingIntervalMs.  If @p missedPongLimit pings
   * in a row are not answered within @p pongTimeoutMs the socket is
   * terminated.
   * @throws UsageError if already running.
   */
  void startPingPong(int64_t pingIntervalMs,
                     int64_t pongTimeoutMs = DEFAULT_PONG_TIMEOUT_MS,
                     int missedPongLimit = 1);

  /** @brief Stops pinging and waits for the ping thread to exit. */
  void stopPingPong();

  bool isPinging();

  void close(const string& reason = "");
  void terminate(const string& reason = "");

  /**
   * @brief Runs @p task on this connection's worker thread.
   * @throws UsageError if a task is still running.
   */
  void runInBackground(std::function<void()> task);

  /**
   * @brief Waits for connection_handover on a background thread.
   *
   * Ping / pong is stopped afterwards and @p callback is invoked exactly once,
   * with nullptr on hand-over or with the failure.
   */
  void waitForHandoverInBackground(
      std::function<void(std::exception_ptr)> callback);

  /** @brief True while the worker or hand-over thread is still running. */
  bool hasRunningTasks();

 protected:
  void pingLoop(int64_t pingIntervalMs, int64_t pongTimeoutMs,
                int missedPongLimit);
  void handleIncoming(const string& message);
  void send(const json& message);
  static void joinThread(shared_ptr<std::thread>& thread);

  shared_ptr<BlockingMessageSocket> socket;
  uint64_t id;
  std::function<void()> messageDisconnect;

  std::recursive_mutex connectionMutex;
  shared_ptr<std::thread> workerThread;
  shared_ptr<std::thread> handoverThread;
  std::atomic<bool> workerRunning;
  std::atomic<bool> handoverRunning;

  std::mutex pingMutex;
  std::condition_variable pingCv;
  shared_ptr<std::thread> pingThread;
  bool pinging;
  uint64_t pongsReceived;
};
}  // namespace oc

#endif  // __OC_RELAY_CLIENT_CONNECTION__
