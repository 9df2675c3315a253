#ifndef __OC_BLOCKING_MESSAGE_SOCKET__
#define __OC_BLOCKING_MESSAGE_SOCKET__

#include "Errors.hpp"
#include "Event.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "MessageSocket.hpp"

namespace oc {
/**
 * @brief Turns the event driven MessageSocket into blocking calls.
 *
 * Incoming messages are queued until somebody calls waitForMessage().  The
 * queue is bounded: once more than maxQueuedMessages are left undrained the
 * socket is marked as overflowed and every further wait fails.  Only one
 * thread may wait for the socket to open and only one may wait for a message
 * at any time.
 *
 * Every wait is settled exactly once: by data, by the socket closing or
 * failing, by terminate(), or by its timeout.  Once close() or terminate()
 * was called the wrapper never opens or sends again, even if the transport
 * has not reported anything yet.
 *
 * Instances are always owned by a shared_ptr (see create()).  The transport
 * handlers only hold a weak reference and keep the wrapper alive while they
 * run.
 */
class BlockingMessageSocket
    : public std::enable_shared_from_this<BlockingMessageSocket> {
 public:
  static shared_ptr<BlockingMessageSocket> create(
      shared_ptr<MessageSocket> socket, uint64_t id,
      size_t maxQueuedMessages = DEFAULT_MAX_QUEUED_MESSAGES);
  ~BlockingMessageSocket();

  BlockingMessageSocket(const BlockingMessageSocket&) = delete;
  BlockingMessageSocket& operator=(const BlockingMessageSocket&) = delete;

  inline uint64_t getId() const { return id; }

  /**
   * @brief Starts opening the underlying socket.
   * @throws TransportError after close() or terminate()
   */
  void connect();

  /**
   * @brief Blocks until the socket is open.
   * @throws TimeoutError, TransportError, UsageError
   */
  void waitForOpen(int64_t timeoutMs = USE_DEFAULT_TIMEOUT);

  /**
   * @throws TransportError if the socket is not open.  The message includes
   * the first and last close or error reason seen.
   */
  void send(const string& message);

  void sendJSON(const json& message);

  /**
   * @brief Returns the oldest queued message or waits for the next one.
   * @throws TimeoutError, TransportError, UsageError
   */
  string waitForMessage(int64_t timeoutMs = USE_DEFAULT_TIMEOUT);

  /**
   * @brief waitForMessage() parsed as JSON.
   * @throws ProtocolError if the message is not a JSON object.
   */
  json waitForJSONMessage(int64_t timeoutMs = USE_DEFAULT_TIMEOUT);

  /**
   * @brief waitForJSONMessage() that also checks msg[typeKey] == type.
   * @throws ProtocolError on a missing or different discriminator.
   */
  json waitForJSONMessageWithType(const string& type,
                                  const string& typeKey = "type",
                                  int64_t timeoutMs = USE_DEFAULT_TIMEOUT);

  /**
   * @brief Graceful close, waits for the peer on the transport level.  A
   * socket that is not open yet is treated as closed right away.
   */
  void close(const string& reason = "");

  /**
   * @brief Fails all pending waits right away, then drops the transport.
   */
  void terminate(const string& reason = "");

  /**
   * @brief Switches to push mode.  A pending wait fails at once and new
   * messages are only delivered through onMessage.
   */
  void setWaitForMessageDisabled(bool disabled);
  bool isWaitForMessageDisabled();

  void setDefaultTimeout(int64_t timeoutMs);
  int64_t getDefaultTimeout();

  /**
   * @brief Detaches from the underlying socket and returns it.  Pending waits
   * fail and this wrapper is unusable afterwards.
   */
  shared_ptr<MessageSocket> releaseSocket();

  bool isOpen();
  bool isClosed();
  bool hasOverflowed();
  size_t queuedMessageCount();
  string getFirstError();
  string getLastError();
  string describe();

  /** @brief Fires for every incoming message, before it is queued. */
  Event<void(const string&)> onMessage;

 protected:
  BlockingMessageSocket(shared_ptr<MessageSocket> _socket, uint64_t _id,
                        size_t _maxQueuedMessages);
  void bindHandlers();

  struct Waiter {
    bool settled = false;
    string message;
    std::exception_ptr error;
  };

  // The following must hold waitMutex
  void settle(const shared_ptr<Waiter>& waiter, const string& message);
  void settleWithError(const shared_ptr<Waiter>& waiter,
                       std::exception_ptr error);
  void failAllWaiters(std::exception_ptr error);
  void recordError(const string& reason);
  void requestShutdown(const string& message);
  void throwIfShutdown();
  void waitUntilSettled(std::unique_lock<std::mutex>& lock,
                        const shared_ptr<Waiter>& waiter, int64_t timeoutMs);

  void handleOpen();
  void handleMessage(const string& message);
  void handleClose(const string& reason);
  void handleError(const string& message);
  void disconnectHandlers();

  shared_ptr<MessageSocket> socket;
  uint64_t id;
  size_t maxQueuedMessages;
  vector<std::function<void()>> handlerDisconnects;

  std::mutex waitMutex;
  std::condition_variable waitCv;
  std::deque<string> queue;
  shared_ptr<Waiter> openWaiter;
  shared_ptr<Waiter> messageWaiter;
  bool overflowed;
  bool waitDisabled;
  bool closed;
  bool released;
  // Set by close() / terminate(), holds the error later calls fail with
  string shutdownMessage;
  string closeReason;
  string firstError;
  string lastError;
  int64_t defaultTimeoutMs;
};
}  // namespace oc

#endif  // __OC_BLOCKING_MESSAGE_SOCKET__
