#include "BlockingMessageSocket.hpp"

namespace oc {
namespace {
// Anything above this is treated as WAIT_FOREVER to keep deadlines in range.
const int64_t MAX_FINITE_TIMEOUT_MS = 1000LL * 60 * 60 * 24 * 365;
}  // namespace

BlockingMessageSocket::BlockingMessageSocket(shared_ptr<MessageSocket> _socket,
                                             uint64_t _id,
                                             size_t _maxQueuedMessages)
    : socket(_socket),
      id(_id),
      maxQueuedMessages(_maxQueuedMessages),
      overflowed(false),
      waitDisabled(false),
      closed(false),
      released(false),
      defaultTimeoutMs(WAIT_FOREVER) {
  if (!socket) {
    throw UsageError("BlockingMessageSocket needs a socket");
  }
}

shared_ptr<BlockingMessageSocket> BlockingMessageSocket::create(
    shared_ptr<MessageSocket> socket, uint64_t id, size_t maxQueuedMessages) {
  shared_ptr<BlockingMessageSocket> blocking(
      new BlockingMessageSocket(socket, id, maxQueuedMessages));
  blocking->bindHandlers();
  return blocking;
}

void BlockingMessageSocket::bindHandlers() {
  std::weak_ptr<BlockingMessageSocket> weakThis = shared_from_this();
  handlerDisconnects.push_back(socket->onOpen.connect([weakThis]() {
    auto self = weakThis.lock();
    if (self) {
      self->handleOpen();
    }
  }));
  handlerDisconnects.push_back(
      socket->onMessage.connect([weakThis](const string& message) {
        auto self = weakThis.lock();
        if (self) {
          self->handleMessage(message);
        }
      }));
  handlerDisconnects.push_back(
      socket->onClose.connect([weakThis](const string& reason) {
        auto self = weakThis.lock();
        if (self) {
          self->handleClose(reason);
        }
      }));
  handlerDisconnects.push_back(
      socket->onError.connect([weakThis](const string& message) {
        auto self = weakThis.lock();
        if (self) {
          self->handleError(message);
        }
      }));
}

BlockingMessageSocket::~BlockingMessageSocket() { disconnectHandlers(); }

void BlockingMessageSocket::connect() {
  {
    lock_guard<std::mutex> guard(waitMutex);
    if (released) {
      throw UsageError("No socket is bound to this instance.");
    }
    throwIfShutdown();
  }
  VLOG(1) << "[" << id << "] connecting to " << socket->describe();
  socket->connect();
}

void BlockingMessageSocket::waitForOpen(int64_t timeoutMs) {
  std::unique_lock<std::mutex> lock(waitMutex);
  if (released) {
    throw UsageError("No socket is bound to this instance.");
  }
  if (openWaiter) {
    throw UsageError("Another call is already waiting for the socket to open.");
  }
  throwIfShutdown();
  if (socket->isOpen()) {
    return;
  }
  if (closed) {
    throw TransportError("Connection was closed: " + closeReason);
  }

  auto waiter = make_shared<Waiter>();
  openWaiter = waiter;
  waitUntilSettled(lock, waiter, resolveTimeout(timeoutMs, defaultTimeoutMs));
  openWaiter.reset();
  if (waiter->error) {
    std::rethrow_exception(waiter->error);
  }
}

void BlockingMessageSocket::send(const string& message) {
  {
    lock_guard<std::mutex> guard(waitMutex);
    if (released) {
      throw UsageError("No socket is bound to this instance.");
    }
    throwIfShutdown();
  }
  if (!socket->isOpen()) {
    lock_guard<std::mutex> guard(waitMutex);
    string error = "[" + to_string(id) + "] The socket is not open.";
    if (!firstError.empty()) {
      error += " First error: " + firstError + ".";
    }
    if (!lastError.empty() && lastError != firstError) {
      error += " Last error: " + lastError + ".";
    }
    throw TransportError(error);
  }
  VLOG(2) << "[" << id << "] send: " << message;
  socket->send(message);
}

void BlockingMessageSocket::sendJSON(const json& message) {
  send(message.dump());
}

string BlockingMessageSocket::waitForMessage(int64_t timeoutMs) {
  std::unique_lock<std::mutex> lock(waitMutex);
  if (released) {
    throw UsageError("No socket is bound to this instance.");
  }
  if (messageWaiter) {
    throw UsageError("Another call is already waiting for a message.");
  }
  if (waitDisabled) {
    throw UsageError("Waiting for incoming messages was disabled.");
  }
  if (overflowed) {
    throw TransportError("The incoming message data queue overflowed.");
  }
  if (!queue.empty()) {
    string message = std::move(queue.front());
    queue.pop_front();
    return message;
  }
  if (closed) {
    throw TransportError("Connection was closed: " + closeReason);
  }

  auto waiter = make_shared<Waiter>();
  messageWaiter = waiter;
  waitUntilSettled(lock, waiter, resolveTimeout(timeoutMs, defaultTimeoutMs));
  messageWaiter.reset();
  if (waiter->error) {
    std::rethrow_exception(waiter->error);
  }
  return waiter->message;
}

json BlockingMessageSocket::waitForJSONMessage(int64_t timeoutMs) {
  string message = waitForMessage(timeoutMs);
  json parsed = json::parse(message, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    throw ProtocolError("Received message is not a JSON object: " + message);
  }
  return parsed;
}

json BlockingMessageSocket::waitForJSONMessageWithType(const string& type,
                                                      const string& typeKey,
                                                      int64_t timeoutMs) {
  json message = waitForJSONMessage(timeoutMs);
  if (!hasStringField(message, typeKey.c_str())) {
    throw ProtocolError("Received message has no string field '" + typeKey +
                        "'");
  }
  string receivedType = message[typeKey].get<string>();
  if (receivedType != type) {
    throw ProtocolError("Received unexpected message '" + receivedType +
                        "', expected '" + type + "'");
  }
  return message;
}

void BlockingMessageSocket::close(const string& reason) {
  bool wasOpen = socket->isOpen();
  {
    lock_guard<std::mutex> guard(waitMutex);
    if (released) {
      return;
    }
    requestShutdown("Connection was closed: " + reason);
    if (!wasOpen && !closed) {
      // Nothing to wait for on the transport level
      closed = true;
      closeReason = reason;
      recordError("closed: " + reason);
      failAllWaiters(std::make_exception_ptr(TransportError(shutdownMessage)));
    }
  }
  VLOG(1) << "[" << id << "] close(" << reason << ")";
  socket->close(reason);
}

void BlockingMessageSocket::terminate(const string& reason) {
  {
    lock_guard<std::mutex> guard(waitMutex);
    if (released) {
      return;
    }
    requestShutdown("Connection terminated: " + reason);
    recordError("terminated: " + reason);
    failAllWaiters(std::make_exception_ptr(
        TransportError("Connection terminated: " + reason)));
    if (!closed) {
      closed = true;
      closeReason = "terminated: " + reason;
    }
  }
  LOG(INFO) << "[" << id << "] terminate(" << reason << ")";
  socket->terminate(reason);
}

void BlockingMessageSocket::setWaitForMessageDisabled(bool disabled) {
  lock_guard<std::mutex> guard(waitMutex);
  waitDisabled = disabled;
  if (disabled) {
    queue.clear();
    if (messageWaiter) {
      settleWithError(messageWaiter,
                      std::make_exception_ptr(UsageError(
                          "Waiting for incoming messages has been disabled.")));
    }
  }
}

bool BlockingMessageSocket::isWaitForMessageDisabled() {
  lock_guard<std::mutex> guard(waitMutex);
  return waitDisabled;
}

void BlockingMessageSocket::setDefaultTimeout(int64_t timeoutMs) {
  lock_guard<std::mutex> guard(waitMutex);
  defaultTimeoutMs = timeoutMs < 0 ? WAIT_FOREVER : timeoutMs;
}

int64_t BlockingMessageSocket::getDefaultTimeout() {
  lock_guard<std::mutex> guard(waitMutex);
  return defaultTimeoutMs;
}

shared_ptr<MessageSocket> BlockingMessageSocket::releaseSocket() {
  {
    lock_guard<std::mutex> guard(waitMutex);
    if (released) {
      throw UsageError("No socket is bound to this instance.");
    }
    released = true;
    failAllWaiters(std::make_exception_ptr(
        UsageError("The socket was released from this instance.")));
  }
  disconnectHandlers();
  return socket;
}

bool BlockingMessageSocket::isOpen() {
  {
    lock_guard<std::mutex> guard(waitMutex);
    if (released) {
      return false;
    }
  }
  return socket->isOpen();
}

bool BlockingMessageSocket::isClosed() {
  lock_guard<std::mutex> guard(waitMutex);
  return closed;
}

bool BlockingMessageSocket::hasOverflowed() {
  lock_guard<std::mutex> guard(waitMutex);
  return overflowed;
}

size_t BlockingMessageSocket::queuedMessageCount() {
  lock_guard<std::mutex> guard(waitMutex);
  return queue.size();
}

string BlockingMessageSocket::getFirstError() {
  lock_guard<std::mutex> guard(waitMutex);
  return firstError;
}

string BlockingMessageSocket::getLastError() {
  lock_guard<std::mutex> guard(waitMutex);
  return lastError;
}

string BlockingMessageSocket::describe() {
  return "[" + to_string(id) + "] " + socket->describe();
}

void BlockingMessageSocket::settle(const shared_ptr<Waiter>& waiter,
                                   const string& message) {
  if (!waiter || waiter->settled) {
    return;
  }
  waiter->settled = true;
  waiter->message = message;
  waitCv.notify_all();
}

void BlockingMessageSocket::settleWithError(const shared_ptr<Waiter>& waiter,
                                            std::exception_ptr error) {
  if (!waiter || waiter->settled) {
    return;
  }
  waiter->settled = true;
  waiter->error = error;
  waitCv.notify_all();
}

void BlockingMessageSocket::failAllWaiters(std::exception_ptr error) {
  settleWithError(openWaiter, error);
  settleWithError(messageWaiter, error);
}

void BlockingMessageSocket::recordError(const string& reason) {
  if (firstError.empty()) {
    firstError = reason;
  }
  lastError = reason;
}

void BlockingMessageSocket::requestShutdown(const string& message) {
  if (shutdownMessage.empty()) {
    shutdownMessage = message;
  }
}

void BlockingMessageSocket::throwIfShutdown() {
  if (!shutdownMessage.empty()) {
    throw TransportError("[" + to_string(id) + "] " + shutdownMessage);
  }
}

void BlockingMessageSocket::waitUntilSettled(std::unique_lock<std::mutex>& lock,
                                             const shared_ptr<Waiter>& waiter,
                                             int64_t timeoutMs) {
  if (timeoutMs >= MAX_FINITE_TIMEOUT_MS) {
    waitCv.wait(lock, [&waiter] { return waiter->settled; });
    return;
  }
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  if (!waitCv.wait_until(lock, deadline,
                         [&waiter] { return waiter->settled; })) {
    settleWithError(waiter,
                    std::make_exception_ptr(TimeoutError("Timeout expired")));
  }
}

void BlockingMessageSocket::handleOpen() {
  VLOG(1) << "[" << id << "] open";
  lock_guard<std::mutex> guard(waitMutex);
  settle(openWaiter, "");
}

void BlockingMessageSocket::handleMessage(const string& message) {
  VLOG(2) << "[" << id << "] received: " << message;
  onMessage.emit(message);

  lock_guard<std::mutex> guard(waitMutex);
  if (released || waitDisabled || overflowed) {
    return;
  }
  if (messageWaiter && !messageWaiter->settled && queue.empty()) {
    settle(messageWaiter, message);
    return;
  }
  if (queue.size() >= maxQueuedMessages) {
    overflowed = true;
    recordError("incoming message queue overflowed");
    LOG(ERROR) << "[" << id << "] more than " << maxQueuedMessages
               << " undrained messages, giving up on this socket";
    settleWithError(messageWaiter,
                    std::make_exception_ptr(TransportError(
                        "The incoming message data queue overflowed.")));
    return;
  }
  queue.push_back(message);
}

void BlockingMessageSocket::handleClose(const string& reason) {
  LOG(INFO) << "[" << id << "] closed: " << reason;
  lock_guard<std::mutex> guard(waitMutex);
  closed = true;
  closeReason = reason;
  recordError("closed: " + reason);
  failAllWaiters(
      std::make_exception_ptr(TransportError("Connection was closed: " + reason)));
}

void BlockingMessageSocket::handleError(const string& message) {
  LOG(WARNING) << "[" << id << "] error: " << message;
  lock_guard<std::mutex> guard(waitMutex);
  recordError(message);
  failAllWaiters(std::make_exception_ptr(TransportError(message)));
}

void BlockingMessageSocket::disconnectHandlers() {
  vector<std::function<void()>> disconnects;
  {
    lock_guard<std::mutex> guard(waitMutex);
    disconnects.swap(handlerDisconnects);
  }
  for (auto& disconnect : disconnects) {
    disconnect();
  }
}
}  // namespace oc
