#include "RelayClientConnection.hpp"

namespace oc {
RelayClientConnection::RelayClientConnection(
    shared_ptr<BlockingMessageSocket> _socket)
    : socket(_socket),
      id(_socket->getId()),
      workerRunning(false),
      handoverRunning(false),
      pinging(false),
      pongsReceived(0) {
  messageDisconnect = socket->onMessage.connect(
      [this](const string& message) { handleIncoming(message); });
}

RelayClientConnection::~RelayClientConnection() {
  stopPingPong();
  // The worker may still start the hand-over thread, so it goes first.
  shared_ptr<std::thread> thread;
  {
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    thread = workerThread;
    workerThread.reset();
  }
  joinThread(thread);
  {
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    thread = handoverThread;
    handoverThread.reset();
  }
  joinThread(thread);
  stopPingPong();
  messageDisconnect();
}

void RelayClientConnection::setRequestTimeout(int64_t timeoutMs) {
  socket->setDefaultTimeout(timeoutMs);
}

int64_t RelayClientConnection::getRequestTimeout() {
  return socket->getDefaultTimeout();
}

void RelayClientConnection::sendRegisterMessage(const string& publicKey) {
  send(RelayProtocol::makeRegister(publicKey));
}

void RelayClientConnection::sendAuthenticationResponseMessage(
    const string& response) {
  send(RelayProtocol::makeAuthenticationResponse(response));
}

void RelayClientConnection::sendPingMessage() {
  send(RelayProtocol::makePing());
}

void RelayClientConnection::sendPongMessage() {
  send(RelayProtocol::makePong());
}

json RelayClientConnection::waitForMessage(const string& command,
                                           int64_t timeoutMs) {
  int64_t resolvedTimeout = resolveTimeout(timeoutMs, getRequestTimeout());
  bool finite = resolvedTimeout != WAIT_FOREVER;
  auto deadline = std::chrono::steady_clock::now();
  if (finite) {
    deadline += std::chrono::milliseconds(resolvedTimeout);
  }

  while (true) {
    int64_t remaining = WAIT_FOREVER;
    if (finite) {
      remaining = std::max<int64_t>(
          0, std::chrono::duration_cast<std::chrono::milliseconds>(
                 deadline - std::chrono::steady_clock::now())
                 .count());
    }
    json message = socket->waitForJSONMessage(remaining);
    string received = RelayProtocol::getCommand(message);
    if (received != command && RelayProtocol::isKeepAlive(received)) {
      if (received == RelayCommand::PING) {
        VLOG(2) << "[" << id << "] answering server ping";
        sendPongMessage();
      }
      continue;
    }
    if (!RelayProtocol::isServerMessage(message, command)) {
      RelayProtocol::throwMismatch(command);
    }
    return message;
  }
}

void RelayClientConnection::startPingPong(int64_t pingIntervalMs,
                                          int64_t pongTimeoutMs,
                                          int missedPongLimit) {
  lock_guard<std::mutex> guard(pingMutex);
  if (pinging || pingThread) {
    throw UsageError("Already ping / ponging");
  }
  LOG(INFO) << "[" << id << "] startPingPong(" << pingIntervalMs << ", "
            << pongTimeoutMs << ")";
  pinging = true;
  pingThread.reset(new std::thread(&RelayClientConnection::pingLoop, this,
                                   pingIntervalMs, pongTimeoutMs,
                                   std::max(missedPongLimit, 1)));
}

void RelayClientConnection::stopPingPong() {
  shared_ptr<std::thread> thread;
  {
    lock_guard<std::mutex> guard(pingMutex);
    pinging = false;
    pingCv.notify_all();
    thread = pingThread;
    pingThread.reset();
  }
  if (thread) {
    VLOG(1) << "[" << id << "] stopPingPong()";
    joinThread(thread);
  }
}

bool RelayClientConnection::isPinging() {
  lock_guard<std::mutex> guard(pingMutex);
  return pinging;
}

void RelayClientConnection::close(const string& reason) {
  socket->close(reason);
}

void RelayClientConnection::terminate(const string& reason) {
  socket->terminate(reason);
}

void RelayClientConnection::runInBackground(std::function<void()> task) {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  if (workerRunning) {
    throw UsageError("A background task is already running on connection " +
                     to_string(id));
  }
  joinThread(workerThread);
  workerRunning = true;
  workerThread.reset(new std::thread([this, task]() {
    el::Helpers::setThreadName("conn-" + to_string(id));
    try {
      task();
    } catch (const std::exception& e) {
      STERROR << "[" << id << "] background task leaked an exception: "
              << e.what();
    }
    workerRunning = false;
  }));
}

void RelayClientConnection::waitForHandoverInBackground(
    std::function<void(std::exception_ptr)> callback) {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  if (handoverRunning) {
    throw UsageError("Already waiting for a hand-over on connection " +
                     to_string(id));
  }
  joinThread(handoverThread);
  handoverRunning = true;
  handoverThread.reset(new std::thread([this, callback]() {
    el::Helpers::setThreadName("handover-" + to_string(id));
    std::exception_ptr error;
    try {
      waitForMessage(RelayCommand::CONNECTION_HANDOVER, WAIT_FOREVER);
      LOG(INFO) << "[" << id << "] connection handed over";
    } catch (const std::exception& e) {
      LOG(INFO) << "[" << id << "] waiting for hand-over failed: " << e.what();
      error = std::current_exception();
    }
    stopPingPong();
    callback(error);
    handoverRunning = false;
  }));
}

bool RelayClientConnection::hasRunningTasks() {
  return workerRunning || handoverRunning;
}

void RelayClientConnection::pingLoop(int64_t pingIntervalMs,
                                     int64_t pongTimeoutMs,
                                     int missedPongLimit) {
  el::Helpers::setThreadName("ping-" + to_string(id));
  std::unique_lock<std::mutex> lock(pingMutex);
  int missedPongs = 0;
  while (pinging) {
    if (pingCv.wait_for(lock, std::chrono::milliseconds(pingIntervalMs),
                        [this] { return !pinging; })) {
      break;
    }

    uint64_t pongsBefore = pongsReceived;
    lock.unlock();
    try {
      sendPingMessage();
    } catch (const std::exception& e) {
      LOG(INFO) << "[" << id << "] sending ping failed: " << e.what();
      lock.lock();
      pinging = false;
      break;
    }
    lock.lock();

    bool answered = pingCv.wait_for(
        lock, std::chrono::milliseconds(pongTimeoutMs),
        [this, pongsBefore] { return !pinging || pongsReceived > pongsBefore; });
    if (!pinging) {
      break;
    }
    if (answered) {
      missedPongs = 0;
      continue;
    }
    missedPongs++;
    LOG(WARNING) << "[" << id << "] no pong within " << pongTimeoutMs
                 << "ms (" << missedPongs << "/" << missedPongLimit << ")";
    if (missedPongs >= missedPongLimit) {
      pinging = false;
      lock.unlock();
      socket->terminate("Ping: Connection timed out");
      lock.lock();
      break;
    }
  }
}

void RelayClientConnection::handleIncoming(const string& message) {
  if (message.find(RelayCommand::PONG) == string::npos) {
    return;
  }
  json parsed = json::parse(message, nullptr, false);
  if (parsed.is_discarded() ||
      !RelayProtocol::isServerMessage(parsed, RelayCommand::PONG)) {
    return;
  }
  lock_guard<std::mutex> guard(pingMutex);
  pongsReceived++;
  pingCv.notify_all();
}

void RelayClientConnection::send(const json& message) {
  if (!socket->isOpen()) {
    socket->waitForOpen();
  }
  socket->sendJSON(message);
}

void RelayClientConnection::joinThread(shared_ptr<std::thread>& thread) {
  if (!thread) {
    return;
  }
  if (thread->get_id() == std::this_thread::get_id()) {
    thread->detach();
  } else if (thread->joinable()) {
    thread->join();
  }
  thread.reset();
}
}  // namespace oc
