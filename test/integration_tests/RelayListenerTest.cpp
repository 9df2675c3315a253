#include "RelayListener.hpp"

#include "CryptoHandler.hpp"
#include "FakeRelayServer.hpp"
#include "TestHeaders.hpp"

namespace oc {
namespace {
const char* const RELAY_URL = "ws://relay.test:8000";

struct StateChange {
  ListenerState newState;
  ListenerState oldState;
  string reason;
};

/**
 * @brief A listener wired to a FakeRelayServer with an instance key pair.
 * The relay is declared first so the listener goes away before it.
 */
class ListenerFixture {
 public:
  typedef std::function<shared_ptr<MessageSocket>(shared_ptr<MessageSocket>)>
      SocketWrapper;

  ListenerFixture(size_t spareConnections, int64_t reconnectTimeoutMs,
                  int64_t pingIntervalMs = 60000, int64_t pongTimeoutMs = 2000,
                  SocketWrapper wrapSocket = nullptr)
      : relay(pingIntervalMs),
        crypto(make_shared<CryptoHandler>(
            CryptoHandler::generateKeyPair().second)) {
    RelayListenerConfig config;
    config.spareConnectionLimit = spareConnections;
    config.reconnectTimeoutMs = reconnectTimeoutMs;
    config.pongTimeoutMs = pongTimeoutMs;
    config.requestTimeoutMs = 5000;
    MessageSocketFactory factory = relay.socketFactory();
    if (wrapSocket) {
      auto relayFactory = factory;
      factory = [relayFactory, wrapSocket](const string& url) {
        return wrapSocket(relayFactory(url));
      };
    }
    listener.reset(new RelayListener(
        config, make_shared<ConnectionIdRegistry>(), factory));
    listener->onStateChange.connect([this](ListenerState newState,
                                           ListenerState oldState,
                                           const string& reason) {
      lock_guard<std::mutex> guard(recordMutex);
      stateChanges.push_back({newState, oldState, reason});
    });
  }

  ~ListenerFixture() { listener.reset(); }

  void useCrypto() {
    auto instanceCrypto = crypto;
    listener->setCrypto(
        [instanceCrypto](const string& peer, const string& data) {
          return instanceCrypto->encrypt(peer, data);
        },
        [instanceCrypto](const string& peer, const string& data) {
          return instanceCrypto->decrypt(peer, data);
        });
  }

  void start() { listener->start(RELAY_URL, crypto->getPublicKey()); }

  bool waitForSpares(size_t count) {
    return waitUntil([this, count]() {
      return listener->spareConnectionCount() == count;
    });
  }

  vector<StateChange> getStateChanges() {
    lock_guard<std::mutex> guard(recordMutex);
    return stateChanges;
  }

  FakeRelayServer relay;
  shared_ptr<CryptoHandler> crypto;
  unique_ptr<RelayListener> listener;
  std::mutex recordMutex;
  vector<StateChange> stateChanges;
};

/** @brief Holds connect() calls until release() is called. */
class ConnectGate {
 public:
  ConnectGate() : released(false), waiting(0) {}

  void wait() {
    std::unique_lock<std::mutex> lock(mutex);
    waiting++;
    cv.wait(lock, [this]() { return released; });
  }

  void release() {
    lock_guard<std::mutex> guard(mutex);
    released = true;
    cv.notify_all();
  }

  int waitingCount() {
    lock_guard<std::mutex> guard(mutex);
    return waiting;
  }

 private:
  std::mutex mutex;
  std::condition_variable cv;
  bool released;
  int waiting;
};

/**
 * @brief A transport whose connect() blocks on a gate and which drops close()
 * and terminate() until it was connected.  A connect() that runs after such
 * a shutdown still opens the inner socket.  With @p ignoreClose the peer
 * never learns about a graceful close either.
 */
class GatedSocket : public MessageSocket,
                    public std::enable_shared_from_this<GatedSocket> {
 public:
  static shared_ptr<GatedSocket> create(shared_ptr<MessageSocket> inner,
                                        shared_ptr<ConnectGate> gate,
                                        bool ignoreClose = false) {
    shared_ptr<GatedSocket> socket(new GatedSocket(inner, gate, ignoreClose));
    std::weak_ptr<GatedSocket> weakSocket = socket;
    socket->innerDisconnects.push_back(inner->onOpen.connect([weakSocket]() {
      auto self = weakSocket.lock();
      if (self) {
        self->onOpen.emit();
      }
    }));
    socket->innerDisconnects.push_back(
        inner->onMessage.connect([weakSocket](const string& message) {
          auto self = weakSocket.lock();
          if (self) {
            self->onMessage.emit(message);
          }
        }));
    socket->innerDisconnects.push_back(
        inner->onClose.connect([weakSocket](const string& reason) {
          auto self = weakSocket.lock();
          if (self) {
            self->onClose.emit(reason);
          }
        }));
    socket->innerDisconnects.push_back(
        inner->onError.connect([weakSocket](const string& message) {
          auto self = weakSocket.lock();
          if (self) {
            self->onError.emit(message);
          }
        }));
    return socket;
  }

  virtual ~GatedSocket() {
    for (auto& disconnect : innerDisconnects) {
      disconnect();
    }
  }

  virtual void connect() {
    gate->wait();
    {
      lock_guard<std::mutex> guard(mutex);
      connected = true;
    }
    inner->connect();
  }

  virtual bool isOpen() { return inner->isOpen(); }
  virtual void send(const string& message) { inner->send(message); }

  virtual void close(const string& reason) {
    if (ignoreClose || dropBeforeConnect()) {
      return;
    }
    inner->close(reason);
  }

  virtual void terminate(const string& reason) {
    if (dropBeforeConnect()) {
      return;
    }
    inner->terminate(reason);
  }

  virtual string describe() { return "gated " + inner->describe(); }

  int getDroppedShutdowns() {
    lock_guard<std::mutex> guard(mutex);
    return droppedShutdowns;
  }

 protected:
  GatedSocket(shared_ptr<MessageSocket> _inner, shared_ptr<ConnectGate> _gate,
              bool _ignoreClose)
      : inner(_inner),
        gate(_gate),
        ignoreClose(_ignoreClose),
        connected(false),
        droppedShutdowns(0) {}

  bool dropBeforeConnect() {
    lock_guard<std::mutex> guard(mutex);
    if (connected) {
      return false;
    }
    droppedShutdowns++;
    return true;
  }

  shared_ptr<MessageSocket> inner;
  shared_ptr<ConnectGate> gate;
  bool ignoreClose;
  vector<std::function<void()>> innerDisconnects;
  std::mutex mutex;
  bool connected;
  int droppedShutdowns;
};
}  // namespace

TEST_CASE("RelayListener fills the spare pool", "[RelayListener]") {
  ListenerFixture fixture(2, 200);
  fixture.useCrypto();
  REQUIRE(fixture.listener->getState() == ListenerState::NOT_LISTENING);

  fixture.start();
  REQUIRE(fixture.waitForSpares(2));
  REQUIRE(fixture.listener->getState() == ListenerState::LISTENING);
  REQUIRE(fixture.listener->inflightConnectionCount() == 0);
  REQUIRE_FALSE(fixture.listener->hasPendingRetry());

  REQUIRE(fixture.relay.connectionCount() == 2);
  REQUIRE(waitUntil([&fixture]() {
    return fixture.relay.authenticatedCount() == 2;
  }));
  for (auto& session : fixture.relay.getSessions()) {
    REQUIRE(session->registeredKey == fixture.crypto->getPublicKey());
  }
  for (auto& url : fixture.relay.getUrls()) {
    REQUIRE(url == RELAY_URL);
  }

  auto changes = fixture.getStateChanges();
  REQUIRE(changes.size() == 2);
  REQUIRE(changes[0].oldState == ListenerState::NOT_LISTENING);
  REQUIRE(changes[0].newState == ListenerState::CONNECTING);
  REQUIRE(changes[1].newState == ListenerState::LISTENING);

  REQUIRE_THROWS_AS(fixture.start(), UsageError);
  REQUIRE_THROWS_AS(fixture.useCrypto(), UsageError);
}

TEST_CASE("RelayListener retries a failed handshake after a delay",
          "[RelayListener]") {
  ListenerFixture fixture(2, 500);
  fixture.useCrypto();
  fixture.relay.queueBehavior(FakeRelayServer::Behavior::ACCEPT);
  fixture.relay.queueBehavior(FakeRelayServer::Behavior::WRONG_COMMAND);

  auto started = std::chrono::steady_clock::now();
  fixture.start();
  REQUIRE(waitUntil([&fixture]() {
    return fixture.listener->hasPendingRetry();
  }));
  REQUIRE(fixture.listener->spareConnectionCount() == 1);
  REQUIRE(fixture.listener->getState() == ListenerState::LISTENING);

  auto failed = fixture.relay.getSession(1);
  REQUIRE(waitUntil([&failed]() { return failed->clientSocket->wasClosed(); }));
  REQUIRE(failed->clientSocket->getCloseReason() ==
          "Received data does not match the data expected for command "
          "'authentication_request'");

  REQUIRE(fixture.waitForSpares(2));
  REQUIRE(std::chrono::steady_clock::now() - started >=
          std::chrono::milliseconds(500));
  REQUIRE(fixture.relay.connectionCount() == 3);
  REQUIRE(fixture.listener->getState() == ListenerState::LISTENING);
  REQUIRE_FALSE(fixture.listener->hasPendingRetry());
}

TEST_CASE("RelayListener stop closes spares and cancels the retry",
          "[RelayListener]") {
  ListenerFixture fixture(3, 500);
  fixture.useCrypto();
  fixture.relay.queueBehavior(FakeRelayServer::Behavior::ACCEPT);
  fixture.relay.queueBehavior(FakeRelayServer::Behavior::ACCEPT);
  fixture.relay.queueBehavior(FakeRelayServer::Behavior::REFUSE);

  fixture.start();
  REQUIRE(waitUntil([&fixture]() {
    return fixture.listener->spareConnectionCount() == 2 &&
           fixture.listener->hasPendingRetry();
  }));

  fixture.listener->stop();
  REQUIRE(fixture.listener->getState() == ListenerState::NOT_LISTENING);
  REQUIRE(fixture.listener->spareConnectionCount() == 0);
  REQUIRE_FALSE(fixture.listener->hasPendingRetry());
  for (int i = 0; i < 2; i++) {
    auto session = fixture.relay.getSession(i);
    REQUIRE(session->serverSocket->wasClosed());
    REQUIRE_FALSE(session->clientSocket->wasTerminated());
  }

  auto changes = fixture.getStateChanges();
  REQUIRE(changes.back().newState == ListenerState::NOT_LISTENING);
  REQUIRE(changes.back().reason == "Listener stopped");

  std::this_thread::sleep_for(std::chrono::milliseconds(800));
  REQUIRE(fixture.relay.connectionCount() == 3);
  REQUIRE(fixture.listener->getState() == ListenerState::NOT_LISTENING);

  // The listener can be started again
  fixture.start();
  REQUIRE(fixture.waitForSpares(3));
}

TEST_CASE("RelayListener hands over connections", "[RelayListener]") {
  ListenerFixture fixture(1, 200);
  fixture.useCrypto();

  std::mutex receivedMutex;
  vector<shared_ptr<BlockingMessageSocket>> received;
  fixture.listener->onConnection.connect(
      [&](shared_ptr<BlockingMessageSocket> socket) {
        lock_guard<std::mutex> guard(receivedMutex);
        received.push_back(socket);
      });

  fixture.start();
  REQUIRE(fixture.waitForSpares(1));
  REQUIRE(waitUntil([&fixture]() {
    return fixture.relay.authenticatedCount() == 1;
  }));

  fixture.relay.handOver(0);
  REQUIRE(waitUntil([&]() {
    lock_guard<std::mutex> guard(receivedMutex);
    return received.size() == 1;
  }));

  // The delivered socket is the one the relay handed over
  shared_ptr<BlockingMessageSocket> socket;
  {
    lock_guard<std::mutex> guard(receivedMutex);
    socket = received[0];
  }
  REQUIRE(socket->isOpen());
  fixture.relay.getSession(0)->blockingSocket->send("hello from the peer");
  REQUIRE(socket->waitForMessage(1000) == "hello from the peer");
  socket->send("hello back");
  auto sent = fixture.relay.getSession(0)->clientSocket->getSentMessages();
  REQUIRE(sent.back() == "hello back");

  // A replacement refills the pool
  REQUIRE(waitUntil([&fixture]() {
    return fixture.relay.connectionCount() == 2 &&
           fixture.listener->spareConnectionCount() == 1;
  }));
  REQUIRE(fixture.listener->getState() == ListenerState::LISTENING);

  // Stopping leaves handed over connections alone
  fixture.listener->stop();
  REQUIRE(socket->isOpen());
  REQUIRE(fixture.relay.getSession(1)->serverSocket->wasClosed());
}

TEST_CASE("RelayListener closes connections nobody accepts",
          "[RelayListener]") {
  ListenerFixture fixture(1, 200);
  fixture.useCrypto();
  fixture.start();
  REQUIRE(fixture.waitForSpares(1));
  REQUIRE(waitUntil([&fixture]() {
    return fixture.relay.authenticatedCount() == 1;
  }));

  fixture.relay.handOver(0);
  auto session = fixture.relay.getSession(0);
  REQUIRE(waitUntil([&session]() { return session->serverSocket->wasClosed(); }));
  REQUIRE(session->serverSocket->getCloseReason() == "No connection handler");
}

TEST_CASE("RelayListener asks onChallenge without crypto functions",
          "[RelayListener]") {
  ListenerFixture fixture(1, 200);
  std::atomic<int> challenges(0);
  auto crypto = fixture.crypto;
  fixture.listener->onChallenge.connect(
      [crypto, &challenges](const string& challenge, const string& serverKey) {
        challenges++;
        string plain = crypto->decrypt(serverKey, challenge);
        return crypto->encrypt(serverKey, RelayProtocol::invertBytes(plain));
      });

  fixture.start();
  REQUIRE(fixture.waitForSpares(1));
  REQUIRE(challenges == 1);
}

TEST_CASE("RelayListener keeps retrying without a challenge handler",
          "[RelayListener]") {
  ListenerFixture fixture(1, 50);
  fixture.start();
  REQUIRE(waitUntil([&fixture]() {
    return fixture.relay.connectionCount() >= 3;
  }));
  REQUIRE(fixture.listener->spareConnectionCount() == 0);
  REQUIRE(fixture.listener->getState() == ListenerState::CONNECTING);
  REQUIRE(fixture.relay.getSession(0)->clientSocket->getCloseReason() ==
          "Nobody is listening for this event.");
}

TEST_CASE("RelayListener replaces a spare that stops answering pings",
          "[RelayListener]") {
  ListenerFixture fixture(1, 100, 50, 100);
  fixture.useCrypto();
  fixture.relay.queueBehavior(FakeRelayServer::Behavior::IGNORE_PINGS);

  fixture.start();
  auto first = [&fixture]() { return fixture.relay.getSession(0); };
  REQUIRE(waitUntil([&fixture]() {
    return fixture.relay.connectionCount() >= 1;
  }));
  REQUIRE(waitUntil([&first]() {
    return first()->clientSocket->wasTerminated();
  }));
  REQUIRE(first()->clientSocket->getCloseReason() ==
          "Ping: Connection timed out");

  REQUIRE(waitUntil([&fixture]() {
    return fixture.relay.connectionCount() >= 2 &&
           fixture.listener->spareConnectionCount() == 1;
  }));

  bool sawReconnect = false;
  for (auto& change : fixture.getStateChanges()) {
    if (change.oldState == ListenerState::LISTENING &&
        change.newState == ListenerState::CONNECTING) {
      sawReconnect = true;
    }
  }
  REQUIRE(sawReconnect);
}

TEST_CASE("RelayListener can be stopped from its own events",
          "[RelayListener]") {
  ListenerFixture fixture(2, 200);
  fixture.useCrypto();
  RelayListener* listener = fixture.listener.get();
  fixture.listener->onStateChange.connect(
      [listener](ListenerState newState, ListenerState, const string&) {
        if (newState == ListenerState::LISTENING) {
          listener->stop();
        }
      });

  fixture.start();
  REQUIRE(waitUntil([&fixture]() {
    auto changes = fixture.getStateChanges();
    return !changes.empty() &&
           changes.back().newState == ListenerState::NOT_LISTENING;
  }));
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  REQUIRE(fixture.listener->getState() == ListenerState::NOT_LISTENING);
  REQUIRE(fixture.listener->spareConnectionCount() == 0);
  REQUIRE(fixture.listener->inflightConnectionCount() == 0);
  REQUIRE_FALSE(fixture.listener->hasPendingRetry());
}

TEST_CASE("RelayListener ids come from the shared registry",
          "[RelayListener]") {
  auto registry = make_shared<ConnectionIdRegistry>();
  FakeRelayServer relay;
  auto crypto =
      make_shared<CryptoHandler>(CryptoHandler::generateKeyPair().second);
  RelayListenerConfig config;
  config.spareConnectionLimit = 2;

  std::mutex idsMutex;
  set<uint64_t> ids;
  vector<unique_ptr<RelayListener>> listeners;
  for (int i = 0; i < 2; i++) {
    listeners.emplace_back(
        new RelayListener(config, registry, relay.socketFactory()));
    listeners.back()->onChallenge.connect(
        [crypto](const string& challenge, const string& serverKey) {
          string plain = crypto->decrypt(serverKey, challenge);
          return crypto->encrypt(serverKey, RelayProtocol::invertBytes(plain));
        });
    listeners.back()->onConnection.connect(
        [&](shared_ptr<BlockingMessageSocket> socket) {
          lock_guard<std::mutex> guard(idsMutex);
          ids.insert(socket->getId());
        });
    listeners.back()->start(RELAY_URL, crypto->getPublicKey());
  }
  REQUIRE(waitUntil([&relay]() { return relay.authenticatedCount() == 4; }));
  for (size_t i = 0; i < 4; i++) {
    relay.handOver(i);
  }
  REQUIRE(waitUntil([&]() {
    lock_guard<std::mutex> guard(idsMutex);
    return ids.size() == 4;
  }));
  // Nothing else was allocated before the first four spares were up
  REQUIRE(*ids.begin() == 1);
  REQUIRE(*ids.rbegin() == 4);
  listeners.clear();
}

TEST_CASE("RelayListener leaves nothing registered when stopped mid connect",
          "[RelayListener]") {
  auto gate = make_shared<ConnectGate>();
  std::mutex gatedMutex;
  vector<shared_ptr<GatedSocket>> gatedSockets;
  {
    ListenerFixture fixture(
        1, 60000, 60000, 2000,
        [gate, &gatedMutex, &gatedSockets](shared_ptr<MessageSocket> inner) {
          auto gated = GatedSocket::create(inner, gate);
          lock_guard<std::mutex> guard(gatedMutex);
          gatedSockets.push_back(gated);
          return shared_ptr<MessageSocket>(gated);
        });
    fixture.useCrypto();
    fixture.start();
    REQUIRE(waitUntil([&gate]() { return gate->waitingCount() == 1; }));
    REQUIRE(fixture.listener->inflightConnectionCount() == 1);

    fixture.listener->stop();
    REQUIRE(fixture.listener->getState() == ListenerState::NOT_LISTENING);
    gate->release();

    // The transport opens after the stop and is shut right away
    auto session = fixture.relay.getSession(0);
    REQUIRE(waitUntil([&session]() {
      return session->finished && session->clientSocket->wasClosed();
    }));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    REQUIRE(session->clientSocket->getSentMessages().empty());
    REQUIRE(session->registeredKey.empty());
    REQUIRE_FALSE(session->authenticated);
    REQUIRE(fixture.relay.connectionCount() == 1);
    REQUIRE(fixture.relay.authenticatedCount() == 0);
    REQUIRE(fixture.listener->getState() == ListenerState::NOT_LISTENING);
    REQUIRE(fixture.listener->spareConnectionCount() == 0);
    REQUIRE(fixture.listener->inflightConnectionCount() == 0);
    REQUIRE_FALSE(fixture.listener->hasPendingRetry());
    {
      lock_guard<std::mutex> guard(gatedMutex);
      REQUIRE(gatedSockets.size() == 1);
      REQUIRE(gatedSockets[0]->getDroppedShutdowns() >= 1);
    }
  }
}
TEST_CASE("RelayListener destruction does not wait for unanswered closes",
          "[RelayListener]") {
  auto gate = make_shared<ConnectGate>();
  gate->release();
  ListenerFixture fixture(
      1, 60000, 60000, 2000, [gate](shared_ptr<MessageSocket> inner) {
        return shared_ptr<MessageSocket>(GatedSocket::create(inner, gate, true));
      });
  fixture.useCrypto();
  fixture.start();
  REQUIRE(fixture.waitForSpares(1));
  auto session = fixture.relay.getSession(0);

  // The spare is retired but its close is never acknowledged
  fixture.listener->stop();
  REQUIRE(fixture.listener->spareConnectionCount() == 0);
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  REQUIRE_FALSE(session->clientSocket->wasClosed());

  auto started = std::chrono::steady_clock::now();
  fixture.listener.reset();
  REQUIRE(std::chrono::steady_clock::now() - started <
          std::chrono::seconds(2));
  REQUIRE(session->clientSocket->wasTerminated());
}
}  // namespace oc
