#include "RelayClientConnection.hpp"

#include "CryptoHandler.hpp"
#include "FakeMessageSocket.hpp"
#include "RelayListener.hpp"
#include "RelayServerConnection.hpp"
#include "TestHeaders.hpp"

using namespace oc;

namespace {
struct ConnectionFixture {
  ConnectionFixture() {
    auto sockets = FakeMessageSocket::createPair();
    clientSocket = sockets.first;
    serverSocket = sockets.second;
    client = make_shared<RelayClientConnection>(
        BlockingMessageSocket::create(clientSocket, 7));
    server = make_shared<RelayServerConnection>(
        BlockingMessageSocket::create(serverSocket, 8));
  }

  void open() {
    client->getSocket()->connect();
    client->getSocket()->waitForOpen(1000);
  }

  size_t sentCount(const string& command) {
    size_t count = 0;
    for (auto& message : clientSocket->getSentMessages()) {
      if (json::parse(message)["command"] == command) {
        count++;
      }
    }
    return count;
  }

  shared_ptr<FakeMessageSocket> clientSocket;
  shared_ptr<FakeMessageSocket> serverSocket;
  shared_ptr<RelayServerConnection> server;
  shared_ptr<RelayClientConnection> client;
};
}  // namespace

TEST_CASE("RelayClientConnection handshake", "[RelayClientConnection]") {
  ConnectionFixture fixture;
  CryptoHandler serverCrypto(CryptoHandler::generateKeyPair().second);
  auto clientCrypto =
      make_shared<CryptoHandler>(CryptoHandler::generateKeyPair().second);

  string registeredKey;
  std::thread relay([&]() {
    registeredKey = fixture.server->authenticate(serverCrypto, 60000, 5000);
    fixture.server->serveKeepAlive();
  });

  HandshakeSettings settings;
  settings.publicKey = clientCrypto->getPublicKey();
  settings.requestTimeoutMs = 5000;
  settings.answerChallenge = [clientCrypto](const string& challenge,
                                            const string& serverKey) {
    string plain = clientCrypto->decrypt(serverKey, challenge);
    return clientCrypto->encrypt(serverKey, RelayProtocol::invertBytes(plain));
  };
  bool authenticated = false;
  settings.onAuthenticated = [&authenticated]() { authenticated = true; };

  std::promise<std::exception_ptr> handover;
  RelayListener::establishListeningConnection(
      *fixture.client, settings,
      [&handover](std::exception_ptr error) { handover.set_value(error); });
  relay.join();

  REQUIRE(authenticated);
  REQUIRE(registeredKey == clientCrypto->getPublicKey());
  REQUIRE(fixture.client->isPinging());

  fixture.server->sendConnectionHandover();
  auto outcome = handover.get_future();
  REQUIRE(outcome.wait_for(std::chrono::seconds(5)) ==
          std::future_status::ready);
  REQUIRE(outcome.get() == nullptr);
  REQUIRE_FALSE(fixture.client->isPinging());
  REQUIRE(fixture.client->getSocket()->isOpen());
}

TEST_CASE("RelayClientConnection handshake failures close the socket",
          "[RelayClientConnection]") {
  ConnectionFixture fixture;
  auto clientCrypto =
      make_shared<CryptoHandler>(CryptoHandler::generateKeyPair().second);
  CryptoHandler otherCrypto(CryptoHandler::generateKeyPair().second);

  std::thread relay([&]() {
    try {
      fixture.server->waitForRegister(5000);
      // Sealed for somebody else, so the client cannot open it
      fixture.server->sendAuthenticationRequest(
          otherCrypto.getPublicKey(),
          otherCrypto.encrypt(otherCrypto.getPublicKey(), "challenge"));
    } catch (const std::exception& e) {
      LOG(INFO) << "relay: " << e.what();
    }
  });

  HandshakeSettings settings;
  settings.publicKey = clientCrypto->getPublicKey();
  settings.requestTimeoutMs = 5000;
  settings.answerChallenge = [clientCrypto](const string& challenge,
                                            const string& serverKey) {
    return clientCrypto->decrypt(serverKey, challenge);
  };
  bool handoverCalled = false;
  REQUIRE_THROWS_WITH(
      RelayListener::establishListeningConnection(
          *fixture.client, settings,
          [&handoverCalled](std::exception_ptr) { handoverCalled = true; }),
      "Decrypt failed.  Possible key mismatch?");
  relay.join();

  REQUIRE(fixture.clientSocket->wasClosed());
  REQUIRE(fixture.clientSocket->getCloseReason() ==
          "Decrypt failed.  Possible key mismatch?");
  REQUIRE_FALSE(fixture.client->isPinging());
  REQUIRE_FALSE(handoverCalled);
}

TEST_CASE("RelayClientConnection waitForMessage", "[RelayClientConnection]") {
  ConnectionFixture fixture;
  fixture.open();

  SECTION("Answers pings while waiting") {
    fixture.server->sendPing();
    fixture.server->sendPong();
    fixture.server->sendAuthenticationSuccess(1000);
    json success = fixture.client->waitForMessage(
        RelayCommand::AUTHENTICATION_SUCCESS, 1000);
    REQUIRE(RelayProtocol::parseAuthenticationSuccess(success) == 1000);
    REQUIRE(fixture.sentCount(RelayCommand::PONG) == 1);
  }

  SECTION("Unexpected commands are protocol errors") {
    fixture.server->sendConnectionHandover();
    REQUIRE_THROWS_WITH(
        fixture.client->waitForMessage(RelayCommand::AUTHENTICATION_REQUEST,
                                       1000),
        "Received data does not match the data expected for command "
        "'authentication_request'");
  }

  SECTION("Malformed frames are protocol errors") {
    fixture.serverSocket->send(R"({"command":"authentication_success"})");
    REQUIRE_THROWS_AS(fixture.client->waitForMessage(
                          RelayCommand::AUTHENTICATION_SUCCESS, 1000),
                      ProtocolError);
  }

  SECTION("Times out") {
    fixture.client->setRequestTimeout(50);
    REQUIRE(fixture.client->getRequestTimeout() == 50);
    REQUIRE_THROWS_AS(
        fixture.client->waitForMessage(RelayCommand::CONNECTION_HANDOVER),
        TimeoutError);
  }

  SECTION("Keep-alive traffic does not extend the timeout") {
    std::atomic<bool> done(false);
    std::thread chatter([&]() {
      while (!done) {
        try {
          fixture.server->sendPong();
        } catch (const TransportError&) {
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
    });
    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(
        fixture.client->waitForMessage(RelayCommand::CONNECTION_HANDOVER, 200),
        TimeoutError);
    REQUIRE(std::chrono::steady_clock::now() - start <
            std::chrono::milliseconds(2000));
    done = true;
    chatter.join();
  }
}

TEST_CASE("RelayClientConnection ping / pong", "[RelayClientConnection]") {
  ConnectionFixture fixture;
  fixture.open();

  SECTION("Answered pings keep the connection") {
    fixture.server->serveKeepAlive();
    fixture.client->startPingPong(20, 500);
    REQUIRE_THROWS_AS(fixture.client->startPingPong(20, 500), UsageError);
    REQUIRE(waitUntil([&fixture]() {
      return fixture.server->getPingsReceived() >= 5;
    }));
    REQUIRE(fixture.client->getSocket()->isOpen());
    fixture.client->stopPingPong();
    REQUIRE_FALSE(fixture.client->isPinging());
  }

  SECTION("A missed pong terminates the socket") {
    fixture.server->serveKeepAlive(false);
    fixture.client->startPingPong(20, 50);
    REQUIRE(waitUntil(
        [&fixture]() { return fixture.clientSocket->wasTerminated(); }));
    REQUIRE(fixture.clientSocket->getCloseReason() ==
            "Ping: Connection timed out");
    REQUIRE(fixture.sentCount(RelayCommand::PING) == 1);
    REQUIRE_FALSE(fixture.client->isPinging());
  }

  SECTION("The missed pong limit is configurable") {
    fixture.server->serveKeepAlive(false);
    fixture.client->startPingPong(10, 30, 3);
    REQUIRE(waitUntil(
        [&fixture]() { return fixture.clientSocket->wasTerminated(); }));
    REQUIRE(fixture.sentCount(RelayCommand::PING) == 3);
  }
}

TEST_CASE("RelayClientConnection reports each hand-over outcome once",
          "[RelayClientConnection]") {
  for (int round = 0; round < 20; round++) {
    ConnectionFixture fixture;
    fixture.open();

    std::atomic<int> successes(0);
    std::atomic<int> failures(0);
    fixture.client->waitForHandoverInBackground(
        [&](std::exception_ptr error) { (error ? failures : successes)++; });

    // Hand-over and failure race each other
    std::thread handover([&fixture]() {
      try {
        fixture.server->sendConnectionHandover();
      } catch (const TransportError& e) {
        LOG(INFO) << "hand-over lost the race: " << e.what();
      }
    });
    std::thread failure([&fixture, round]() {
      if (round % 2) {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
      }
      fixture.client->terminate("racing failure");
    });
    handover.join();
    failure.join();

    REQUIRE(waitUntil(
        [&fixture]() { return !fixture.client->hasRunningTasks(); }));
    REQUIRE(successes + failures == 1);
  }
}
