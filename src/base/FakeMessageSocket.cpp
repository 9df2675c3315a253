#include "FakeMessageSocket.hpp"

namespace oc {
FakeMessageSocket::FakeMessageSocket(const string& _name)
    : name(_name),
      openOnConnect(true),
      open(false),
      closed(false),
      terminated(false) {}

pair<shared_ptr<FakeMessageSocket>, shared_ptr<FakeMessageSocket>>
FakeMessageSocket::createPair(const string& clientName,
                              const string& serverName) {
  shared_ptr<FakeMessageSocket> client(new FakeMessageSocket(clientName));
  shared_ptr<FakeMessageSocket> server(new FakeMessageSocket(serverName));
  client->setRemote(server);
  server->setRemote(client);
  return make_pair(client, server);
}

void FakeMessageSocket::connect() {
  string refused;
  bool openImmediately;
  {
    lock_guard<std::recursive_mutex> guard(socketMutex);
    refused = refuseReason;
    openImmediately = openOnConnect;
  }
  if (!refused.empty()) {
    injectError(refused);
    injectClose(refused);
    return;
  }
  if (openImmediately) {
    openNow();
  }
}

bool FakeMessageSocket::isOpen() {
  lock_guard<std::recursive_mutex> guard(socketMutex);
  return open;
}

void FakeMessageSocket::send(const string& message) {
  shared_ptr<FakeMessageSocket> peer;
  {
    lock_guard<std::recursive_mutex> guard(socketMutex);
    if (!open) {
      throw TransportError(describe() + " is not open");
    }
    sentMessages.push_back(message);
    peer = remote.lock();
  }
  if (peer) {
    peer->receive(message);
  }
}

void FakeMessageSocket::close(const string& reason) {
  shutdown(reason, false, true);
}

void FakeMessageSocket::terminate(const string& reason) {
  shutdown(reason, true, true);
}

string FakeMessageSocket::describe() { return "fake:" + name; }

void FakeMessageSocket::refuseConnection(const string& reason) {
  lock_guard<std::recursive_mutex> guard(socketMutex);
  refuseReason = reason;
}

void FakeMessageSocket::setOpenOnConnect(bool _openOnConnect) {
  lock_guard<std::recursive_mutex> guard(socketMutex);
  openOnConnect = _openOnConnect;
}

void FakeMessageSocket::openNow() {
  shared_ptr<FakeMessageSocket> peer;
  {
    lock_guard<std::recursive_mutex> guard(socketMutex);
    if (open || closed) {
      return;
    }
    open = true;
    peer = remote.lock();
  }
  if (peer) {
    peer->openNow();
  }
  onOpen.emit();
}

void FakeMessageSocket::injectError(const string& message) {
  onError.emit(message);
}

void FakeMessageSocket::injectClose(const string& reason) {
  shutdown(reason, false, false);
}

bool FakeMessageSocket::wasClosed() {
  lock_guard<std::recursive_mutex> guard(socketMutex);
  return closed;
}

bool FakeMessageSocket::wasTerminated() {
  lock_guard<std::recursive_mutex> guard(socketMutex);
  return terminated;
}

string FakeMessageSocket::getCloseReason() {
  lock_guard<std::recursive_mutex> guard(socketMutex);
  return closeReason;
}

vector<string> FakeMessageSocket::getSentMessages() {
  lock_guard<std::recursive_mutex> guard(socketMutex);
  return sentMessages;
}

void FakeMessageSocket::receive(const string& message) {
  {
    lock_guard<std::recursive_mutex> guard(socketMutex);
    if (!open) {
      VLOG(1) << describe() << ": dropping message received while closed";
      return;
    }
  }
  onMessage.emit(message);
}

void FakeMessageSocket::shutdown(const string& reason, bool _terminated,
                                 bool notifyRemote) {
  shared_ptr<FakeMessageSocket> peer;
  {
    lock_guard<std::recursive_mutex> guard(socketMutex);
    if (closed) {
      return;
    }
    open = false;
    closed = true;
    terminated = _terminated;
    closeReason = reason;
    if (notifyRemote) {
      peer = remote.lock();
    }
  }
  onClose.emit(reason);
  if (peer) {
    peer->shutdown(reason, false, false);
  }
}
}  // namespace oc
