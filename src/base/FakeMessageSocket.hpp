#ifndef __OC_FAKE_MESSAGE_SOCKET__
#define __OC_FAKE_MESSAGE_SOCKET__

#include "MessageSocket.hpp"

namespace oc {
/**
 * @brief In-memory MessageSocket.  Two instances linked with createPair()
 * deliver messages to each other synchronously on the sending thread.
 */
class FakeMessageSocket : public MessageSocket {
 public:
  explicit FakeMessageSocket(const string& _name);

  static pair<shared_ptr<FakeMessageSocket>, shared_ptr<FakeMessageSocket>>
  createPair(const string& clientName = "client",
             const string& serverName = "server");

  inline void setRemote(shared_ptr<FakeMessageSocket> _remote) {
    lock_guard<std::recursive_mutex> guard(socketMutex);
    remote = _remote;
  }

  virtual void connect();
  virtual bool isOpen();
  virtual void send(const string& message);
  virtual void close(const string& reason);
  virtual void terminate(const string& reason);
  virtual string describe();

  /** @brief Makes connect() fail with @p reason instead of opening. */
  void refuseConnection(const string& reason);

  /** @brief When false, connect() does nothing until openNow() is called. */
  void setOpenOnConnect(bool openOnConnect);

  /** @brief Opens this end and its peer. */
  void openNow();

  /** @brief Simulates the transport reporting an error. */
  void injectError(const string& message);

  /** @brief Simulates the transport closing without involving the peer. */
  void injectClose(const string& reason);

  bool wasClosed();
  bool wasTerminated();
  string getCloseReason();
  vector<string> getSentMessages();

 protected:
  void receive(const string& message);
  void shutdown(const string& reason, bool terminated, bool notifyRemote);

  string name;
  std::weak_ptr<FakeMessageSocket> remote;
  std::recursive_mutex socketMutex;
  bool openOnConnect;
  bool open;
  bool closed;
  bool terminated;
  string refuseReason;
  string closeReason;
  vector<string> sentMessages;
};
}  // namespace oc

#endif  // __OC_FAKE_MESSAGE_SOCKET__
