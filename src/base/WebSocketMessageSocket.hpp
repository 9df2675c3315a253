#ifndef __OC_WEB_SOCKET_MESSAGE_SOCKET__
#define __OC_WEB_SOCKET_MESSAGE_SOCKET__

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include "MessageSocket.hpp"

namespace oc {
class WebSocketSession;

/** @brief Parsed ws:// or wss:// address. */
struct WebSocketUrl {
  bool secure;
  string host;
  string port;
  string target;
};

/**
 * @brief MessageSocket over a WebSocket connection (Boost.Beast), text frames
 * only.  All network I/O runs on one private io thread.
 *
 * Must be owned by a shared_ptr.  The io thread shares ownership of the
 * io_context, so the socket may be destroyed from one of its own handlers.
 * close() or terminate() before connect() make connect() fail.
 */
class WebSocketMessageSocket
    : public MessageSocket,
      public std::enable_shared_from_this<WebSocketMessageSocket> {
 public:
  explicit WebSocketMessageSocket(const string& _url);
  virtual ~WebSocketMessageSocket();

  /**
   * @throws std::runtime_error for anything that is not ws:// or wss://
   */
  static WebSocketUrl parseUrl(const string& url);

  /**
   * @throws TransportError after close() or terminate()
   */
  virtual void connect();
  virtual bool isOpen();
  virtual void send(const string& message);
  virtual void close(const string& reason);
  virtual void terminate(const string& reason);
  virtual string describe();

 protected:
  friend class WebSocketSession;

  void handleOpen();
  void handleMessage(const string& message);
  void handleError(const string& message);
  void handleClosed(const string& reason);

  string url;
  WebSocketUrl parsedUrl;
  shared_ptr<boost::asio::io_context> ioContext;
  shared_ptr<boost::asio::ssl::context> sslContext;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      workGuard;
  shared_ptr<WebSocketSession> session;
  shared_ptr<std::thread> ioThread;
  std::mutex stateMutex;
  bool open;
  bool finished;
  string terminateReason;
  // close() before connect()
  string closeReason;
};
}  // namespace oc

#endif  // __OC_WEB_SOCKET_MESSAGE_SOCKET__
