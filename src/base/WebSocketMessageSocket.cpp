#include "WebSocketMessageSocket.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace oc {
/**
 * @brief The io-thread side of a WebSocketMessageSocket.  Every member
 * function except the public entry points runs on the io thread.
 */
class WebSocketSession {
 public:
  explicit WebSocketSession(std::weak_ptr<WebSocketMessageSocket> _owner)
      : owner(_owner) {}
  virtual ~WebSocketSession() {}

  virtual void start() = 0;
  virtual void write(const string& message) = 0;
  virtual void close(const string& reason) = 0;
  virtual void terminate() = 0;

 protected:
  // The owner stays alive until the report returns
  void reportOpen() {
    auto socket = owner.lock();
    if (socket) {
      socket->handleOpen();
    }
  }
  void reportMessage(const string& message) {
    auto socket = owner.lock();
    if (socket) {
      socket->handleMessage(message);
    }
  }
  void reportError(const string& message) {
    auto socket = owner.lock();
    if (socket) {
      socket->handleError(message);
    }
  }
  void reportClosed(const string& reason) {
    auto socket = owner.lock();
    if (socket) {
      socket->handleClosed(reason);
    }
  }

  std::weak_ptr<WebSocketMessageSocket> owner;
};

namespace {
template <bool Secure>
class BasicWebSocketSession
    : public WebSocketSession,
      public std::enable_shared_from_this<BasicWebSocketSession<Secure>> {
 public:
  typedef std::conditional_t<
      Secure, websocket::stream<beast::ssl_stream<beast::tcp_stream>>,
      websocket::stream<beast::tcp_stream>>
      Stream;

  BasicWebSocketSession(std::weak_ptr<WebSocketMessageSocket> _owner,
                        net::io_context& _ioContext,
                        shared_ptr<ssl::context> _sslContext,
                        const WebSocketUrl& _url)
      : WebSocketSession(_owner),
        ioContext(_ioContext),
        sslContext(_sslContext),
        resolver(_ioContext),
        url(_url),
        closing(false),
        finished(false) {
    if constexpr (Secure) {
      ws.reset(new Stream(_ioContext, *sslContext));
    } else {
      ws.reset(new Stream(_ioContext));
    }
  }

  virtual void start() {
    auto self = this->shared_from_this();
    net::post(ioContext, [self]() {
      self->resolver.async_resolve(
          self->url.host, self->url.port,
          [self](beast::error_code ec, tcp::resolver::results_type results) {
            self->onResolve(ec, results);
          });
    });
  }

  virtual void write(const string& message) {
    auto self = this->shared_from_this();
    net::post(ioContext, [self, message]() {
      if (self->finished) {
        return;
      }
      self->outbox.push_back(message);
      if (self->outbox.size() == 1) {
        self->doWrite();
      }
    });
  }

  virtual void close(const string& reason) {
    auto self = this->shared_from_this();
    net::post(ioContext, [self, reason]() {
      if (self->closing || self->finished) {
        return;
      }
      self->closing = true;
      self->closeReason = reason;
      // async_close may not overlap a write
      if (self->outbox.empty()) {
        self->doClose();
      }
    });
  }

  virtual void terminate() {
    auto self = this->shared_from_this();
    net::post(ioContext, [self]() {
      beast::error_code ec;
      beast::get_lowest_layer(*self->ws).socket().shutdown(
          tcp::socket::shutdown_both, ec);
      beast::get_lowest_layer(*self->ws).close();
      self->finish("Connection terminated");
    });
  }

 protected:
  void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (finished) {
      return;
    }
    if (ec) {
      return fail("Resolve failed", ec);
    }
    auto self = this->shared_from_this();
    beast::get_lowest_layer(*ws).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(*ws).async_connect(
        results,
        [self](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
          self->onConnect(ec);
        });
  }

  void onConnect(beast::error_code ec) {
    if (finished) {
      return;
    }
    if (ec) {
      return fail("Connect failed", ec);
    }
    if constexpr (Secure) {
      if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(),
                                    url.host.c_str())) {
        return fail("Cannot set TLS server name",
                    beast::error_code(static_cast<int>(::ERR_get_error()),
                                      net::error::get_ssl_category()));
      }
      auto self = this->shared_from_this();
      ws->next_layer().async_handshake(
          ssl::stream_base::client,
          [self](beast::error_code ec) { self->onTransportReady(ec); });
    } else {
      onTransportReady(ec);
    }
  }

  void onTransportReady(beast::error_code ec) {
    if (finished) {
      return;
    }
    if (ec) {
      return fail("TLS handshake failed", ec);
    }
    beast::get_lowest_layer(*ws).expires_never();
    ws->set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws->set_option(
        websocket::stream_base::decorator([](websocket::request_type& req) {
          req.set(beast::http::field::user_agent,
                  string("oclisten/") + OC_VERSION);
        }));
    ws->text(true);
    auto self = this->shared_from_this();
    ws->async_handshake(url.host + ":" + url.port, url.target,
                        [self](beast::error_code ec) { self->onHandshake(ec); });
  }

  void onHandshake(beast::error_code ec) {
    if (finished) {
      return;
    }
    if (ec) {
      return fail("WebSocket handshake failed", ec);
    }
    reportOpen();
    doRead();
  }

  void doRead() {
    auto self = this->shared_from_this();
    ws->async_read(readBuffer, [self](beast::error_code ec, size_t) {
      self->onRead(ec);
    });
  }

  void onRead(beast::error_code ec) {
    if (ec == websocket::error::closed) {
      string reason = ws->reason().reason.c_str();
      if (reason.empty()) {
        reason = closeReason;
      }
      return finish(reason);
    }
    if (ec) {
      return fail("Read failed", ec);
    }
    string message = beast::buffers_to_string(readBuffer.data());
    readBuffer.consume(readBuffer.size());
    reportMessage(message);
    doRead();
  }

  void doWrite() {
    auto self = this->shared_from_this();
    ws->async_write(net::buffer(outbox.front()),
                    [self](beast::error_code ec, size_t) {
                      self->onWrite(ec);
                    });
  }

  void onWrite(beast::error_code ec) {
    if (ec) {
      outbox.clear();
      return fail("Write failed", ec);
    }
    outbox.pop_front();
    if (!outbox.empty()) {
      doWrite();
    } else if (closing) {
      doClose();
    }
  }

  void doClose() {
    auto self = this->shared_from_this();
    ws->async_close(
        websocket::close_reason(websocket::close_code::normal, closeReason),
        [self](beast::error_code ec) {
          if (ec) {
            self->fail("Close failed", ec);
          }
          // Otherwise the pending read completes with error::closed
        });
  }

  void fail(const string& what, beast::error_code ec) {
    if (finished) {
      return;
    }
    string message = what + ": " + ec.message();
    reportError(message);
    finish(message);
  }

  void finish(const string& reason) {
    if (finished) {
      return;
    }
    finished = true;
    reportClosed(reason);
  }

  net::io_context& ioContext;
  shared_ptr<ssl::context> sslContext;
  tcp::resolver resolver;
  unique_ptr<Stream> ws;
  WebSocketUrl url;
  beast::flat_buffer readBuffer;
  std::deque<string> outbox;
  bool closing;
  bool finished;
  string closeReason;
};
}  // namespace

WebSocketMessageSocket::WebSocketMessageSocket(const string& _url)
    : url(_url),
      parsedUrl(parseUrl(_url)),
      ioContext(new net::io_context()),
      sslContext(new ssl::context(ssl::context::tls_client)),
      workGuard(net::make_work_guard(*ioContext)),
      open(false),
      finished(false) {
  sslContext->set_default_verify_paths();
  sslContext->set_verify_mode(ssl::verify_peer);
}

WebSocketMessageSocket::~WebSocketMessageSocket() {
  workGuard.reset();
  ioContext->stop();
  if (ioThread) {
    if (ioThread->get_id() == std::this_thread::get_id()) {
      // Destroyed from one of our own handlers.  The io thread holds its own
      // reference to the io_context and tears it down once run() returns.
      ioThread->detach();
    } else {
      ioThread->join();
    }
    ioThread.reset();
  }
}

WebSocketUrl WebSocketMessageSocket::parseUrl(const string& url) {
  WebSocketUrl parsed;
  string rest;
  if (url.rfind("wss://", 0) == 0) {
    parsed.secure = true;
    rest = url.substr(6);
  } else if (url.rfind("ws://", 0) == 0) {
    parsed.secure = false;
    rest = url.substr(5);
  } else {
    throw std::runtime_error("Unsupported relay url (need ws:// or wss://): " +
                             url);
  }

  auto slash = rest.find('/');
  string hostPort = rest.substr(0, slash);
  parsed.target = slash == string::npos ? "/" : rest.substr(slash);
  if (hostPort.empty()) {
    throw std::runtime_error("Missing host in relay url: " + url);
  }

  auto colon = hostPort.rfind(':');
  if (colon != string::npos && hostPort.find(']') == string::npos) {
    parsed.host = hostPort.substr(0, colon);
    parsed.port = hostPort.substr(colon + 1);
  } else if (colon != string::npos && colon > hostPort.find(']')) {
    parsed.host = hostPort.substr(1, hostPort.find(']') - 1);
    parsed.port = hostPort.substr(colon + 1);
  } else {
    parsed.host = hostPort;
    if (parsed.host.front() == '[') {
      parsed.host = parsed.host.substr(1, parsed.host.length() - 2);
    }
    parsed.port = parsed.secure ? "443" : "80";
  }
  if (parsed.port.empty() ||
      parsed.port.find_first_not_of("0123456789") != string::npos) {
    throw std::runtime_error("Invalid port in relay url: " + url);
  }
  return parsed;
}

void WebSocketMessageSocket::connect() {
  lock_guard<std::mutex> guard(stateMutex);
  if (session) {
    throw UsageError("connect() called twice on " + url);
  }
  if (!terminateReason.empty()) {
    throw TransportError("WebSocket to " + url +
                         " was terminated before connecting: " +
                         terminateReason);
  }
  if (!closeReason.empty()) {
    throw TransportError("WebSocket to " + url +
                         " was closed before connecting: " + closeReason);
  }
  std::weak_ptr<WebSocketMessageSocket> weakThis = weak_from_this();
  if (weakThis.expired()) {
    throw UsageError("WebSocketMessageSocket must be owned by a shared_ptr");
  }
  if (parsedUrl.secure) {
    session.reset(new BasicWebSocketSession<true>(weakThis, *ioContext,
                                                  sslContext, parsedUrl));
  } else {
    session.reset(new BasicWebSocketSession<false>(weakThis, *ioContext,
                                                   sslContext, parsedUrl));
  }
  auto context = ioContext;
  ioThread.reset(new std::thread([context]() {
    el::Helpers::setThreadName("ws-io");
    context->run();
  }));
  session->start();
}

bool WebSocketMessageSocket::isOpen() {
  lock_guard<std::mutex> guard(stateMutex);
  return open;
}

void WebSocketMessageSocket::send(const string& message) {
  shared_ptr<WebSocketSession> currentSession;
  {
    lock_guard<std::mutex> guard(stateMutex);
    if (!open) {
      throw TransportError("WebSocket to " + url + " is not open");
    }
    currentSession = session;
  }
  currentSession->write(message);
}

void WebSocketMessageSocket::close(const string& reason) {
  shared_ptr<WebSocketSession> currentSession;
  {
    lock_guard<std::mutex> guard(stateMutex);
    if (!session && closeReason.empty()) {
      closeReason = reason.empty() ? "closed" : reason;
    }
    currentSession = session;
  }
  if (currentSession) {
    currentSession->close(reason);
  }
}

void WebSocketMessageSocket::terminate(const string& reason) {
  shared_ptr<WebSocketSession> currentSession;
  {
    lock_guard<std::mutex> guard(stateMutex);
    if (terminateReason.empty()) {
      terminateReason = reason.empty() ? "terminated" : reason;
    }
    currentSession = session;
  }
  if (currentSession) {
    currentSession->terminate();
  }
}

string WebSocketMessageSocket::describe() { return url; }

void WebSocketMessageSocket::handleOpen() {
  {
    lock_guard<std::mutex> guard(stateMutex);
    if (finished || !terminateReason.empty()) {
      return;
    }
    open = true;
  }
  VLOG(1) << "WebSocket open: " << url;
  onOpen.emit();
}

void WebSocketMessageSocket::handleMessage(const string& message) {
  VLOG(3) << "WebSocket " << url << " received " << message.length()
          << " bytes";
  onMessage.emit(message);
}

void WebSocketMessageSocket::handleError(const string& message) {
  LOG(WARNING) << "WebSocket " << url << " error: " << message;
  onError.emit(message);
}

void WebSocketMessageSocket::handleClosed(const string& reason) {
  string finalReason = reason;
  {
    lock_guard<std::mutex> guard(stateMutex);
    if (finished) {
      return;
    }
    finished = true;
    open = false;
    if (!terminateReason.empty()) {
      finalReason = terminateReason;
    }
  }
  VLOG(1) << "WebSocket closed: " << url << " (" << finalReason << ")";
  onClose.emit(finalReason);
}
}  // namespace oc
