#ifndef __OC_MESSAGE_SOCKET__
#define __OC_MESSAGE_SOCKET__

#include "Errors.hpp"
#include "Event.hpp"
#include "Headers.hpp"

namespace oc {
/**
 * @brief An event driven, message oriented, bidirectional channel.
 *
 * Implementations report everything through the events below.  Handlers must
 * be connected before connect() is called or early events are lost.  Events
 * may fire on any thread.
 */
class MessageSocket {
 public:
  virtual ~MessageSocket() {}

  /** @brief Starts opening the channel.  Completion is signalled by onOpen. */
  virtual void connect() = 0;

  virtual bool isOpen() = 0;

  /**
   * @brief Sends one message.
   * @throws TransportError if the channel is not open.
   */
  virtual void send(const string& message) = 0;

  /**
   * @brief Graceful shutdown.  onClose fires once the peer acknowledged.
   */
  virtual void close(const string& reason) = 0;

  /**
   * @brief Drops the channel without waiting for the peer.
   */
  virtual void terminate(const string& reason) = 0;

  /** @brief Human readable remote address for logging. */
  virtual string describe() = 0;

  Event<void()> onOpen;
  Event<void(const string&)> onMessage;
  Event<void(const string&)> onClose;
  Event<void(const string&)> onError;
};

/** @brief Creates a not yet connected channel to @p url. */
typedef std::function<shared_ptr<MessageSocket>(const string& url)>
    MessageSocketFactory;
}  // namespace oc

#endif  // __OC_MESSAGE_SOCKET__
