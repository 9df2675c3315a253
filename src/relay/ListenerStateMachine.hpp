#ifndef __OC_LISTENER_STATE_MACHINE__
#define __OC_LISTENER_STATE_MACHINE__

#include "ConnectionIdRegistry.hpp"
#include "Errors.hpp"
#include "Headers.hpp"

namespace oc {
enum class ListenerState { NOT_LISTENING, CONNECTING, LISTENING };

string listenerStateName(ListenerState state);

/**
 * @brief Something the driver of a ListenerStateMachine has to carry out.
 */
struct ListenerEffect {
  enum Type {
    // Open connectionId and run the handshake on it
    OPEN_CONNECTION,
    // Fire retryTimerFired(retryToken) after delayMs
    SCHEDULE_RETRY,
    CANCEL_RETRY,
    CLOSE_CONNECTION,
    // Like CLOSE_CONNECTION but for a handshake still in progress
    TERMINATE_CONNECTION,
    // Give connectionId to the application
    EMIT_CONNECTION,
    EMIT_STATE_CHANGE,
  };

  Type type;
  uint64_t connectionId = 0;
  uint64_t retryToken = 0;
  int64_t delayMs = 0;
  ListenerState oldState = ListenerState::NOT_LISTENING;
  ListenerState newState = ListenerState::NOT_LISTENING;
  string reason;
};

/**
 * @brief Spare connection pool bookkeeping of a RelayListener, without any
 * I/O.
 *
 * Every event returns the effects it causes, in the order they have to be
 * executed.  Invariants kept across all event sequences:
 * - spares + handshakes in flight never exceed the spare connection limit
 * - at most one delayed retry is pending
 * - the state is LISTENING iff there is a spare, CONNECTING iff running
 *   without spares, NOT_LISTENING otherwise
 * - a state change effect is only produced when the state really changes
 *
 * Events about connections the machine no longer tracks (for instance a
 * handshake finishing after stop()) only produce a CLOSE_CONNECTION.
 */
class ListenerStateMachine {
 public:
  ListenerStateMachine(size_t _spareConnectionLimit, int64_t _reconnectTimeoutMs,
                       shared_ptr<ConnectionIdRegistry> _idRegistry);

  /** @throws UsageError if already running */
  vector<ListenerEffect> start();
  vector<ListenerEffect> stop(const string& reason = "Listener stopped");

  vector<ListenerEffect> attemptSucceeded(uint64_t id);
  vector<ListenerEffect> attemptFailed(uint64_t id, const string& reason);
  vector<ListenerEffect> handedOver(uint64_t id);
  vector<ListenerEffect> spareFailed(uint64_t id, const string& reason);
  vector<ListenerEffect> retryTimerFired(uint64_t token);

  inline ListenerState getState() const { return state; }
  inline bool isRunning() const { return running; }
  inline size_t getSpareConnectionLimit() const { return spareConnectionLimit; }
  inline size_t spareCount() const { return spares.size(); }
  inline size_t inflightCount() const { return inflight.size(); }
  inline const set<uint64_t>& getSpares() const { return spares; }
  inline const set<uint64_t>& getInflight() const { return inflight; }
  inline std::optional<uint64_t> getPendingRetry() const { return pendingRetry; }

 protected:
  void scheduleSpareConnection(bool delayed, vector<ListenerEffect>* effects);
  void updateState(const string& reason, vector<ListenerEffect>* effects);
  static ListenerEffect connectionEffect(ListenerEffect::Type type,
                                         uint64_t id,
                                         const string& reason = "");

  size_t spareConnectionLimit;
  int64_t reconnectTimeoutMs;
  shared_ptr<ConnectionIdRegistry> idRegistry;

  bool running;
  ListenerState state;
  set<uint64_t> spares;
  set<uint64_t> inflight;
  std::optional<uint64_t> pendingRetry;
  uint64_t nextRetryToken;
};
}  // namespace oc

#endif  // __OC_LISTENER_STATE_MACHINE__
