#include "ListenerStateMachine.hpp"

namespace oc {
string listenerStateName(ListenerState state) {
  switch (state) {
    case ListenerState::NOT_LISTENING:
      return "NotListening";
    case ListenerState::CONNECTING:
      return "Connecting";
    case ListenerState::LISTENING:
      return "Listening";
  }
  return "Unknown";
}

ListenerStateMachine::ListenerStateMachine(
    size_t _spareConnectionLimit, int64_t _reconnectTimeoutMs,
    shared_ptr<ConnectionIdRegistry> _idRegistry)
    : spareConnectionLimit(_spareConnectionLimit),
      reconnectTimeoutMs(_reconnectTimeoutMs),
      idRegistry(_idRegistry),
      running(false),
      state(ListenerState::NOT_LISTENING),
      nextRetryToken(1) {
  if (spareConnectionLimit == 0) {
    throw UsageError("The spare connection limit must be at least 1");
  }
  if (!idRegistry) {
    throw UsageError("ListenerStateMachine needs an id registry");
  }
}

vector<ListenerEffect> ListenerStateMachine::start() {
  if (running) {
    throw UsageError("Already running");
  }
  vector<ListenerEffect> effects;
  running = true;
  updateState("Listener started", &effects);
  scheduleSpareConnection(false, &effects);
  return effects;
}

vector<ListenerEffect> ListenerStateMachine::stop(const string& reason) {
  vector<ListenerEffect> effects;
  running = false;
  if (pendingRetry) {
    ListenerEffect cancel;
    cancel.type = ListenerEffect::CANCEL_RETRY;
    cancel.retryToken = *pendingRetry;
    effects.push_back(cancel);
    pendingRetry.reset();
  }
  for (auto id : spares) {
    effects.push_back(
        connectionEffect(ListenerEffect::CLOSE_CONNECTION, id, reason));
  }
  spares.clear();
  for (auto id : inflight) {
    effects.push_back(
        connectionEffect(ListenerEffect::TERMINATE_CONNECTION, id, reason));
  }
  inflight.clear();
  updateState(reason, &effects);
  return effects;
}

vector<ListenerEffect> ListenerStateMachine::attemptSucceeded(uint64_t id) {
  vector<ListenerEffect> effects;
  if (inflight.erase(id) == 0 || !running) {
    effects.push_back(connectionEffect(ListenerEffect::CLOSE_CONNECTION, id,
                                       "Listener is not waiting for this "
                                       "connection"));
    return effects;
  }
  spares.insert(id);
  updateState("Spare connection established", &effects);
  scheduleSpareConnection(false, &effects);
  return effects;
}

vector<ListenerEffect> ListenerStateMachine::attemptFailed(
    uint64_t id, const string& reason) {
  vector<ListenerEffect> effects;
  effects.push_back(
      connectionEffect(ListenerEffect::CLOSE_CONNECTION, id, reason));
  if (inflight.erase(id) == 0) {
    return effects;
  }
  updateState(reason, &effects);
  scheduleSpareConnection(true, &effects);
  return effects;
}

vector<ListenerEffect> ListenerStateMachine::handedOver(uint64_t id) {
  vector<ListenerEffect> effects;
  if (spares.erase(id) == 0) {
    effects.push_back(connectionEffect(ListenerEffect::CLOSE_CONNECTION, id,
                                       "Hand-over for an untracked connection"));
    return effects;
  }
  updateState("Connection handed over", &effects);
  scheduleSpareConnection(false, &effects);
  effects.push_back(connectionEffect(ListenerEffect::EMIT_CONNECTION, id));
  return effects;
}

vector<ListenerEffect> ListenerStateMachine::spareFailed(uint64_t id,
                                                         const string& reason) {
  vector<ListenerEffect> effects;
  effects.push_back(
      connectionEffect(ListenerEffect::CLOSE_CONNECTION, id, reason));
  if (spares.erase(id) == 0) {
    return effects;
  }
  updateState(reason, &effects);
  scheduleSpareConnection(true, &effects);
  return effects;
}

vector<ListenerEffect> ListenerStateMachine::retryTimerFired(uint64_t token) {
  vector<ListenerEffect> effects;
  if (!pendingRetry || *pendingRetry != token) {
    return effects;
  }
  pendingRetry.reset();
  scheduleSpareConnection(false, &effects);
  return effects;
}

void ListenerStateMachine::scheduleSpareConnection(
    bool delayed, vector<ListenerEffect>* effects) {
  if (!running) {
    return;
  }
  if (spares.size() + inflight.size() >= spareConnectionLimit) {
    return;
  }

  if (delayed) {
    if (pendingRetry) {
      return;
    }
    pendingRetry = nextRetryToken++;
    ListenerEffect retry;
    retry.type = ListenerEffect::SCHEDULE_RETRY;
    retry.retryToken = *pendingRetry;
    retry.delayMs = reconnectTimeoutMs;
    effects->push_back(retry);
    return;
  }

  uint64_t id = idRegistry->allocate();
  inflight.insert(id);
  effects->push_back(connectionEffect(ListenerEffect::OPEN_CONNECTION, id));
}

void ListenerStateMachine::updateState(const string& reason,
                                       vector<ListenerEffect>* effects) {
  ListenerState newState = ListenerState::NOT_LISTENING;
  if (!spares.empty()) {
    newState = ListenerState::LISTENING;
  } else if (running) {
    newState = ListenerState::CONNECTING;
  }
  if (newState == state) {
    return;
  }
  ListenerEffect change;
  change.type = ListenerEffect::EMIT_STATE_CHANGE;
  change.oldState = state;
  change.newState = newState;
  change.reason = reason;
  effects->push_back(change);
  state = newState;
}

ListenerEffect ListenerStateMachine::connectionEffect(ListenerEffect::Type type,
                                                      uint64_t id,
                                                      const string& reason) {
  ListenerEffect effect;
  effect.type = type;
  effect.connectionId = id;
  effect.reason = reason;
  return effect;
}
}  // namespace oc
