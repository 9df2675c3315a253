#ifndef __OC_EVENT__
#define __OC_EVENT__

#include "Headers.hpp"

namespace oc {
/**
 * @brief Behaviour of an emit call when nobody is connected.
 *
 * DEFAULT silently does nothing, ERROR makes the emit itself fail.
 */
enum class EventPolicy { DEFAULT, ERROR };

/**
 * @brief Whether handlers run one after another on the emitting thread or
 * concurrently on worker threads.
 */
enum class EventExecution { SEQUENTIAL, PARALLEL };

template <typename T>
struct EventResults {
  typedef vector<T> type;
};

template <>
struct EventResults<void> {
  typedef void type;
};

template <typename Signature>
class Event;

/**
 * @brief Typed multi-subscriber notification.
 *
 * Three dispatch disciplines are offered:
 * - emit: fire and forget, failures go to the error handler (or the log).
 * - emitAll: run every handler and return all results. The first failure is
 *   rethrown once every handler has run.
 * - emitRace: return the outcome of whichever handler settles first.
 *
 * In SEQUENTIAL mode a handler that is disconnected by an earlier handler
 * during the same emit is skipped.  In PARALLEL mode all handlers connected at
 * the time of the emit are started.
 */
template <typename R, typename... Args>
class Event<R(Args...)> {
 public:
  typedef std::function<R(Args...)> Handler;
  typedef shared_ptr<Handler> HandlerPtr;
  typedef std::function<void()> Disconnect;
  typedef typename EventResults<R>::type Results;

  explicit Event(EventPolicy _policy = EventPolicy::DEFAULT,
                 EventExecution _execution = EventExecution::SEQUENTIAL)
      : policy(_policy),
        execution(_execution),
        handlerList(new HandlerList()) {}

  ~Event() {
    // Joins any race or fire-and-forget handlers that are still running.
    lock_guard<std::mutex> guard(pendingMutex);
    pendingTasks.clear();
  }

  Event(const Event&) = delete;
  Event& operator=(const Event&) = delete;

  /**
   * @brief Registers a handler and returns a closure that unregisters it.
   */
  Disconnect connect(Handler handler) {
    return connect(HandlerPtr(new Handler(std::move(handler))));
  }

  /**
   * @brief Registers a shared handler.  Registering the same handler twice is
   * reported and ignored, and the closure returned for the duplicate does
   * nothing.
   */
  Disconnect connect(HandlerPtr handler) {
    {
      lock_guard<std::recursive_mutex> guard(handlerList->mutex);
      auto& handlers = handlerList->handlers;
      if (std::find(handlers.begin(), handlers.end(), handler) !=
          handlers.end()) {
        LOG(ERROR) << "Event handler already registered";
        return []() {};
      }
      handlers.push_back(handler);
    }
    std::weak_ptr<HandlerList> weakList = handlerList;
    return [weakList, handler]() {
      auto list = weakList.lock();
      if (!list) {
        return;
      }
      lock_guard<std::recursive_mutex> guard(list->mutex);
      auto it = std::find(list->handlers.begin(), list->handlers.end(),
                          handler);
      if (it == list->handlers.end()) {
        LOG(ERROR) << "Event handler was not registered";
        return;
      }
      list->handlers.erase(it);
    };
  }

  size_t listenerCount() const {
    lock_guard<std::recursive_mutex> guard(handlerList->mutex);
    return handlerList->handlers.size();
  }

  /**
   * @brief Receives failures of emit().  Without one they are logged.
   */
  void setErrorHandler(std::function<void(std::exception_ptr)> _onError) {
    lock_guard<std::recursive_mutex> guard(handlerList->mutex);
    onError = std::move(_onError);
  }

  /**
   * @brief Runs all handlers and ignores their results.
   */
  void emit(Args... args) {
    if (execution == EventExecution::PARALLEL) {
      auto packedArgs = packArgs(args...);
      lock_guard<std::mutex> guard(pendingMutex);
      reapPendingTasks();
      pendingTasks.push_back(std::async(std::launch::async, [this, packedArgs]() {
        try {
          std::apply([this](const std::decay_t<Args>&... a) { emitAll(a...); },
                     *packedArgs);
        } catch (...) {
          reportEmitFailure(std::current_exception());
        }
      }));
      return;
    }
    try {
      emitAll(args...);
    } catch (...) {
      reportEmitFailure(std::current_exception());
    }
  }

  /**
   * @brief Runs all handlers and returns their results in registration order.
   * @throws the first failure once every handler has run.
   */
  Results emitAll(Args... args) {
    vector<HandlerPtr> handlers = snapshot();
    if (execution == EventExecution::PARALLEL) {
      return runParallel(handlers, packArgs(args...));
    }

    std::exception_ptr firstError;
    if constexpr (std::is_void<R>::value) {
      for (auto& handler : handlers) {
        if (!isConnected(handler)) {
          continue;
        }
        try {
          (*handler)(args...);
        } catch (...) {
          recordFailure(&firstError);
        }
      }
      if (firstError) {
        std::rethrow_exception(firstError);
      }
    } else {
      Results results;
      for (auto& handler : handlers) {
        if (!isConnected(handler)) {
          continue;
        }
        try {
          results.push_back((*handler)(args...));
        } catch (...) {
          recordFailure(&firstError);
        }
      }
      if (firstError) {
        std::rethrow_exception(firstError);
      }
      return results;
    }
  }

  /**
   * @brief Returns (or throws) the outcome of the first handler to settle.
   */
  R emitRace(Args... args) {
    vector<HandlerPtr> handlers = snapshot();
    if (handlers.empty()) {
      throw std::runtime_error("emitRace called without any listener");
    }

    if (execution == EventExecution::SEQUENTIAL) {
      // Every handler runs, the first one to return decides.
      std::exception_ptr firstError;
      std::optional<std::conditional_t<std::is_void<R>::value, bool, R>>
          firstResult;
      bool settled = false;
      for (auto& handler : handlers) {
        try {
          if constexpr (std::is_void<R>::value) {
            (*handler)(args...);
            if (!settled) {
              firstResult = true;
            }
          } else {
            R result = (*handler)(args...);
            if (!settled) {
              firstResult = std::move(result);
            }
          }
        } catch (...) {
          if (!settled) {
            firstError = std::current_exception();
          } else {
            LOG(WARNING) << "Event handler failed after the race was decided";
          }
        }
        settled = true;
      }
      if (firstError) {
        std::rethrow_exception(firstError);
      }
      if constexpr (!std::is_void<R>::value) {
        return std::move(*firstResult);
      } else {
        return;
      }
    }

    auto race = make_shared<RaceState>();
    auto packedArgs = packArgs(args...);
    {
      lock_guard<std::mutex> guard(pendingMutex);
      reapPendingTasks();
      for (auto& handler : handlers) {
        pendingTasks.push_back(
            std::async(std::launch::async, [handler, packedArgs, race]() {
              try {
                if constexpr (std::is_void<R>::value) {
                  std::apply(*handler, *packedArgs);
                  race->settle(true, nullptr);
                } else {
                  race->settle(std::apply(*handler, *packedArgs), nullptr);
                }
              } catch (...) {
                race->settle(std::nullopt, std::current_exception());
              }
            }));
      }
    }

    std::unique_lock<std::mutex> lock(race->mutex);
    race->cv.wait(lock, [&race] { return race->settled; });
    if (race->error) {
      std::rethrow_exception(race->error);
    }
    if constexpr (!std::is_void<R>::value) {
      return std::move(*race->value);
    }
  }

 protected:
  struct HandlerList {
    mutable std::recursive_mutex mutex;
    vector<HandlerPtr> handlers;
  };

  typedef std::conditional_t<std::is_void<R>::value, bool, R> RaceValue;

  struct RaceState {
    std::mutex mutex;
    std::condition_variable cv;
    bool settled = false;
    std::optional<RaceValue> value;
    std::exception_ptr error;

    void settle(std::optional<RaceValue> _value, std::exception_ptr _error) {
      lock_guard<std::mutex> guard(mutex);
      if (settled) {
        if (_error) {
          LOG(WARNING) << "Event handler failed after the race was decided";
        }
        return;
      }
      settled = true;
      value = std::move(_value);
      error = _error;
      cv.notify_all();
    }
  };

  struct FailureLog {
    std::mutex mutex;
    vector<size_t> indices;
  };

  typedef std::tuple<std::decay_t<Args>...> PackedArgs;

  static shared_ptr<PackedArgs> packArgs(Args... args) {
    return make_shared<PackedArgs>(args...);
  }

  vector<HandlerPtr> snapshot() {
    lock_guard<std::recursive_mutex> guard(handlerList->mutex);
    if (policy == EventPolicy::ERROR && handlerList->handlers.empty()) {
      throw std::runtime_error("Nobody is listening for this event.");
    }
    return handlerList->handlers;
  }

  bool isConnected(const HandlerPtr& handler) {
    lock_guard<std::recursive_mutex> guard(handlerList->mutex);
    auto& handlers = handlerList->handlers;
    return std::find(handlers.begin(), handlers.end(), handler) !=
           handlers.end();
  }

  static void recordFailure(std::exception_ptr* firstError) {
    std::exception_ptr error = std::current_exception();
    try {
      std::rethrow_exception(error);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Event handler failed: " << e.what();
    } catch (...) {
      LOG(ERROR) << "Event handler failed with a non-standard exception";
    }
    if (!*firstError) {
      *firstError = error;
    }
  }

  Results runParallel(const vector<HandlerPtr>& handlers,
                      shared_ptr<PackedArgs> packedArgs) {
    auto failures = make_shared<FailureLog>();
    vector<std::future<R>> futures;
    for (size_t i = 0; i < handlers.size(); i++) {
      HandlerPtr handler = handlers[i];
      futures.push_back(
          std::async(std::launch::async, [handler, packedArgs, failures, i]() {
            try {
              return std::apply(*handler, *packedArgs);
            } catch (...) {
              lock_guard<std::mutex> guard(failures->mutex);
              failures->indices.push_back(i);
              throw;
            }
          }));
    }

    vector<std::exception_ptr> errors(futures.size());
    std::conditional_t<std::is_void<R>::value, bool, Results> results{};
    for (size_t i = 0; i < futures.size(); i++) {
      try {
        if constexpr (std::is_void<R>::value) {
          futures[i].get();
        } else {
          results.push_back(futures[i].get());
        }
      } catch (...) {
        errors[i] = std::current_exception();
      }
    }

    // Like a wait-for-all over promises, the failure that happened first wins.
    {
      lock_guard<std::mutex> guard(failures->mutex);
      if (!failures->indices.empty()) {
        std::rethrow_exception(errors[failures->indices.front()]);
      }
    }
    if constexpr (!std::is_void<R>::value) {
      return results;
    }
  }

  void reportEmitFailure(std::exception_ptr error) {
    std::function<void(std::exception_ptr)> errorHandler;
    {
      lock_guard<std::recursive_mutex> guard(handlerList->mutex);
      errorHandler = onError;
    }
    if (errorHandler) {
      errorHandler(error);
      return;
    }
    try {
      std::rethrow_exception(error);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Unhandled event failure: " << e.what();
    } catch (...) {
      LOG(ERROR) << "Unhandled event failure (unknown)";
    }
  }

  // Must hold pendingMutex
  void reapPendingTasks() {
    pendingTasks.erase(
        std::remove_if(pendingTasks.begin(), pendingTasks.end(),
                       [](std::future<void>& task) {
                         return task.wait_for(std::chrono::seconds(0)) ==
                                std::future_status::ready;
                       }),
        pendingTasks.end());
  }

  EventPolicy policy;
  EventExecution execution;
  shared_ptr<HandlerList> handlerList;
  std::function<void(std::exception_ptr)> onError;
  std::mutex pendingMutex;
  vector<std::future<void>> pendingTasks;
};
}  // namespace oc

#endif  // __OC_EVENT__
