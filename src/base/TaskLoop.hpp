#ifndef __OC_TASK_LOOP__
#define __OC_TASK_LOOP__

#include "Headers.hpp"

namespace oc {
/**
 * @brief One worker thread that runs posted tasks in order, plus delayed
 * tasks once their deadline passes.
 *
 * Everything posted to the same loop runs on the same thread, so state owned
 * by the loop needs no further locking.
 */
class TaskLoop {
 public:
  typedef uint64_t TimerId;

  explicit TaskLoop(const string& _name);
  ~TaskLoop();

  /**
   * @brief Queues @p task.
   * @return false if the loop is already stopped and the task was dropped.
   */
  bool post(std::function<void()> task);

  /**
   * @brief Runs @p task after @p delayMs.
   * @return A handle for cancel().  0 if the loop is stopped.
   */
  TimerId postDelayed(int64_t delayMs, std::function<void()> task);

  /**
   * @brief Drops a delayed task that has not started yet.
   * @return true if the task was still pending.
   */
  bool cancel(TimerId id);

  /** @brief Runs @p task on the loop and waits for it to finish. */
  void runAndWait(std::function<void()> task);

  bool isLoopThread() const;

  size_t pendingTimerCount();

  /**
   * @brief Stops the worker.  Tasks that have not started yet are dropped.
   */
  void stop();

 protected:
  void run();

  struct Timer {
    TimerId id;
    std::function<void()> task;
  };

  string name;
  std::mutex queueMutex;
  std::condition_variable queueCv;
  std::deque<std::function<void()>> tasks;
  std::multimap<std::chrono::steady_clock::time_point, Timer> timers;
  TimerId nextTimerId;
  bool stopping;
  std::thread::id loopThreadId;
  shared_ptr<std::thread> loopThread;
};
}  // namespace oc

#endif  // __OC_TASK_LOOP__
