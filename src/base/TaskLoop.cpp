#include "TaskLoop.hpp"

namespace oc {
TaskLoop::TaskLoop(const string& _name)
    : name(_name), nextTimerId(1), stopping(false) {
  std::promise<void> started;
  auto startedFuture = started.get_future();
  loopThread.reset(new std::thread([this, &started]() {
    el::Helpers::setThreadName(name);
    loopThreadId = std::this_thread::get_id();
    started.set_value();
    run();
  }));
  startedFuture.wait();
}

TaskLoop::~TaskLoop() { stop(); }

bool TaskLoop::post(std::function<void()> task) {
  lock_guard<std::mutex> guard(queueMutex);
  if (stopping) {
    VLOG(1) << name << ": dropping task posted after stop";
    return false;
  }
  tasks.push_back(std::move(task));
  queueCv.notify_one();
  return true;
}

TaskLoop::TimerId TaskLoop::postDelayed(int64_t delayMs,
                                        std::function<void()> task) {
  lock_guard<std::mutex> guard(queueMutex);
  if (stopping) {
    return 0;
  }
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(std::max<int64_t>(delayMs, 0));
  TimerId id = nextTimerId++;
  timers.insert(make_pair(deadline, Timer{id, std::move(task)}));
  queueCv.notify_one();
  return id;
}

bool TaskLoop::cancel(TimerId id) {
  lock_guard<std::mutex> guard(queueMutex);
  for (auto it = timers.begin(); it != timers.end(); ++it) {
    if (it->second.id == id) {
      timers.erase(it);
      return true;
    }
  }
  return false;
}

void TaskLoop::runAndWait(std::function<void()> task) {
  if (isLoopThread()) {
    task();
    return;
  }
  auto done = make_shared<std::promise<void>>();
  auto future = done->get_future();
  bool queued = post([task, done]() {
    try {
      task();
      done->set_value();
    } catch (...) {
      done->set_exception(std::current_exception());
    }
  });
  if (!queued) {
    throw std::runtime_error(name + " is stopped");
  }
  // Rethrows whatever the task threw
  future.get();
}

bool TaskLoop::isLoopThread() const {
  return std::this_thread::get_id() == loopThreadId;
}

size_t TaskLoop::pendingTimerCount() {
  lock_guard<std::mutex> guard(queueMutex);
  return timers.size();
}

void TaskLoop::stop() {
  {
    lock_guard<std::mutex> guard(queueMutex);
    if (stopping && !loopThread) {
      return;
    }
    stopping = true;
    tasks.clear();
    timers.clear();
    queueCv.notify_all();
  }
  if (loopThread) {
    if (isLoopThread()) {
      // Stopped from one of our own tasks, the thread exits by itself.
      loopThread->detach();
    } else if (loopThread->joinable()) {
      loopThread->join();
    }
    loopThread.reset();
  }
}

void TaskLoop::run() {
  std::unique_lock<std::mutex> lock(queueMutex);
  while (!stopping) {
    auto now = std::chrono::steady_clock::now();
    while (!timers.empty() && timers.begin()->first <= now) {
      tasks.push_back(std::move(timers.begin()->second.task));
      timers.erase(timers.begin());
    }

    if (tasks.empty()) {
      if (timers.empty()) {
        queueCv.wait(lock);
      } else {
        queueCv.wait_until(lock, timers.begin()->first);
      }
      continue;
    }

    auto task = std::move(tasks.front());
    tasks.pop_front();
    lock.unlock();
    try {
      task();
    } catch (const std::exception& e) {
      STERROR << name << ": task failed: " << e.what();
    }
    lock.lock();
  }
}
}  // namespace oc
