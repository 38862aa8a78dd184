#pragma once

#include <cstddef>
#include <deque>
#include <functional>

namespace cosmos {

// Accepts work to run after the current burst of synchronous calls.
class TaskScheduler {
 public:
  virtual ~TaskScheduler() = default;
  virtual void defer(std::function<void()> task) = 0;
};

// Single-threaded FIFO scheduler. Nothing runs until run_pending() is called.
class TaskQueue : public TaskScheduler {
 public:
  TaskQueue() = default;
  TaskQueue(const TaskQueue&) = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;

  void defer(std::function<void()> task) override;

  // Runs tasks until the queue is empty, including tasks deferred by the
  // tasks themselves. An exception thrown by a task propagates to the caller;
  // the throwing task is dropped and the remaining tasks stay queued.
  //
  // Returns the number of tasks that completed.
  std::size_t run_pending();

  std::size_t size() const { return tasks_.size(); }
  bool empty() const { return tasks_.empty(); }

 private:
  std::deque<std::function<void()>> tasks_;
};

} // namespace cosmos
