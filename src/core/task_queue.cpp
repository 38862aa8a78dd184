#include "cosmos/core/task_queue.h"

#include <utility>

namespace cosmos {

void TaskQueue::defer(std::function<void()> task) {
  if (!task) return;
  tasks_.push_back(std::move(task));
}

std::size_t TaskQueue::run_pending() {
  std::size_t ran = 0;
  while (!tasks_.empty()) {
    std::function<void()> task = std::move(tasks_.front());
    tasks_.pop_front();
    task();
    ++ran;
  }
  return ran;
}

} // namespace cosmos
