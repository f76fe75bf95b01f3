#include "write_scheduler.hpp"

namespace settleup::writeback {

bool WriteScheduler::Enqueue(WriteTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<WriteTask> WriteScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  WriteTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void WriteScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t WriteScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace settleup::writeback
