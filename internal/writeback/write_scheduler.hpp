#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "write_task.hpp"

namespace settleup::writeback {

/*
  Thread-safe blocking FIFO of store writes.

  FIFO order keeps writes to the same expense in submission order.
*/
class WriteScheduler {
 public:
  // Returns false once Shutdown() was called; the task is not queued.
  bool Enqueue(WriteTask task);

  // blocking wait; nullopt after shutdown once the queue is drained
  std::optional<WriteTask> Dequeue();

  void Shutdown();

  std::size_t Pending() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<WriteTask>   queue_;
  bool                    shutdown_ = false;
};

} // namespace settleup::writeback
