#pragma once

#include <memory>
#include <thread>

#include "write_scheduler.hpp"

namespace settleup::writeback {

/*
  Background thread draining a WriteScheduler.

  Stop() lets queued writes finish before joining, so no optimistic
  update is left unsettled.
*/
class WriteWorker {
 public:
  explicit WriteWorker(std::shared_ptr<WriteScheduler> scheduler);
  ~WriteWorker();

  WriteWorker(const WriteWorker&)            = delete;
  WriteWorker& operator=(const WriteWorker&) = delete;

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<WriteScheduler> scheduler_;
  std::thread                     thread_;
};

} // namespace settleup::writeback
