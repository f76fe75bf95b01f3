#include "write_worker.hpp"

#include "internal/observability/logging.hpp"

namespace settleup::writeback {

using observability::StringField;

WriteWorker::WriteWorker(std::shared_ptr<WriteScheduler> scheduler) : scheduler_(std::move(scheduler)) {
}

WriteWorker::~WriteWorker() {
  Stop();
}

void WriteWorker::Start() {
  if (thread_.joinable()) return;
  thread_ = std::thread(&WriteWorker::Run, this);
}

void WriteWorker::Stop() {
  scheduler_->Shutdown();
  if (thread_.joinable()) thread_.join();
}

void WriteWorker::Run() {
  while (auto task = scheduler_->Dequeue()) {
    try {
      task->run();
    } catch (const std::exception& e) {
      // Tasks settle their own futures; anything escaping is a bug in the task.
      SETTLEUP_LOG_ERROR("Write task escaped with error",
                         {StringField("operation", task->operation), StringField("expense_id", task->expense_id), StringField("error", e.what())});
    }
  }
}

} // namespace settleup::writeback
