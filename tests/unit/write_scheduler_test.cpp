#include "internal/writeback/write_scheduler.hpp"
#include "internal/writeback/write_worker.hpp"

#include <cassert>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using settleup::writeback::WriteScheduler;
using settleup::writeback::WriteTask;
using settleup::writeback::WriteWorker;

WriteTask MakeTask(const std::string& expense_id, std::function<void()> run) {
  WriteTask task;
  task.operation  = "test";
  task.expense_id = expense_id;
  task.run        = std::move(run);
  return task;
}

void TestFifoOrderAndDrainOnShutdown() {
  WriteScheduler scheduler;
  assert(scheduler.Enqueue(MakeTask("e1", [] {})));
  assert(scheduler.Enqueue(MakeTask("e2", [] {})));
  assert(scheduler.Pending() == 2);

  scheduler.Shutdown();
  assert(!scheduler.Enqueue(MakeTask("e3", [] {})));

  auto first = scheduler.Dequeue();
  assert(first && first->expense_id == "e1");
  auto second = scheduler.Dequeue();
  assert(second && second->expense_id == "e2");
  assert(!scheduler.Dequeue().has_value());
}

void TestWorkerRunsTasksInOrder() {
  auto        scheduler = std::make_shared<WriteScheduler>();
  WriteWorker worker(scheduler);
  worker.Start();

  std::vector<int>   order;
  std::promise<void> done;
  auto               finished = done.get_future();

  for (int i = 0; i < 5; ++i) {
    const bool queued = scheduler->Enqueue(MakeTask("e", [&order, i] { order.push_back(i); }));
    assert(queued);
  }
  assert(scheduler->Enqueue(MakeTask("marker", [&done] { done.set_value(); })));

  finished.wait();
  assert((order == std::vector<int>{0, 1, 2, 3, 4}));
  worker.Stop();
}

void TestWorkerSurvivesThrowingTask() {
  auto        scheduler = std::make_shared<WriteScheduler>();
  WriteWorker worker(scheduler);
  worker.Start();

  std::promise<void> done;
  auto               finished = done.get_future();

  assert(scheduler->Enqueue(MakeTask("bad", [] { throw std::runtime_error("boom"); })));
  assert(scheduler->Enqueue(MakeTask("good", [&done] { done.set_value(); })));

  finished.wait();
  worker.Stop();
}

} // namespace

int main() {
  TestFifoOrderAndDrainOnShutdown();
  TestWorkerRunsTasksInOrder();
  TestWorkerSurvivesThrowingTask();

  std::cout << "settleup_unit_write_scheduler: pass\n";
  return 0;
}
