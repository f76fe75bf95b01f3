#pragma once

#include <functional>
#include <string>

namespace settleup::writeback {

/*
  A queued remote write.

  `run` performs the store call and settles the optimistic update that
  produced it; it reports its own failures through the caller's future.
*/
struct WriteTask {
  std::string           operation;
  std::string           expense_id;
  std::function<void()> run;
};

} // namespace settleup::writeback
