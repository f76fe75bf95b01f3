#pragma once

#include <functional>
#include <utility>

#include "internal/util/errors.hpp"

namespace settleup::util {

/*
  OptimisticUpdate = snapshot + speculative apply.

  Construction reads the current value, applies the change to a copy and
  writes it back, so readers see the new value immediately. The remote
  write is issued by the caller; its outcome decides between Commit() and
  Rollback().

  Semantics:
  - Commit() keeps the applied value and drops the snapshot
  - Rollback() writes the snapshot back, or with an undo function writes
    undo(snapshot, applied, current) so only this update's delta is reverted
  - Destructor rolls back if neither was called
  - Callers serialize access to the underlying state themselves

  The reader/writer form addresses state that can move between apply and
  settle (an entry of a keyed cache); the reference form is for a value
  that outlives the update.
*/
template <typename State>
class OptimisticUpdate {
 public:
  using Reader = std::function<State()>;
  using Writer = std::function<void(State)>;
  using Undo   = std::function<State(const State& snapshot, const State& applied, State current)>;

  template <typename Apply>
  OptimisticUpdate(Reader read, Writer write, Apply&& apply, Undo undo = nullptr)
      : read_(std::move(read)), write_(std::move(write)), undo_(std::move(undo)), snapshot_(read_()), applied_(snapshot_) {
    std::forward<Apply>(apply)(applied_);
    write_(applied_);
  }

  template <typename Apply>
  OptimisticUpdate(State& target, Apply&& apply)
      : OptimisticUpdate([&target] { return target; }, [&target](State value) { target = std::move(value); }, std::forward<Apply>(apply)) {
  }

  OptimisticUpdate(const OptimisticUpdate&)            = delete;
  OptimisticUpdate& operator=(const OptimisticUpdate&) = delete;

  ~OptimisticUpdate() {
    if (!settled_) Rollback();
  }

  void Commit() {
    if (settled_) throw InvalidState("optimistic update already settled");
    settled_ = true;
  }

  void Rollback() {
    if (settled_) throw InvalidState("optimistic update already settled");
    settled_ = true;
    if (undo_) {
      write_(undo_(snapshot_, applied_, read_()));
      return;
    }
    write_(snapshot_);
  }

  bool IsSettled() const {
    return settled_;
  }

  const State& Snapshot() const {
    return snapshot_;
  }

  const State& Applied() const {
    return applied_;
  }

 private:
  Reader read_;
  Writer write_;
  Undo   undo_;
  State  snapshot_;
  State  applied_;
  bool   settled_ = false;
};

} // namespace settleup::util
