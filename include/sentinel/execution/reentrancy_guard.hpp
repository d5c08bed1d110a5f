#pragma once

#include <atomic>
#include <thread>

namespace sentinel::execution {

/// Marks the thread currently running a custody payout so the engine can
/// reject calls that loop back into it from a transfer hook.
class reentrancy_guard final {
 public:
  class scope final {
   public:
    explicit scope(reentrancy_guard& guard);
    ~scope();
    scope(const scope&) = delete;
    scope& operator=(const scope&) = delete;

   private:
    reentrancy_guard& guard_;
  };

  bool held_by_current_thread() const;

 private:
  std::atomic<std::thread::id> owner_{};
};

}  // namespace sentinel::execution
