#include <sentinel/execution/reentrancy_guard.hpp>

namespace sentinel::execution {

reentrancy_guard::scope::scope(reentrancy_guard& guard) : guard_(guard) {
  guard_.owner_.store(std::this_thread::get_id());
}

reentrancy_guard::scope::~scope() {
  guard_.owner_.store(std::thread::id{});
}

bool reentrancy_guard::held_by_current_thread() const {
  return owner_.load() == std::this_thread::get_id();
}

}  // namespace sentinel::execution
