#include "work_unit_scheduler.hpp"

namespace callscribe::continuity {

bool WorkUnitScheduler::Enqueue(const callscribe::v1::WorkUnitDescriptor& descriptor) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(descriptor);
  }
  cv_.notify_one();
  return true;
}

std::optional<callscribe::v1::WorkUnitDescriptor> WorkUnitScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  callscribe::v1::WorkUnitDescriptor descriptor = std::move(queue_.front());
  queue_.pop();
  return descriptor;
}

void WorkUnitScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t WorkUnitScheduler::Depth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace callscribe::continuity
