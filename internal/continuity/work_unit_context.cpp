#include "work_unit_context.hpp"

#include "internal/observability/logging.hpp"

namespace callscribe::continuity {

WorkUnitContext::~WorkUnitContext() {
  Disarm();
}

void WorkUnitContext::ArmDeadline(std::chrono::milliseconds after) {
  Disarm();
  {
    std::lock_guard lock(mutex_);
    disarmed_ = false;
  }

  timer_ = std::thread([this, deadline = std::chrono::steady_clock::now() + after] {
    std::unique_lock lock(mutex_);
    if (cv_.wait_until(lock, deadline, [this] { return disarmed_; })) return;
    lock.unlock();

    deadline_reached_ = true;
    CALLSCRIBE_LOG_INFO("Work unit deadline reached, stopping at the next fragment boundary");
    RequestStop();
  });
}

void WorkUnitContext::Disarm() {
  {
    std::lock_guard lock(mutex_);
    disarmed_ = true;
  }
  cv_.notify_all();
  if (timer_.joinable()) timer_.join();
}

void WorkUnitContext::RequestStop() {
  stop_ = true;
}

void WorkUnitContext::Fail(const std::string& reason) {
  {
    std::lock_guard lock(mutex_);
    if (failure_.empty()) failure_ = reason;
  }
  abort_ = true;
  stop_  = true;
}

std::string WorkUnitContext::FailureReason() const {
  std::lock_guard lock(mutex_);
  return failure_;
}

} // namespace callscribe::continuity
