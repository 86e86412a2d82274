#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace callscribe::continuity {

/*
  Per-work-unit shared state handed by reference to every task of the unit.

  stop:  the deadline fired; demuxers finish the current fragment and end.
  abort: an unrecoverable failure; every task winds down immediately.

  The deadline timer thread is joined on destruction.
*/
class WorkUnitContext {
 public:
  WorkUnitContext() = default;
  ~WorkUnitContext();

  WorkUnitContext(const WorkUnitContext&)            = delete;
  WorkUnitContext& operator=(const WorkUnitContext&) = delete;

  // Starts the timer; RequestStop() runs when it expires.
  void ArmDeadline(std::chrono::milliseconds after);
  void Disarm();

  void RequestStop();

  // Records the first failure and aborts every task.
  void Fail(const std::string& reason);

  const std::atomic<bool>& StopFlag() const {
    return stop_;
  }

  const std::atomic<bool>& AbortFlag() const {
    return abort_;
  }

  bool DeadlineReached() const {
    return deadline_reached_;
  }

  bool Failed() const {
    return abort_;
  }

  std::string FailureReason() const;

 private:
  std::atomic<bool> stop_{false};
  std::atomic<bool> abort_{false};
  std::atomic<bool> deadline_reached_{false};

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    disarmed_ = false;
  std::string             failure_;
  std::thread             timer_;
};

} // namespace callscribe::continuity
