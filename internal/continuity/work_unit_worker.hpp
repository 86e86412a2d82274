#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "continuity_controller.hpp"
#include "work_unit_scheduler.hpp"

namespace callscribe::continuity {

/*
  Background worker that executes queued work units, one at a time.
*/
class WorkUnitWorker {
 public:
  WorkUnitWorker(std::shared_ptr<WorkUnitScheduler> scheduler, std::shared_ptr<ContinuityController> controller);
  ~WorkUnitWorker();

  void Start();

  // Shuts the queue down and waits for the current unit to finish.
  void Stop();

  std::uint64_t Executed() const {
    return executed_;
  }

 private:
  void Run();

  std::shared_ptr<WorkUnitScheduler>    scheduler_;
  std::shared_ptr<ContinuityController> controller_;

  std::thread                thread_;
  std::atomic<bool>          running_{false};
  std::atomic<std::uint64_t> executed_{0};
};

} // namespace callscribe::continuity
