#pragma once

#include <memory>

#include "callscribe/v1/call.pb.h"
#include "work_unit_scheduler.hpp"

namespace callscribe::continuity {

/*
  Hands a work unit to whatever runs it next. Returns once the unit is
  accepted; it runs asynchronously.
*/
class WorkUnitLauncher {
 public:
  virtual ~WorkUnitLauncher() = default;

  // Throws when the unit could not be handed off.
  virtual void InvokeAsync(const callscribe::v1::WorkUnitDescriptor& descriptor) = 0;
};

// Same-process hand-off through the worker pool queue.
class LocalLauncher final : public WorkUnitLauncher {
 public:
  explicit LocalLauncher(std::shared_ptr<WorkUnitScheduler> scheduler);

  void InvokeAsync(const callscribe::v1::WorkUnitDescriptor& descriptor) override;

 private:
  std::shared_ptr<WorkUnitScheduler> scheduler_;
};

} // namespace callscribe::continuity
