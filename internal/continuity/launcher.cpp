#include "launcher.hpp"

#include "internal/util/errors.hpp"

namespace callscribe::continuity {

LocalLauncher::LocalLauncher(std::shared_ptr<WorkUnitScheduler> scheduler) : scheduler_(std::move(scheduler)) {
}

void LocalLauncher::InvokeAsync(const callscribe::v1::WorkUnitDescriptor& descriptor) {
  if (!scheduler_->Enqueue(descriptor)) {
    throw util::InvalidState("work unit queue is shut down");
  }
}

} // namespace callscribe::continuity
