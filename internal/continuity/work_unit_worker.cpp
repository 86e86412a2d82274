#include "work_unit_worker.hpp"

#include "internal/observability/logging.hpp"

namespace callscribe::continuity {

using observability::IntField;
using observability::StringField;

WorkUnitWorker::WorkUnitWorker(std::shared_ptr<WorkUnitScheduler> scheduler, std::shared_ptr<ContinuityController> controller)
    : scheduler_(std::move(scheduler)), controller_(std::move(controller)) {
}

WorkUnitWorker::~WorkUnitWorker() {
  Stop();
}

void WorkUnitWorker::Start() {
  running_ = true;
  thread_  = std::thread(&WorkUnitWorker::Run, this);
}

void WorkUnitWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void WorkUnitWorker::Run() {
  while (running_) {
    auto descriptor = scheduler_->Dequeue();
    if (!descriptor) break;

    try {
      controller_->Execute(*descriptor);
    } catch (const std::exception& e) {
      CALLSCRIBE_LOG_ERROR("Work unit execution failed", {StringField("call_id", descriptor->session().call_id()),
                                                          IntField("sequence", descriptor->session().work_unit_sequence()),
                                                          StringField("error", e.what())});
    }
    ++executed_;
  }
}

} // namespace callscribe::continuity
