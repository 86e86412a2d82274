#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "callscribe/v1/call.pb.h"

namespace callscribe::continuity {

/*
  Thread-safe blocking queue of work units waiting for a worker.
*/
class WorkUnitScheduler {
 public:
  // false once Shutdown() has been called
  bool Enqueue(const callscribe::v1::WorkUnitDescriptor& descriptor);

  // blocking wait
  std::optional<callscribe::v1::WorkUnitDescriptor> Dequeue();

  void Shutdown();

  std::size_t Depth() const;

 private:
  mutable std::mutex                                mutex_;
  std::condition_variable                           cv_;
  std::queue<callscribe::v1::WorkUnitDescriptor>    queue_;
  bool                                              shutdown_ = false;
};

} // namespace callscribe::continuity
