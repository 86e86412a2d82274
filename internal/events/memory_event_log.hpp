#pragma once

#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "event_log.hpp"

namespace callscribe::events {

class MemoryEventLog final : public EventLog {
 public:
  void                     Append(const std::string& partition_key, const std::string& record) override;
  std::vector<std::string> ReadPartition(const std::string& partition_key) override;

  std::size_t Size() const;

 private:
  mutable std::mutex                               mutex_;
  std::vector<std::pair<std::string, std::string>> records_;
};

} // namespace callscribe::events
