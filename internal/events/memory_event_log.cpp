#include "memory_event_log.hpp"

namespace callscribe::events {

void MemoryEventLog::Append(const std::string& partition_key, const std::string& record) {
  std::lock_guard lock(mutex_);
  records_.emplace_back(partition_key, record);
}

std::vector<std::string> MemoryEventLog::ReadPartition(const std::string& partition_key) {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> out;
  for (const auto& [key, record] : records_) {
    if (key == partition_key) out.push_back(record);
  }
  return out;
}

std::size_t MemoryEventLog::Size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

} // namespace callscribe::events
