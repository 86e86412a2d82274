#pragma once

#include <string>
#include <vector>

namespace callscribe::events {

/*
  Append-only, ordered event log partitioned by call id.
*/
class EventLog {
 public:
  virtual ~EventLog() = default;

  // Throws on failure; callers decide whether that matters.
  virtual void Append(const std::string& partition_key, const std::string& record) = 0;

  // Records of one partition in append order.
  virtual std::vector<std::string> ReadPartition(const std::string& partition_key) = 0;
};

} // namespace callscribe::events
