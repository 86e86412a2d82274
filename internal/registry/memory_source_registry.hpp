#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "source_registry.hpp"

namespace callscribe::registry {

class MemorySourceRegistry final : public SourceRegistry {
 public:
  ChannelSources Query(const std::string& call_id) override;
  void           Register(const std::string& call_id, audio::Channel channel, const std::string& source_id) override;

 private:
  std::mutex                                      mutex_;
  std::unordered_map<std::string, ChannelSources> sources_;
};

} // namespace callscribe::registry
