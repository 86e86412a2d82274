#include "memory_source_registry.hpp"

namespace callscribe::registry {

ChannelSources MemorySourceRegistry::Query(const std::string& call_id) {
  std::lock_guard lock(mutex_);
  auto            it = sources_.find(call_id);
  return it == sources_.end() ? ChannelSources{} : it->second;
}

void MemorySourceRegistry::Register(const std::string& call_id, audio::Channel channel, const std::string& source_id) {
  std::lock_guard lock(mutex_);
  auto&           entry = sources_[call_id];
  if (channel == audio::Channel::kCaller) {
    entry.caller = source_id;
  } else {
    entry.agent = source_id;
  }
}

} // namespace callscribe::registry
