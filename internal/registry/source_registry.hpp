#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/audio/audio_types.hpp"

namespace callscribe::registry {

struct ChannelSources {
  std::optional<std::string> caller;
  std::optional<std::string> agent;

  bool Complete() const {
    return caller.has_value() && agent.has_value();
  }
};

/*
  Lookup store where each party's media source is registered, possibly by
  independent events racing with the start of the call.
*/
class SourceRegistry {
 public:
  virtual ~SourceRegistry() = default;

  virtual ChannelSources Query(const std::string& call_id) = 0;

  // Re-registering a channel replaces its source.
  virtual void Register(const std::string& call_id, audio::Channel channel, const std::string& source_id) = 0;
};

struct ResolveOptions {
  std::uint32_t             attempts = 100;
  std::chrono::milliseconds backoff{100};
};

// Polls until both sources are known; throws util::NotFound once attempts run out
// or `stop` is raised between lookups.
ChannelSources ResolveSources(SourceRegistry& registry, const std::string& call_id, const ResolveOptions& options,
                              const std::atomic<bool>* stop = nullptr);

} // namespace callscribe::registry
