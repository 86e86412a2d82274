#include "source_registry.hpp"

#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace callscribe::registry {

using observability::IntField;
using observability::StringField;

ChannelSources ResolveSources(SourceRegistry& registry, const std::string& call_id, const ResolveOptions& options,
                              const std::atomic<bool>* stop) {
  const std::uint32_t attempts = options.attempts == 0 ? 1 : options.attempts;

  ChannelSources sources;
  std::uint32_t  lookups = 0;
  for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
    lookups = attempt;
    try {
      sources = registry.Query(call_id);
    } catch (const std::exception& e) {
      CALLSCRIBE_LOG_WARN("Source registry query failed", {StringField("call_id", call_id), IntField("attempt", attempt),
                                                           StringField("error", e.what())});
    }
    if (sources.Complete()) {
      CALLSCRIBE_LOG_INFO("Channel sources resolved", {StringField("call_id", call_id), StringField("caller", *sources.caller),
                                                       StringField("agent", *sources.agent), IntField("attempts", attempt)});
      return sources;
    }
    if (stop != nullptr && *stop) break;
    if (attempt < attempts) std::this_thread::sleep_for(options.backoff);
  }

  throw util::NotFound("channel sources for call " + call_id + " not registered after " + std::to_string(lookups) + " lookups" +
                       (sources.caller ? "" : " (caller missing)") + (sources.agent ? "" : " (agent missing)"));
}

} // namespace callscribe::registry
