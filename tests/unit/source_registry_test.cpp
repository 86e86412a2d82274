#include "internal/registry/source_registry.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/registry/memory_source_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using callscribe::audio::Channel;
using callscribe::registry::ChannelSources;
using callscribe::registry::MemorySourceRegistry;
using callscribe::registry::ResolveOptions;
using callscribe::registry::ResolveSources;
using std::chrono::milliseconds;

// Fails the first few lookups the way a throttled store does.
class FlakyRegistry final : public callscribe::registry::SourceRegistry {
 public:
  explicit FlakyRegistry(int failures) : failures_(failures) {
  }

  ChannelSources Query(const std::string& call_id) override {
    ++queries;
    if (failures_-- > 0) throw std::runtime_error("throttled");
    return inner_.Query(call_id);
  }

  void Register(const std::string& call_id, Channel channel, const std::string& source_id) override {
    inner_.Register(call_id, channel, source_id);
  }

  int queries = 0;

 private:
  int                  failures_;
  MemorySourceRegistry inner_;
};

void TestRegisterAndQuery() {
  MemorySourceRegistry registry;
  assert(!registry.Query("call-1").caller.has_value());

  registry.Register("call-1", Channel::kCaller, "stream-a");
  auto sources = registry.Query("call-1");
  assert(sources.caller == std::string("stream-a"));
  assert(!sources.Complete());

  registry.Register("call-1", Channel::kAgent, "stream-b");
  registry.Register("call-1", Channel::kCaller, "stream-c");
  sources = registry.Query("call-1");
  assert(sources.Complete());
  assert(*sources.caller == "stream-c");
  assert(*sources.agent == "stream-b");
  assert(!registry.Query("call-2").Complete());
}

void TestResolveWaitsForLateRegistration() {
  MemorySourceRegistry registry;
  registry.Register("call-1", Channel::kCaller, "stream-a");

  std::thread late([&] {
    std::this_thread::sleep_for(milliseconds(30));
    registry.Register("call-1", Channel::kAgent, "stream-b");
  });

  const auto sources = ResolveSources(registry, "call-1", ResolveOptions{50, milliseconds(5)});
  late.join();
  assert(*sources.agent == "stream-b");
}

void TestResolveSurvivesQueryFailures() {
  FlakyRegistry registry(2);
  registry.Register("call-1", Channel::kCaller, "a");
  registry.Register("call-1", Channel::kAgent, "b");

  const auto sources = ResolveSources(registry, "call-1", ResolveOptions{5, milliseconds(1)});
  assert(sources.Complete());
  assert(registry.queries == 3);
}

void TestResolveGivesUp() {
  MemorySourceRegistry registry;
  registry.Register("call-1", Channel::kCaller, "a");

  bool threw = false;
  try {
    (void)ResolveSources(registry, "call-1", ResolveOptions{3, milliseconds(1)});
  } catch (const callscribe::util::NotFound& e) {
    threw = std::string(e.what()).find("agent missing") != std::string::npos;
  }
  assert(threw);
}

void TestResolveStopsWhenRaised() {
  FlakyRegistry registry(0);
  registry.Register("call-1", Channel::kCaller, "a");

  std::atomic<bool> stop{false};
  std::thread       raise([&] {
    std::this_thread::sleep_for(milliseconds(20));
    stop = true;
  });

  const auto started = std::chrono::steady_clock::now();
  bool       threw   = false;
  try {
    (void)ResolveSources(registry, "call-1", ResolveOptions{100000, milliseconds(1)}, &stop);
  } catch (const callscribe::util::NotFound&) {
    threw = true;
  }
  raise.join();
  assert(threw);
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
  assert(registry.queries < 100000);
}

} // namespace

int main() {
  TestRegisterAndQuery();
  TestResolveWaitsForLateRegistration();
  TestResolveSurvivesQueryFailures();
  TestResolveGivesUp();
  TestResolveStopsWhenRaised();

  std::cout << "callscribe_unit_source_registry: pass\n";
  return 0;
}
