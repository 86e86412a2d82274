#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "callscribe/v1/call.pb.h"
#include "config/config.pb.h"
#include "internal/events/event_sink.hpp"
#include "internal/hooks/customization_hook.hpp"
#include "internal/media/demuxer.hpp"
#include "internal/media/media_source.hpp"
#include "internal/recording/recording_finalizer.hpp"
#include "internal/registry/source_registry.hpp"
#include "internal/speech/speech_client.hpp"
#include "launcher.hpp"
#include "work_unit_state.hpp"

namespace callscribe::continuity {

struct ControllerOptions {
  // channel, resume marker and sibling are filled in per work unit
  media::DemuxerOptions demuxer;

  std::uint32_t             sample_rate_hz          = 8000;
  std::uint32_t             interleave_period_ms    = 100;
  std::uint32_t             max_gap_ms              = 5000;
  std::size_t               channel_buffer_capacity = 256;
  std::size_t               audio_pipe_capacity     = 64;
  std::chrono::milliseconds push_timeout{500};
  std::chrono::milliseconds keep_alive_interval{10000};

  callscribe::runtime::config::SpeechConfig speech;
  registry::ResolveOptions                  resolve;

  std::chrono::milliseconds time_budget{900000};
  std::chrono::milliseconds safety_margin{180000};
  std::uint32_t             max_work_units = 30;
};

ControllerOptions BuildControllerOptions(const callscribe::runtime::config::RuntimeConfig& config);

// True unless the session explicitly turned recording off.
bool RecordingEnabled(const callscribe::v1::CallSession& session);

struct ContinuityDeps {
  std::shared_ptr<media::MediaSource>            media;
  std::shared_ptr<registry::SourceRegistry>      registry;
  std::shared_ptr<hooks::CustomizationHook>      hook;  // optional
  std::shared_ptr<speech::SpeechClient>          speech;
  std::shared_ptr<events::EventSink>             sink;
  std::shared_ptr<recording::RecordingFinalizer> recording;
  std::shared_ptr<WorkUnitLauncher>              launcher;
};

struct WorkUnitOutcome {
  WorkUnitState state = WorkUnitState::kStarting;
  // state the unit left STREAMING (or STARTING) through
  WorkUnitState exit_state         = WorkUnitState::kStarting;
  bool          continuation       = false;
  bool          successor_launched = false;
  bool          policy_exit        = false;
  bool          runaway            = false;
  std::string   error;

  // The session as this unit leaves it: the successor's starting point.
  callscribe::v1::CallSession checkpoint;
};

/*
  Runs one bounded work unit of a call:

      STARTING -> STREAMING -> (TIME_BUDGET_REACHED | SOURCE_CLOSED | ERROR) -> FINALIZING -> DONE

  A unit that reaches its time budget hands the checkpointed CallSession to a
  successor through the launcher. A unit whose sources close ends the call:
  END event, recording merge, recording URL event. Any unrecoverable failure
  yields exactly one ERROR event.
*/
class ContinuityController {
 public:
  ContinuityController(ControllerOptions options, ContinuityDeps deps);

  // Throws std::invalid_argument for a malformed descriptor; everything else is an outcome.
  WorkUnitOutcome Execute(const callscribe::v1::WorkUnitDescriptor& descriptor);

  const ControllerOptions& Options() const {
    return options_;
  }

 private:
  struct Run;

  bool Prepare(Run& run);
  void Stream(Run& run);
  void Finalize(Run& run);
  void EnterError(Run& run, const std::string& message);
  void Transition(Run& run, WorkUnitState to);

  ControllerOptions options_;
  ContinuityDeps    deps_;
};

} // namespace callscribe::continuity
