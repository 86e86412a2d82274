#include "continuity_controller.hpp"

#include <array>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <thread>

#include "internal/audio/audio_fanout.hpp"
#include "internal/audio/channel_buffer.hpp"
#include "internal/audio/keep_alive.hpp"
#include "internal/audio/synchronizer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/speech/session_driver.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "work_unit_context.hpp"

namespace callscribe::continuity {

using callscribe::v1::CallSession;
using callscribe::v1::WorkUnitDescriptor;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

struct ContinuityController::Run {
  callscribe::v1::WorkUnitAction         action = callscribe::v1::WORK_UNIT_ACTION_UNSPECIFIED;
  CallSession                            session;
  WorkUnitState                          state = WorkUnitState::kStarting;
  WorkUnitOutcome                        outcome;
  bool                                   errored           = false;
  bool                                   recording_started = false;
  std::unique_ptr<speech::SessionDriver> driver;
  // armed on entry; STARTING spends the same budget as STREAMING
  WorkUnitContext context;
};

namespace {

void LogTimestampDelta(audio::Channel channel, const media::StreamTimestamps& ts) {
  if (!ts.producer || !ts.server) return;
  const auto delta_ms = static_cast<int64_t>(std::llround((*ts.server - *ts.producer) * 1000.0));
  CALLSCRIBE_LOG_INFO("Producer to server delay", {StringField("channel", audio::ToString(channel)), IntField("delta_ms", delta_ms)});
}

} // namespace

ControllerOptions BuildControllerOptions(const callscribe::runtime::config::RuntimeConfig& config) {
  ControllerOptions options;

  const auto& media                    = config.media();
  options.demuxer.fragment_tag_name    = media.fragment_tag_name();
  options.demuxer.read_chunk_bytes     = media.read_chunk_bytes();
  options.demuxer.poll_interval        = std::chrono::milliseconds(media.poll_interval_ms());
  options.demuxer.inactivity_timeout   = std::chrono::milliseconds(media.inactivity_timeout_ms());
  options.demuxer.max_element_bytes    = media.max_element_bytes();
  for (const auto& [track, role] : media.track_roles()) {
    options.demuxer.track_roles[track] = role == "agent" ? audio::Channel::kAgent : audio::Channel::kCaller;
  }

  const auto& audio               = config.audio();
  options.sample_rate_hz          = audio.sample_rate_hz();
  options.interleave_period_ms    = audio.interleave_period_ms();
  options.max_gap_ms              = audio.max_gap_ms();
  options.channel_buffer_capacity = audio.channel_buffer_capacity();
  options.audio_pipe_capacity     = audio.audio_pipe_capacity();
  options.push_timeout            = std::chrono::milliseconds(audio.pipe_push_timeout_ms());
  options.keep_alive_interval     = std::chrono::milliseconds(audio.keep_alive_interval_ms());

  options.speech           = config.speech();
  options.resolve.attempts = config.registry().lookup_attempts();
  options.resolve.backoff  = std::chrono::milliseconds(config.registry().lookup_backoff_ms());

  options.time_budget    = std::chrono::milliseconds(config.work_unit().time_budget_ms());
  options.safety_margin  = std::chrono::milliseconds(config.work_unit().safety_margin_ms());
  options.max_work_units = config.work_unit().max_work_units();
  return options;
}

bool RecordingEnabled(const CallSession& session) {
  return !session.has_should_record() || session.should_record().value();
}

ContinuityController::ContinuityController(ControllerOptions options, ContinuityDeps deps)
    : options_(std::move(options)), deps_(std::move(deps)) {
  if (!deps_.media || !deps_.registry || !deps_.speech || !deps_.sink || !deps_.recording || !deps_.launcher) {
    throw std::invalid_argument("continuity controller is missing a collaborator");
  }
}

WorkUnitOutcome ContinuityController::Execute(const WorkUnitDescriptor& descriptor) {
  const auto action = descriptor.action();
  if (action != callscribe::v1::WORK_UNIT_ACTION_START && action != callscribe::v1::WORK_UNIT_ACTION_CONTINUE) {
    throw std::invalid_argument("work unit action must be START or CONTINUE");
  }
  if (descriptor.session().call_id().empty()) {
    throw std::invalid_argument("work unit without call_id");
  }

  Run run;
  run.action  = action;
  run.session = descriptor.session();

  if (action == callscribe::v1::WORK_UNIT_ACTION_START) {
    if (run.session.work_unit_sequence() == 0) run.session.set_work_unit_sequence(1);
    if (!run.session.has_streaming_start_time()) *run.session.mutable_streaming_start_time() = util::ToProto(util::Now());
  } else if (run.session.work_unit_sequence() == 0) {
    throw std::invalid_argument("continuation without work_unit_sequence");
  }

  const auto sequence = run.session.work_unit_sequence();
  if (sequence > options_.max_work_units) {
    CALLSCRIBE_LOG_ERROR("Work unit cap exceeded, call abandoned without relaunch",
                         {StringField("call_id", run.session.call_id()), IntField("sequence", sequence),
                          IntField("max_work_units", options_.max_work_units)});
    run.outcome.runaway = true;
    run.outcome.error   = "work unit cap exceeded";
    Transition(run, WorkUnitState::kDone);
    run.outcome.state      = run.state;
    run.outcome.checkpoint = run.session;
    return run.outcome;
  }

  CALLSCRIBE_LOG_INFO("Work unit started", {StringField("call_id", run.session.call_id()), IntField("sequence", sequence),
                                            BoolField("continuation", action == callscribe::v1::WORK_UNIT_ACTION_CONTINUE)});

  run.context.ArmDeadline(options_.time_budget - options_.safety_margin);
  if (Prepare(run)) {
    Stream(run);
  }
  run.context.Disarm();
  if (!run.outcome.policy_exit) {
    Finalize(run);
  }
  Transition(run, WorkUnitState::kDone);

  run.outcome.state = run.state;
  if (!run.outcome.successor_launched) {
    run.outcome.checkpoint = run.session;
  }
  CALLSCRIBE_LOG_INFO("Work unit done", {StringField("call_id", run.session.call_id()), IntField("sequence", sequence),
                                         StringField("exit_state", ToString(run.outcome.exit_state)),
                                         BoolField("successor_launched", run.outcome.successor_launched)});
  return run.outcome;
}

/*
  STARTING: resolve sources, consult the hook, announce the call, open the
  recognition session. false when the unit must not stream.
*/
bool ContinuityController::Prepare(Run& run) {
  auto&      session = run.session;
  const bool first   = run.action == callscribe::v1::WORK_UNIT_ACTION_START;

  if (session.caller_source_id().empty() || session.agent_source_id().empty()) {
    try {
      auto sources = registry::ResolveSources(*deps_.registry, session.call_id(), options_.resolve, &run.context.StopFlag());
      if (session.caller_source_id().empty()) session.set_caller_source_id(*sources.caller);
      if (session.agent_source_id().empty()) session.set_agent_source_id(*sources.agent);
    } catch (const std::exception& e) {
      EnterError(run, run.context.DeadlineReached() ? std::string("time budget exhausted while resolving sources: ") + e.what()
                                                    : std::string(e.what()));
      return false;
    }
  }

  if (first && deps_.hook) {
    hooks::HookDecision decision;
    try {
      decision = hooks::ApplyHookResponse(deps_.hook->OnCallStart(session), &session);
    } catch (const util::PolicyRejected& e) {
      decision.should_process = false;
      CALLSCRIBE_LOG_WARN("Customization hook rejected the call", {StringField("call_id", session.call_id()), StringField("error", e.what())});
    } catch (const std::exception& e) {
      EnterError(run, std::string("customization hook failed: ") + e.what());
      return false;
    }

    if (!decision.should_process) {
      CALLSCRIBE_LOG_INFO("Call not processed by customization hook decision", {StringField("call_id", session.call_id())});
      run.outcome.policy_exit = true;
      return false;
    }
    if (decision.swapped_roles) {
      CALLSCRIBE_LOG_INFO("Channel roles swapped by customization hook",
                          {StringField("call_id", session.call_id()), StringField("caller_source", session.caller_source_id()),
                           StringField("agent_source", session.agent_source_id())});
    }
  }

  if (run.context.DeadlineReached()) {
    EnterError(run, "time budget exhausted before the call was announced");
    return false;
  }

  if (first) {
    deps_.sink->Start(session);
  }

  const std::string call_id = session.call_id();
  auto              sink    = deps_.sink;
  run.driver                = std::make_unique<speech::SessionDriver>(
      deps_.speech, speech::BuildDriverOptions(options_.speech, options_.sample_rate_hz, session.recognition_session_id()),
      [sink, call_id](const speech::RecognitionEvent& event) { sink->Recognition(call_id, event); });

  try {
    session.set_recognition_session_id(run.driver->Start());
  } catch (const std::exception& e) {
    EnterError(run, std::string("recognition session start failed: ") + e.what());
    return false;
  }

  Transition(run, WorkUnitState::kStreaming);
  return true;
}

/*
  STREAMING: one reader per source, the keep-alive timer, the synchronizer
  and the recognition session all run until the sources close, the deadline
  stops them at a fragment boundary, or a task fails.
*/
void ContinuityController::Stream(Run& run) {
  auto&           session  = run.session;
  const auto      sequence = session.work_unit_sequence();
  auto&           context  = run.context;

  audio::ChannelBuffer                                   caller_buffer(audio::Channel::kCaller, options_.channel_buffer_capacity);
  audio::ChannelBuffer                                   agent_buffer(audio::Channel::kAgent, options_.channel_buffer_capacity);
  std::array<audio::ChannelBuffer*, audio::kChannelCount> buffers{&caller_buffer, &agent_buffer};
  auto pipe = std::make_shared<audio::AudioPipe>(options_.audio_pipe_capacity, options_.push_timeout);

  std::shared_ptr<audio::LocalRecording> recording;
  if (RecordingEnabled(session)) {
    try {
      recording               = std::make_shared<audio::LocalRecording>(deps_.recording->TempPath(session.call_id(), sequence));
      run.recording_started   = true;
    } catch (const std::exception& e) {
      CALLSCRIBE_LOG_ERROR("Local recording unavailable, streaming without it",
                           {StringField("call_id", session.call_id()), StringField("error", e.what())});
    }
  }
  audio::AudioFanOut fanout(recording, pipe);

  // both parties on separate tracks of one stream
  const bool shared_source = session.caller_source_id() == session.agent_source_id();

  auto make_demuxer = [&](audio::Channel channel, const std::string& resume_after) {
    auto demuxer_options         = options_.demuxer;
    demuxer_options.channel      = channel;
    demuxer_options.resume_after = resume_after;
    auto* buffer                 = buffers[audio::Index(channel)];
    auto  wait                   = options_.push_timeout;
    return std::make_unique<media::Demuxer>(std::move(demuxer_options),
                                            [buffer, wait](audio::AudioChunk&& chunk) { buffer->Push(std::move(chunk), wait); });
  };
  auto caller_demuxer = make_demuxer(audio::Channel::kCaller, session.last_caller_fragment());
  auto agent_demuxer =
      make_demuxer(audio::Channel::kAgent, shared_source ? session.last_caller_fragment() : session.last_agent_fragment());
  caller_demuxer->SetSibling(agent_demuxer.get());
  agent_demuxer->SetSibling(caller_demuxer.get());

  std::unique_ptr<media::ByteStream> caller_stream;
  std::unique_ptr<media::ByteStream> agent_stream;
  try {
    caller_stream = deps_.media->Open(session.caller_source_id(), session.last_caller_fragment());
    if (!shared_source) {
      agent_stream = deps_.media->Open(session.agent_source_id(), session.last_agent_fragment());
    }
  } catch (const std::exception& e) {
    // end the recognition session cleanly before failing the unit
    fanout.Close();
    run.driver->Run(*pipe);
    EnterError(run, std::string("opening media source failed: ") + e.what());
    return;
  }

  media::DemuxResult caller_result;
  media::DemuxResult agent_result;

  auto demux = [&context](media::Demuxer& demuxer, media::ByteStream& stream, media::DemuxResult& result,
                          std::vector<audio::ChannelBuffer*> owned) {
    try {
      result = demuxer.Run(stream, context.StopFlag());
    } catch (const std::exception& e) {
      context.Fail(std::string(audio::ToString(demuxer.Channel())) + " media source failed: " + e.what());
    }
    for (auto* buffer : owned) buffer->Close();
  };

  std::vector<audio::ChannelBuffer*> caller_owned{&caller_buffer};
  if (shared_source) caller_owned.push_back(&agent_buffer);

  std::thread caller_thread(demux, std::ref(*caller_demuxer), std::ref(*caller_stream), std::ref(caller_result), caller_owned);
  std::thread agent_thread;
  if (!shared_source) {
    agent_thread = std::thread(demux, std::ref(*agent_demuxer), std::ref(*agent_stream), std::ref(agent_result),
                               std::vector<audio::ChannelBuffer*>{&agent_buffer});
  }

  audio::KeepAliveInjector keep_alive(buffers, options_.keep_alive_interval);
  std::thread              keep_alive_thread([&] { keep_alive.Run(context.AbortFlag()); });

  audio::Synchronizer synchronizer({options_.sample_rate_hz, options_.interleave_period_ms, options_.max_gap_ms});
  std::thread         sync_thread([&] {
    try {
      synchronizer.Run(
          caller_buffer, agent_buffer, [&fanout](audio::InterleavedFrame&& frame) { fanout.Deliver(std::move(frame)); },
          context.AbortFlag());
    } catch (const std::exception& e) {
      context.Fail(std::string("synchronizer failed: ") + e.what());
    }
    fanout.Close();
    if (context.Failed()) {
      caller_stream->Close();
      if (agent_stream) agent_stream->Close();
    }
  });

  try {
    run.driver->Run(*pipe);
  } catch (const std::exception& e) {
    context.Fail(std::string("recognition session failed: ") + e.what());
  }

  sync_thread.join();
  keep_alive_thread.join();
  caller_thread.join();
  if (agent_thread.joinable()) agent_thread.join();
  context.Disarm();

  session.set_last_caller_fragment(caller_demuxer->LastFragment());
  session.set_last_agent_fragment(shared_source ? caller_demuxer->LastFragment() : agent_demuxer->LastFragment());

  LogTimestampDelta(audio::Channel::kCaller, caller_demuxer->Timestamps());
  if (!shared_source) LogTimestampDelta(audio::Channel::kAgent, agent_demuxer->Timestamps());

  CALLSCRIBE_LOG_INFO("Streaming finished",
                      {StringField("call_id", session.call_id()), IntField("sequence", sequence),
                       IntField("frames", static_cast<int64_t>(synchronizer.FramesEmitted())),
                       IntField("packets", static_cast<int64_t>(run.driver->PacketsSent())),
                       IntField("caller_dropped", static_cast<int64_t>(caller_buffer.Dropped())),
                       IntField("agent_dropped", static_cast<int64_t>(agent_buffer.Dropped())),
                       IntField("pipe_dropped", static_cast<int64_t>(pipe->Dropped())),
                       StringField("last_caller_fragment", session.last_caller_fragment()),
                       StringField("last_agent_fragment", session.last_agent_fragment())});

  const bool stopped = caller_result.end == media::DemuxEnd::kStopped || agent_result.end == media::DemuxEnd::kStopped;
  if (context.Failed()) {
    EnterError(run, context.FailureReason());
  } else if (context.DeadlineReached() && stopped) {
    Transition(run, WorkUnitState::kTimeBudgetReached);
    run.outcome.continuation = true;
  } else {
    Transition(run, WorkUnitState::kSourceClosed);
  }
}

/*
  FINALIZING: upload this unit's audio, then either hand off to a successor
  or close the call.
*/
void ContinuityController::Finalize(Run& run) {
  if (!run.errored) run.outcome.exit_state = run.state;
  Transition(run, WorkUnitState::kFinalizing);

  auto&      session  = run.session;
  const auto sequence = session.work_unit_sequence();

  if (run.recording_started) {
    deps_.recording->UploadPart(session.call_id(), sequence);
  }
  if (run.errored) return;

  if (run.outcome.continuation) {
    WorkUnitDescriptor next;
    next.set_action(callscribe::v1::WORK_UNIT_ACTION_CONTINUE);
    *next.mutable_session() = session;
    next.mutable_session()->set_work_unit_sequence(sequence + 1);

    try {
      deps_.launcher->InvokeAsync(next);
    } catch (const std::exception& e) {
      run.outcome.error = std::string("successor launch failed: ") + e.what();
      CALLSCRIBE_LOG_ERROR("Successor launch failed", {StringField("call_id", session.call_id()), IntField("sequence", sequence),
                                                       StringField("error", e.what())});
      deps_.sink->Error(session, run.outcome.error);
      return;
    }

    run.outcome.successor_launched = true;
    run.outcome.checkpoint         = next.session();
    CALLSCRIBE_LOG_INFO("Successor work unit launched",
                        {StringField("call_id", session.call_id()), IntField("sequence", sequence + 1),
                         StringField("recognition_session_id", session.recognition_session_id())});
    deps_.sink->Continue(session);
    return;
  }

  deps_.sink->End(session);
  if (RecordingEnabled(session)) {
    if (auto url = deps_.recording->MergeCall(session.call_id(), sequence)) {
      deps_.sink->RecordingUrl(session.call_id(), *url);
    }
  }
}

void ContinuityController::EnterError(Run& run, const std::string& message) {
  CALLSCRIBE_LOG_ERROR("Work unit failed", {StringField("call_id", run.session.call_id()),
                                            IntField("sequence", run.session.work_unit_sequence()),
                                            StringField("state", ToString(run.state)), StringField("error", message)});
  Transition(run, WorkUnitState::kError);
  run.errored              = true;
  run.outcome.error        = message;
  run.outcome.exit_state   = WorkUnitState::kError;
  run.outcome.continuation = false;
  deps_.sink->Error(run.session, message);
}

void ContinuityController::Transition(Run& run, WorkUnitState to) {
  if (!CanTransition(run.state, to)) {
    throw util::InvalidState(std::string("illegal work unit transition ") + std::string(ToString(run.state)) + " -> " +
                             std::string(ToString(to)));
  }
  CALLSCRIBE_LOG_DEBUG("Work unit state", {StringField("call_id", run.session.call_id()), StringField("from", ToString(run.state)),
                                           StringField("to", ToString(to))});
  run.state = to;
}

} // namespace callscribe::continuity
