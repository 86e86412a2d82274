#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/continuity/continuity_controller.hpp"
#include "internal/continuity/work_unit_scheduler.hpp"
#include "internal/continuity/work_unit_worker.hpp"
#include "internal/events/event_log.hpp"
#include "internal/registry/source_registry.hpp"

namespace callscribe::factory {

/*
  Owns every long-lived component of the service for the lifetime of the
  process.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<continuity::WorkUnitScheduler>           scheduler;
  std::shared_ptr<continuity::ContinuityController>        controller;
  std::vector<std::shared_ptr<continuity::WorkUnitWorker>> workers;

  std::shared_ptr<events::EventLog>         event_log;
  std::shared_ptr<registry::SourceRegistry> registry;

  // Stops accepting work and waits for running work units.
  void Stop();
};

/*
  Composition root: the only place that knows the concrete backends.
  Workers are started before returning.
*/
Application Build(const callscribe::runtime::config::RuntimeConfig& config);

} // namespace callscribe::factory
