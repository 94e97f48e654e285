#pragma once

#include <memory>

#include "internal/config/settings.hpp"
#include "internal/storage/object_store.hpp"

namespace logship::cleanup {
class DeletionManager;
class DiskGauge;
} // namespace logship::cleanup

namespace logship::monitor {
class FileMonitor;
}

namespace logship::observability {
class MetricsPublisher;
}

namespace logship::queue {
class UploadQueue;
}

namespace logship::registry {
class ProcessedRegistry;
}

namespace logship::scheduler {
class Scheduler;
}

namespace logship::upload {
class UploadEngine;
}

namespace logship::model {
class RuleMatcher;
}

namespace logship::factory {

/*
  Collaborators the composition root would otherwise build itself.
  Empty members fall back to the production implementation.
*/
struct Overrides {
  storage::ObjectStorePtr                          store;
  std::shared_ptr<cleanup::DiskGauge>              disk_gauge;
  std::shared_ptr<observability::MetricsPublisher> metrics;
};

/*
  Application

  Owns every long-lived component of one daemon generation. A config
  reload throws the whole graph away and builds a new one.
*/
struct Application {
  config::Settings settings;

  std::shared_ptr<observability::MetricsPublisher> metrics;
  std::shared_ptr<const model::RuleMatcher>        matcher;
  std::shared_ptr<queue::UploadQueue>              queue;
  std::shared_ptr<registry::ProcessedRegistry>     registry;
  storage::ObjectStorePtr                          store;
  std::shared_ptr<cleanup::DeletionManager>        deletion;
  std::shared_ptr<monitor::FileMonitor>            monitor;
  std::shared_ptr<upload::UploadEngine>            engine;
  std::shared_ptr<scheduler::Scheduler>            scheduler;
};

/*
  Build

  Composition root: the only place that knows concrete types. Nothing is
  loaded or started here.
*/
Application Build(const config::Settings& settings, Overrides overrides = {});

} // namespace logship::factory
