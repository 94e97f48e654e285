#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_error.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/config/settings.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/daemon.hpp"

using logship::observability::StringField;
using logship::runtime::Daemon;

static volatile std::sig_atomic_t g_running = 1;
static volatile std::sig_atomic_t g_reload  = 0;

void HandleSignal(int) {
  g_running = 0;
}

void HandleReload(int) {
  g_reload = 1;
}

namespace {

void InitializeObservability(const logship::runtime::config::RuntimeConfig& config) {
  logship::observability::InitializeTracing(config);
  logship::observability::InitializeMetrics(config);
  logship::observability::InitializeLogging(config);
}

void ShutdownObservability() {
  logship::observability::ShutdownLogging();
  logship::observability::ShutdownMetrics();
  logship::observability::ShutdownTracing();
}

int TestConfig(const std::string& config_path) {
  try {
    auto config   = logship::config::ConfigLoader::LoadFromYaml(config_path);
    auto settings = logship::config::BuildSettings(config);
    logship::observability::InitializeLogging(config);
    logship::runtime::LogSettingsSummary(settings);
    std::cout << "Configuration " << config_path << " is valid" << std::endl;
    return 0;
  } catch (const logship::config::ConfigError& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
}

// Controlled restart with a freshly validated config; keeps the old one on error.
void Reload(const std::string& config_path, std::unique_ptr<Daemon>& daemon) {
  logship::runtime::config::RuntimeConfig config;
  logship::config::Settings               settings;
  try {
    config   = logship::config::ConfigLoader::LoadFromYaml(config_path);
    settings = logship::config::BuildSettings(config);
  } catch (const logship::config::ConfigError& e) {
    LOGSHIP_LOG_ERROR("Reload rejected, keeping running configuration", {StringField("error", e.what())});
    return;
  }

  LOGSHIP_LOG_INFO("Reloading configuration", {StringField("path", config_path)});
  daemon->Stop();
  daemon.reset();

  ShutdownObservability();
  InitializeObservability(config);

  daemon = std::make_unique<Daemon>(settings);
  daemon->Start();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool        test_only = false;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc == 3 && std::string(argv[1]) == "--test-config") {
    config_path = argv[2];
    test_only   = true;
  } else {
    std::cerr << "Usage: logship <config.yaml> OR logship --config <config.yaml> OR logship --test-config <config.yaml>" << std::endl;
    return 1;
  }

  if (test_only) {
    return TestConfig(config_path);
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config   = logship::config::ConfigLoader::LoadFromYaml(config_path);
    auto settings = logship::config::BuildSettings(config);

    InitializeObservability(config);

    // Register signal handlers before anything starts to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGHUP, HandleReload);

    auto daemon = std::make_unique<Daemon>(settings);
    daemon->Start();

    while (g_running) {
      if (g_reload) {
        g_reload = 0;
        Reload(config_path, daemon);
      }
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    daemon->Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    LOGSHIP_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
