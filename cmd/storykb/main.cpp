#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using storykb::factory::Build;
using storykb::factory::StartReconciler;
using storykb::observability::IntField;
using storykb::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

void ShutdownObservability() {
  storykb::observability::ShutdownLogging();
  storykb::observability::ShutdownMetrics();
  storykb::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool        once = false;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc == 4 && std::string(argv[1]) == "--config" && std::string(argv[3]) == "--once") {
    config_path = argv[2];
    once        = true;
  } else {
    std::cerr << "Usage: storykb <config.yaml> OR storykb --config <config.yaml> [--once]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = storykb::config::ConfigLoader::LoadFromYaml(config_path);

    storykb::observability::InitializeTracing(config);
    storykb::observability::InitializeMetrics(config);
    storykb::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    if (once) {
      const auto stats = app.sweeper->SweepOnce();
      std::cout << "examined=" << stats.examined << " converged=" << stats.converged << " superseded=" << stats.superseded
                << " failed=" << stats.failed << " unrepairable=" << stats.unrepairable << " skipped=" << stats.skipped << std::endl;
      ShutdownObservability();
      return stats.failed == 0 && stats.unrepairable == 0 ? 0 : 3;
    }

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    StartReconciler(app, config);
    STORYKB_LOG_INFO("storykb started", {StringField("reconciler", config.reconciler().enabled() ? "enabled" : "disabled"),
                                         IntField("interval_ms", static_cast<std::int64_t>(config.reconciler().interval_ms()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    STORYKB_LOG_INFO("Shutting down storykb");

    app.sweeper->Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    STORYKB_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
