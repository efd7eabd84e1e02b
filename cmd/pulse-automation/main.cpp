#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/automation_service.hpp"

using pulse::observability::StringField;
using pulse::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

// Runs left RUNNING by a crash or a hung chain call are failed here; a sweep
// that throws is logged and retried on the next interval.
void SweepStaleExecutions(pulse::service::AutomationService& service) {
  try {
    service.ClearStaleExecutions(pulse::automation::v1::ClearStaleExecutionsRequest{});
  } catch (const std::exception& e) {
    PULSE_LOG_ERROR("Stale execution sweep failed", {StringField("error", e.what())});
  }
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: pulse-automation [--config] <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = pulse::config::ConfigLoader::LoadFromYaml(config_path);
    pulse::observability::InitializeLogging(config);

    auto app = pulse::factory::Build(config);

    // Nothing can be running before the server starts; anything stored as
    // RUNNING and past the threshold is left over from a previous process.
    SweepStaleExecutions(*app.automation_service);

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    PULSE_LOG_INFO("Pulse automation started", {StringField("bind_address", config.server().bind_address()),
                                                 StringField("database", config.database().has_sqlite() ? "sqlite" : "memory")});

    const auto sweep_interval = std::chrono::seconds(config.execution().stale_sweep_interval_seconds());
    auto       next_sweep     = std::chrono::steady_clock::now() + sweep_interval;
    while (g_running) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
      if (std::chrono::steady_clock::now() >= next_sweep) {
        SweepStaleExecutions(*app.automation_service);
        next_sweep = std::chrono::steady_clock::now() + sweep_interval;
      }
    }

    PULSE_LOG_INFO("Shutting down pulse automation");

    server.Stop();
    pulse::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    PULSE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    pulse::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
