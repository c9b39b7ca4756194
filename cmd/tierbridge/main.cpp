#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/tiering/tiering_coordinator.hpp"
#include "internal/transcode/transcode_coordinator.hpp"
#include "internal/transfer/transfer_engine.hpp"

using tierbridge::factory::Application;
using tierbridge::observability::ErrorField;
using tierbridge::observability::StringField;
using tierbridge::runtime::Server;

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void ShutdownObservability() {
  tierbridge::observability::ShutdownLogging();
  tierbridge::observability::ShutdownMetrics();
  tierbridge::observability::ShutdownTracing();
}

/*
  Engine lifecycle.

  Start order: the transfer engine first, because it re-queues interrupted
  transfers that warm requests and transcodes may wait on; then tiering;
  transcode last since it drives both.

  Stop is the exact reverse and is safe on engines that never started.
  The journal is released after the transfer engine so the final terminal
  events still reach the operation ledger.
*/
void StartEngines(Application& app) {
  auto& ctx = app.context;
  ctx.transfers->Start();
  TIERBRIDGE_LOG_INFO("transfer engine started");
  ctx.tiering->Start();
  TIERBRIDGE_LOG_INFO("tiering coordinator started");
  ctx.transcode->Start();
  TIERBRIDGE_LOG_INFO("transcode coordinator started");
}

void StopEngines(Application& app) {
  auto& ctx = app.context;
  if (ctx.transcode) ctx.transcode->Stop();
  if (ctx.tiering) ctx.tiering->Stop();
  if (ctx.transfers) ctx.transfers->Stop();
  ctx.journal.reset();
  TIERBRIDGE_LOG_INFO("engines stopped");
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: tierbridge <config.yaml> OR tierbridge --config <config.yaml>" << std::endl;
    return 1;
  }

  tierbridge::runtime::config::RuntimeConfig config;
  try {
    config = tierbridge::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    std::cerr << "tierbridge: " << config_path << ": " << e.what() << std::endl;
    return 1;
  }

  tierbridge::observability::InitializeLogging(config);
  if (!tierbridge::observability::InitializeTracing(config)) {
    TIERBRIDGE_LOG_INFO("tracing off");
  }
  if (!tierbridge::observability::InitializeMetrics(config)) {
    TIERBRIDGE_LOG_INFO("metrics off");
  }

  Application app;
  int         exit_code = 0;
  try {
    app = tierbridge::factory::Build(config);
    StartEngines(app);

    // Handlers go in before the listener opens.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    Server server(config.server().bind_address(), std::move(app.grpc_services));
    server.Start();
    TIERBRIDGE_LOG_INFO("tierbridge started", {StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TIERBRIDGE_LOG_INFO("shutting down tierbridge");
    // Drain RPCs first; a paste in flight still needs the engines.
    server.Stop();
  } catch (const std::exception& e) {
    TIERBRIDGE_LOG_ERROR("fatal error", {ErrorField(e)});
    exit_code = 2;
  }

  try {
    StopEngines(app);
  } catch (const std::exception& e) {
    TIERBRIDGE_LOG_ERROR("engine shutdown failed", {ErrorField(e)});
    exit_code = 2;
  }

  ShutdownObservability();
  return exit_code;
}
