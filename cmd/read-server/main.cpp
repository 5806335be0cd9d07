#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using discovery::factory::BuildReadNode;
using discovery::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: read-server <config.yaml> OR read-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = discovery::config::ConfigLoader::LoadFromYaml(config_path);

    discovery::observability::InitializeLogging(config, "read-server");

    // Starts mirroring the upstream registry right away; health turns UP
    // once the initial batch has been received.
    auto node   = BuildReadNode(config);
    auto client = node.interest_client;

    Server server(config.server().bind_address(), std::move(node.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    DISCOVERY_LOG_INFO("Read server started",
                       {discovery::observability::StringField("upstream", config.interest_client().upstream_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    DISCOVERY_LOG_INFO("Shutting down read server");

    server.Stop();
    client->Shutdown();
    discovery::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    DISCOVERY_LOG_ERROR("Fatal error", {discovery::observability::StringField("error", e.what())});
    discovery::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
