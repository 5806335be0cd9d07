#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using discovery::factory::BuildRegistryNode;
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
    std::cerr << "Usage: registry-server <config.yaml> OR registry-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = discovery::config::ConfigLoader::LoadFromYaml(config_path);

    discovery::observability::InitializeLogging(config, "registry-server");

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto node     = BuildRegistryNode(config);
    auto registry = node.registry;

    // ------------------------------------------------------------
    // Bootstrap from peers, then start serving
    // ------------------------------------------------------------
    const auto synced = registry->SyncUp();

    Server server(config.server().bind_address(), std::move(node.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    registry->OpenForTraffic(node.self_info, static_cast<int64_t>(synced));

    DISCOVERY_LOG_INFO("Registry server started", {discovery::observability::StringField("node_id", config.server().node_id()),
                                                   discovery::observability::IntField("synced", static_cast<int64_t>(synced))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    DISCOVERY_LOG_INFO("Shutting down registry server");

    server.Stop();
    registry->Shutdown();
    discovery::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    DISCOVERY_LOG_ERROR("Fatal error", {discovery::observability::StringField("error", e.what())});
    discovery::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
