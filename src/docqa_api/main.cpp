#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "docqa_api/routes.hpp"
#include "docqa_api/server.hpp"
#include "docqa_core/config.hpp"
#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/service_provider.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main(int argc, char *argv[]) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "docqarc.json";
    docqa_core::Config config = docqa_core::Config::from_file_or_defaults(config_path);

    std::cout << "Starting docqa API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Store backend: " << config.store_backend << std::endl;
    std::cout << "Knowledge directory: " << config.knowledge_dir << std::endl;
    std::cout << "Chunking: size " << config.chunk_size << ", overlap " << config.chunk_overlap
              << std::endl;

    auto services = docqa_core::ServiceProvider::from_config(config);

    auto [host, port] = config.host_and_port();
    docqa_api::Server server(host, port);
    docqa_api::Routes routes(services, config.default_top_k);
    routes.register_routes(server);

    server.get_app().signal_clear();
    server.start(static_cast<unsigned int>(config.db_pool_size));
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Shutting down database connections..." << std::endl;
    docqa_core::DatabaseManager::get_instance().shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
